#include "field_encoder.hpp"

#include <iostream>
#include <limits>

namespace {

constexpr size_t kMaxFieldNameLength = 64;

// syslog(3) priorities.
constexpr int kPriorityErr = 3;
constexpr int kPriorityWarning = 4;
constexpr int kPriorityInfo = 6;
constexpr int kPriorityDebug = 7;

}  // namespace

const char* SeverityName(Severity severity) {
  switch (severity) {
    case Severity::kError:
      return "ERROR";
    case Severity::kWarn:
      return "WARN";
    case Severity::kInfo:
      return "INFO";
    case Severity::kDebug:
      return "DEBUG";
    case Severity::kTrace:
      return "TRACE";
  }
  return "UNKNOWN";
}

int SeverityToPriority(Severity severity) {
  switch (severity) {
    case Severity::kError:
      return kPriorityErr;
    case Severity::kWarn:
      return kPriorityWarning;
    case Severity::kInfo:
      return kPriorityInfo;
    case Severity::kDebug:
    case Severity::kTrace:
      return kPriorityDebug;
  }
  // Out-of-range enum value cast in by a caller.
  return kPriorityDebug;
}

Result SeverityFromPriority(int priority, Severity* severity_out) {
  if (severity_out == nullptr) {
    return Result::InvalidArgument("SeverityFromPriority: severity_out cannot be null.");
  }
  if (priority < 0 || priority > kPriorityDebug) {
    return Result::InvalidArgument("Priority out of range 0..7: " + std::to_string(priority));
  }
  if (priority <= kPriorityErr) {
    *severity_out = Severity::kError;
  } else if (priority == kPriorityWarning) {
    *severity_out = Severity::kWarn;
  } else if (priority <= kPriorityInfo) {
    *severity_out = Severity::kInfo;
  } else {
    *severity_out = Severity::kDebug;
  }
  return Result::OK();
}

bool IsValidFieldName(const std::string& name) {
  if (name.empty() || name.size() > kMaxFieldNameLength) {
    return false;
  }
  if (name[0] == '_' || (name[0] >= '0' && name[0] <= '9')) {
    return false;
  }
  for (char c : name) {
    bool ok = (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

Result EncodeField(const std::string& name, const std::string& value, std::string* out) {
  if (out == nullptr) {
    return Result::InvalidArgument("EncodeField: out cannot be null.");
  }
  if (!IsValidFieldName(name)) {
    return Result::InvalidArgument("Invalid journal field name: '" + name + "'");
  }
  std::string encoded;
  encoded.reserve(name.size() + 1 + value.size());
  encoded.append(name);
  encoded.push_back('=');
  encoded.append(value);
  *out = std::move(encoded);
  return Result::OK();
}

Result EncodeFields(const FieldList& fields, std::vector<std::string>* out) {
  if (out == nullptr) {
    return Result::InvalidArgument("EncodeFields: out cannot be null.");
  }
  std::vector<std::string> encoded;
  encoded.reserve(fields.size());
  for (const auto& field : fields) {
    std::string one;
    Result res = EncodeField(field.first, field.second, &one);
    if (!res.ok()) {
      return res;
    }
    encoded.push_back(std::move(one));
  }
  *out = std::move(encoded);
  return Result::OK();
}

std::vector<struct iovec> ToIovecs(const std::vector<std::string>& encoded) {
  std::vector<struct iovec> iovecs;
  iovecs.reserve(encoded.size());
  for (const std::string& field : encoded) {
    struct iovec iov;
    iov.iov_base = const_cast<char*>(field.data());
    iov.iov_len = field.size();
    iovecs.push_back(iov);
  }
  return iovecs;
}

Result Send(JournalStore& store, const std::vector<std::string>& fields) {
  if (fields.empty()) {
    return Result::InvalidArgument("Send: no fields to send.");
  }
  if (fields.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return Result::InvalidArgument("Send: too many fields.");
  }
  std::vector<struct iovec> iovecs = ToIovecs(fields);
  int r = store.Send(iovecs.data(), static_cast<int>(iovecs.size()));
  if (r < 0) {
    std::cout << "[Send] sendv failed: " << r << std::endl;
    return Result::IOError("Failed to send journal entry", r);
  }
  return Result::OK();
}

Result Print(JournalStore& store, int priority, const std::string& message) {
  Severity severity = Severity::kInfo;
  Result range_res = SeverityFromPriority(priority, &severity);
  if (!range_res.ok()) {
    std::cout << "[Print] Rejected: " << range_res.message() << std::endl;
    return range_res;
  }
  std::vector<std::string> fields;
  Result res = EncodeFields({{"PRIORITY", std::to_string(priority)}, {"MESSAGE", message}}, &fields);
  if (!res.ok()) {
    return res;
  }
  return Send(store, fields);
}

Result Log(JournalStore& store, Severity severity, const SourceLocation& location,
           const std::string& message) {
  std::vector<std::string> fields;
  Result res = EncodeFields({{"PRIORITY", std::to_string(SeverityToPriority(severity))},
                             {"MESSAGE", message},
                             {"CODE_LINE", std::to_string(location.line)},
                             {"CODE_FILE", location.file},
                             {"CODE_FUNCTION", location.function}},
                            &fields);
  if (!res.ok()) {
    return res;
  }
  return Send(store, fields);
}
