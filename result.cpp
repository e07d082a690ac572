#include "result.hpp"

#include <cstring>  // For std::strerror
#include <string>   // For std::to_string


const char* ResultCodeName(ResultCode code) {
  switch (code) {
    case ResultCode::kOk:
      return "OK";
    case ResultCode::kOpenError:
      return "OpenError";
    case ResultCode::kReadError:
      return "ReadError";
    case ResultCode::kSeekError:
      return "SeekError";
    case ResultCode::kWaitError:
      return "WaitError";
    case ResultCode::kInvalidArgument:
      return "InvalidArgument";
    case ResultCode::kCorruption:
      return "Corruption";
    case ResultCode::kNotSupported:
      return "NotSupported";
    case ResultCode::kIOError:
      return "IOError";
    case ResultCode::kError:
      return "Error";
  }
  return "UnknownErrorCode";
}

std::string Result::ToString() const {
  if (ok()) {
    return "OK";
  }

  std::string text = ResultCodeName(code_);
  if (!message_.empty()) {
    text += ": " + message_;
  }
  if (native_status_ != 0) {
    // Store primitives report -errno.
    int err = native_status_ < 0 ? -native_status_ : native_status_;
    text += " (errno " + std::to_string(err) + ": " + std::strerror(err) + ")";
  }
  return text;
}
