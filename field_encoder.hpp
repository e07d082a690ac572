#ifndef FIELD_ENCODER_HPP
#define FIELD_ENCODER_HPP

#include <string>
#include <utility>
#include <vector>
#include <sys/uio.h>  // For struct iovec

#include "journal_store.hpp"
#include "result.hpp"

// Log severities of the logging front end, in decreasing importance.
enum class Severity {
  kError,
  kWarn,
  kInfo,
  kDebug,
  kTrace,
};

const char* SeverityName(Severity severity);

// syslog priority sent as PRIORITY= for a severity.
int SeverityToPriority(Severity severity);

// Maps a syslog priority (0..7) back to a severity. Anything else is
// InvalidArgument and leaves *severity_out untouched.
Result SeverityFromPriority(int priority, Severity* severity_out);

struct SourceLocation {
  std::string file;
  int line = 0;
  std::string function;
};

using FieldList = std::vector<std::pair<std::string, std::string>>;

// Journal field names: 1..64 characters of A-Z, 0-9 and '_', not starting
// with a digit. A leading '_' is reserved for fields the journal adds itself.
bool IsValidFieldName(const std::string& name);

// "NAME=value".
Result EncodeField(const std::string& name, const std::string& value, std::string* out);

// Encodes every pair. On failure *out is left untouched.
Result EncodeFields(const FieldList& fields, std::vector<std::string>* out);

// iovec views over already encoded fields for one sendv call. The views
// point into `encoded` and die with it.
std::vector<struct iovec> ToIovecs(const std::vector<std::string>& encoded);

// Sends preformatted "NAME=value" strings as one entry.
Result Send(JournalStore& store, const std::vector<std::string>& fields);

// Sends MESSAGE= with PRIORITY=priority. priority must be a syslog level 0..7.
Result Print(JournalStore& store, int priority, const std::string& message);

// Sends MESSAGE=, PRIORITY=, CODE_LINE=, CODE_FILE= and CODE_FUNCTION=.
Result Log(JournalStore& store, Severity severity, const SourceLocation& location,
           const std::string& message);

#endif // FIELD_ENCODER_HPP
