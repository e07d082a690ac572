#ifndef JOURNAL_LOGGER_HPP
#define JOURNAL_LOGGER_HPP

#include <iostream>
#include <memory>
#include <string>

#include "field_encoder.hpp"
#include "journal_store.hpp"
#include "make_unique_nothrow.hpp"
#include "result.hpp"

// Process-wide logger that writes each log call into the journal as an
// entry with PRIORITY, MESSAGE and CODE_* fields.
//
// Installed once with Init(). A second Init() fails; it does not replace or
// retry anything.
class JournalLogger {
 public:
  // Installs a logger sending through libsystemd.
  static Result Init(Severity max_severity = Severity::kTrace);
  static Result Init(std::unique_ptr<JournalStore> store, Severity max_severity = Severity::kTrace);

  // Installed logger, or nullptr.
  static JournalLogger* Get();

  JournalLogger(const JournalLogger&) = delete;
  JournalLogger& operator=(const JournalLogger&) = delete;

  bool Enabled(Severity severity) const;
  Result Log(Severity severity, const SourceLocation& location, const std::string& message);

  Severity max_severity() const { return max_severity_; }

#ifdef JOURNAL_READER_ENABLE_TESTING_HOOKS
  static void TEST_ONLY_Reset();
#endif

 private:
  template<typename T, typename... Args>
  friend std::unique_ptr<T> make_unique_nothrow(Args&&... args);

  JournalLogger(std::unique_ptr<JournalStore> store, Severity max_severity);

  std::unique_ptr<JournalStore> store_;
  Severity max_severity_;
};

#define JOURNAL_READER_LOG(severity, message)                                     \
  do {                                                                            \
    JournalLogger* journal_reader_logger_ = JournalLogger::Get();                 \
    if (journal_reader_logger_ != nullptr && journal_reader_logger_->Enabled(severity)) { \
      Result journal_reader_log_res_ = journal_reader_logger_->Log(               \
          (severity), SourceLocation{__FILE__, __LINE__, __func__}, (message));   \
      if (!journal_reader_log_res_.ok()) {                                        \
        std::cerr << "[JOURNAL_READER_LOG] " << journal_reader_log_res_.ToString() \
                  << std::endl;                                                   \
      }                                                                           \
    }                                                                             \
  } while (0)

#endif // JOURNAL_LOGGER_HPP
