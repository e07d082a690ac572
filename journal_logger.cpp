#include "journal_logger.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include "systemd_journal_store.hpp"

namespace {

std::mutex g_logger_mutex;
std::unique_ptr<JournalLogger> g_logger_owner;  // Guarded by g_logger_mutex
std::atomic<JournalLogger*> g_logger{nullptr};

int SeverityRank(Severity severity) {
  switch (severity) {
    case Severity::kError:
      return 0;
    case Severity::kWarn:
      return 1;
    case Severity::kInfo:
      return 2;
    case Severity::kDebug:
      return 3;
    case Severity::kTrace:
      return 4;
  }
  return 4;
}

}  // namespace

JournalLogger::JournalLogger(std::unique_ptr<JournalStore> store, Severity max_severity)
    : store_(std::move(store)), max_severity_(max_severity) {}

Result JournalLogger::Init(Severity max_severity) {
  return Init(make_unique_nothrow<SystemdJournalStore>(), max_severity);
}

Result JournalLogger::Init(std::unique_ptr<JournalStore> store, Severity max_severity) {
  if (!store) {
    return Result::InvalidArgument("JournalLogger::Init: store cannot be null.");
  }
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (g_logger_owner) {
    std::cout << "[JournalLogger::Init] Logger already installed." << std::endl;
    return Result::NotSupported("JournalLogger already initialized.");
  }
  std::unique_ptr<JournalLogger> logger =
      make_unique_nothrow<JournalLogger>(std::move(store), max_severity);
  if (!logger) {
    std::cout << "[JournalLogger::Init] Failed to allocate JournalLogger." << std::endl;
    return Result::Error("Failed to allocate JournalLogger.");
  }
  g_logger_owner = std::move(logger);
  g_logger.store(g_logger_owner.get(), std::memory_order_release);
  std::cout << "[JournalLogger::Init] Installed, max severity " << SeverityName(max_severity) << std::endl;
  return Result::OK();
}

JournalLogger* JournalLogger::Get() {
  return g_logger.load(std::memory_order_acquire);
}

bool JournalLogger::Enabled(Severity severity) const {
  return SeverityRank(severity) <= SeverityRank(max_severity_);
}

Result JournalLogger::Log(Severity severity, const SourceLocation& location,
                          const std::string& message) {
  if (!Enabled(severity)) {
    return Result::OK();
  }
  return ::Log(*store_, severity, location, message);
}

#ifdef JOURNAL_READER_ENABLE_TESTING_HOOKS
void JournalLogger::TEST_ONLY_Reset() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger.store(nullptr, std::memory_order_release);
  g_logger_owner.reset();
}
#endif
