#ifndef JOURNAL_HPP
#define JOURNAL_HPP

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>

#include "cursor.hpp"
#include "journal_record.hpp"
#include "journal_store.hpp"
#include "result.hpp"

// The set of journal files to read.
enum class JournalFiles {
  kSystem,       // The system-wide journal
  kCurrentUser,  // The current user's journal
  kAll,          // Both
};

enum class WaitResult {
  kDataAvailable,
  kTimeout,
  kInvalidated,  // Journal file set changed (rotation, new files)
};

const char* WaitResultName(WaitResult result);

// sd_journal_wait treats (uint64_t)-1 as "no timeout".
constexpr uint64_t kInfiniteWait = std::numeric_limits<uint64_t>::max();

// Builds the OpenFlag word for a scope selector and the two filters.
int MakeOpenFlags(JournalFiles files, bool runtime_only, bool local_only);

// A read handle on the journal. Owns exactly one store connection.
//
// Not thread-safe: every operation moves or reads one shared position, so
// callers must serialize access.
struct Journal {
 public:
  // Reads the local systemd journal.
  Journal();
  explicit Journal(std::unique_ptr<JournalStore> store);
  ~Journal();

  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;
  Journal(Journal&& other) noexcept;
  Journal& operator=(Journal&& other) noexcept;

  // Opens the store and seeks to its head.
  //
  // If the caller may not read the system journal, opening kSystem or kAll
  // still succeeds but yields no system entries. That is systemd's behavior
  // and is passed through as is.
  //
  // runtime_only: only entries from the current boot.
  // local_only: only entries originating from this host.
  Result Open(JournalFiles files, bool runtime_only, bool local_only);

  // Idempotent. Safe after a failed Open.
  void Close();

  bool IsOpen() const { return is_open_; }

  // Whole seconds, saturating. Applies to Wait().
  void SetIteratorTimeout(uint64_t seconds);
  void SetWaitTimeoutUsec(uint64_t timeout_usec) { wait_timeout_usec_ = timeout_usec; }
  uint64_t wait_timeout_usec() const { return wait_timeout_usec_; }

  // Moves one entry forward. *advanced is false at the end of the currently
  // available data, which is not an error.
  Result Next(bool* advanced);
  Result Previous(bool* moved);

  Result SeekHead();
  Result SeekTail();

  // Next() and decode in one step. *record_out is nullopt at end of data.
  Result NextRecord(std::optional<JournalRecord>* record_out);

  // Field map of the current entry.
  Result ReadRecord(JournalRecord* record_out);

  // Blocks for up to wait_timeout_usec().
  Result Wait(WaitResult* result_out);

  // Only meaningful after a successful Next().
  Result GetCursor(std::string* cursor_out);
  Result Seek(const std::string& cursor, SeekOutcome* outcome_out);

  Result GetRealtimeUsec(uint64_t* usec_out);

  JournalFiles files() const { return files_; }
  bool runtime_only() const { return runtime_only_; }
  bool local_only() const { return local_only_; }
  int open_flags() const { return open_flags_; }

 private:
  Result CheckOpen(const char* operation) const;

  std::unique_ptr<JournalStore> store_;
  bool is_open_;
  JournalFiles files_;
  bool runtime_only_;
  bool local_only_;
  int open_flags_;
  uint64_t wait_timeout_usec_;
};

#endif // JOURNAL_HPP
