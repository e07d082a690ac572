#ifndef FAKE_JOURNAL_STORE_HPP
#define FAKE_JOURNAL_STORE_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "journal_store.hpp"

struct FakeEntry {
  uint64_t seqnum = 0;
  uint64_t realtime_usec = 0;
  std::vector<std::string> fields;  // Raw "NAME=value" buffers, enumerated in order
  int enumerate_error = 0;          // Returned by EnumerateData after the fields, if non-zero
};

// One scripted answer of Wait().
struct FakeWaitStep {
  int status = WaitStatus::kNop;      // WaitStatus value or negative errno
  std::vector<FakeEntry> append;      // Appended before Wait returns
};

// Everything the fake does and everything it saw. Shared between the test
// and the store so it stays readable after a Journal takes ownership.
struct FakeJournalState {
  std::vector<FakeEntry> entries;  // Ordered by seqnum
  uint64_t next_seqnum = 1;
  std::deque<FakeWaitStep> wait_script;

  // Failure injection. Zero means "behave".
  int open_error = 0;
  int seek_head_error = 0;
  int next_error = 0;         // Returned by every Next() while set
  int get_cursor_error = 0;
  int seek_cursor_error = 0;
  int test_cursor_error = 0;
  int realtime_error = 0;
  int send_error = 0;

  // Observations.
  int open_calls = 0;
  int open_flags = -1;
  int close_calls = 0;
  int seek_tail_calls = 0;
  int restart_data_calls = 0;
  int wait_calls = 0;
  std::vector<uint64_t> wait_timeouts;
  int cursors_outstanding = 0;  // GetCursor allocations not yet released
  std::vector<std::vector<std::string>> sent;
};

// Appends an entry with the next seqnum and returns a copy of it.
FakeEntry AddEntry(FakeJournalState& state, std::vector<std::string> fields,
                   uint64_t realtime_usec = 0);

// Builds an entry with the next seqnum without adding it, for wait scripts.
FakeEntry MakeEntry(FakeJournalState& state, std::vector<std::string> fields,
                    uint64_t realtime_usec = 0);

// Cursor text the fake hands out for an entry.
std::string FakeCursorFor(const FakeEntry& entry);

// Seqnum encoded in a fake cursor, nullopt if it is not one.
std::optional<uint64_t> FakeCursorSeqnum(const std::string& cursor);

// In-memory JournalStore reproducing sd-journal positioning: seeks place the
// read position before the target, Next() lands on the first entry at or
// after it, and a cursor whose entry is gone lands on the next survivor.
//
// Wait() pops wait_script; with an empty script it sleeps for the timeout and
// reports kNop (timeouts above kMaxRealSleepUsec return at once so a test
// cannot hang).
struct FakeJournalStore : public JournalStore {
 public:
  static constexpr uint64_t kMaxRealSleepUsec = 5000000;

  explicit FakeJournalStore(std::shared_ptr<FakeJournalState> state);
  ~FakeJournalStore() override = default;

  int Open(int flags) override;
  void Close() override;

  int SeekHead() override;
  int SeekTail() override;
  int Next() override;
  int Previous() override;

  void RestartData() override;
  int EnumerateData(const void** data, size_t* length) override;

  int GetCursor(char** cursor) override;
  void ReleaseCursor(char* cursor) override;
  int SeekCursor(const char* cursor) override;
  int TestCursor(const char* cursor) override;

  int GetRealtimeUsec(uint64_t* usec) override;
  int Wait(uint64_t timeout_usec) override;

  int Send(const struct iovec* iov, int count) override;

 private:
  const FakeEntry* Current() const;

  std::shared_ptr<FakeJournalState> state_;
  bool open_;
  uint64_t next_seq_;                 // Next() yields the first entry with seqnum >= this
  std::optional<uint64_t> current_;   // Seqnum of the entry we sit on
  size_t field_index_;
  std::string field_buffer_;          // Reused for every enumerated field, like the real store
};

#endif // FAKE_JOURNAL_STORE_HPP
