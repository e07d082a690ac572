#ifndef JOURNAL_STORE_HPP
#define JOURNAL_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <sys/uio.h>  // For struct iovec

// Open flag bits. Neither scope bit set means "all stores".
enum OpenFlag : int {
  kOpenLocalOnly = 1 << 0,
  kOpenRuntimeOnly = 1 << 1,
  kOpenSystem = 1 << 2,
  kOpenCurrentUser = 1 << 3,
};

// Raw return values of JournalStore::Wait.
namespace WaitStatus {
  static constexpr int kNop = 0;         // Timeout elapsed, nothing changed
  static constexpr int kAppend = 1;      // New entries were appended
  static constexpr int kInvalidate = 2;  // Journal files were added or removed
}

// Primitive operations of the native journal engine, one connection per
// instance. Everything returns a negative errno on failure, like sd-journal.
//
// Positioning follows sd-journal: SeekHead/SeekCursor place the read position
// *before* the target entry, so the next Next() lands on it.
class JournalStore {
 public:
  virtual ~JournalStore() = default;

  virtual int Open(int flags) = 0;
  virtual void Close() = 0;

  virtual int SeekHead() = 0;
  virtual int SeekTail() = 0;

  // > 0 moved onto an entry, 0 no more entries.
  virtual int Next() = 0;
  virtual int Previous() = 0;

  virtual void RestartData() = 0;
  // > 0 *data/*length name a "NAME=value" buffer owned by the store,
  // 0 when the current entry has no more fields.
  virtual int EnumerateData(const void** data, size_t* length) = 0;

  // On success *cursor is owned by the caller and must be handed back to
  // ReleaseCursor.
  virtual int GetCursor(char** cursor) = 0;
  virtual void ReleaseCursor(char* cursor) = 0;
  virtual int SeekCursor(const char* cursor) = 0;
  // > 0 current entry matches cursor, 0 it does not.
  virtual int TestCursor(const char* cursor) = 0;

  virtual int GetRealtimeUsec(uint64_t* usec) = 0;

  // Returns one of WaitStatus or a negative errno.
  virtual int Wait(uint64_t timeout_usec) = 0;

  // Write path. Does not need an open connection.
  virtual int Send(const struct iovec* iov, int count) = 0;
};

#endif // JOURNAL_STORE_HPP
