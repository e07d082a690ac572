#ifndef JOURNAL_ITERATOR_HPP
#define JOURNAL_ITERATOR_HPP

#include <cstddef>
#include <string>

#include "journal.hpp"
#include "journal_record.hpp"
#include "result.hpp"

// Field name of the placeholder record yielded for an entry that could not
// be read. Its value is the error text.
constexpr const char* kReadErrorField = "JOURNAL_READER_ERROR";

enum class IteratorState {
  kReady,
  kWaiting,
  kInvalidated,
  kExhausted,  // A wait timed out or failed; nothing was yielded by this call
  kFailed,     // Too many consecutive read errors or no usable journal; terminal
};

const char* IteratorStateName(IteratorState state);

// What a wait timeout means for the sequence.
// A failed wait is treated like a timeout.
enum class TimeoutPolicy {
  kEndCall,    // Only the current Next() ends; the next call waits again
  kTerminate,  // The sequence ends for good
};

// What to do when the journal file set changes while waiting.
enum class InvalidationPolicy {
  // Keep the current position and retry. Nothing is skipped or re-delivered.
  kRetryInPlace,
  // Jump to the last entry and continue from there. Entries appended between
  // the change and the jump are skipped; nothing is re-delivered.
  kSeekTail,
};

struct IteratorOptions {
  TimeoutPolicy timeout_policy = TimeoutPolicy::kEndCall;
  InvalidationPolicy invalidation_policy = InvalidationPolicy::kRetryInPlace;
  // Consecutive unreadable entries tolerated before the iterator fails.
  size_t max_consecutive_errors = 16;
};

// Blocking pull iterator over (record, cursor) pairs.
//
//   while (it.Next()) { use(it.record(), it.cursor()); }
//
// Next() blocks in Journal::Wait when it runs out of entries. The journal's
// wait timeout bounds each wait. To resume elsewhere, Seek() the journal and
// build a fresh iterator.
class JournalIterator {
 public:
  explicit JournalIterator(Journal* journal, IteratorOptions options = IteratorOptions());
  ~JournalIterator() = default;

  JournalIterator(const JournalIterator&) = delete;
  JournalIterator& operator=(const JournalIterator&) = delete;

  // Produces the next pair. Returns Valid().
  bool Next();

  bool Valid() const { return valid_; }
  const JournalRecord& record() const { return record_; }
  const std::string& cursor() const { return cursor_; }

  // Placeholder yielded in place of an unreadable entry.
  bool IsPlaceholder() const { return valid_ && placeholder_; }

  // Last error. OK while iterating or after a plain timeout; a failed wait
  // leaves its WaitError here until the next call.
  Result status() const { return status_; }
  IteratorState state() const { return state_; }

 private:
  // Fills record_/cursor_ from the entry the journal just advanced onto.
  bool YieldCurrent();
  // entry_cursor is empty when the failing entry cannot be located.
  bool YieldPlaceholder(const Result& error, std::string entry_cursor);
  bool Fail(const Result& error);
  Result HandleInvalidation();

  Journal* journal_;
  IteratorOptions options_;
  IteratorState state_;
  JournalRecord record_;
  std::string cursor_;
  bool valid_;
  bool placeholder_;
  size_t consecutive_errors_;
  Result status_;
};

#endif // JOURNAL_ITERATOR_HPP
