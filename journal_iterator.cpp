#include "journal_iterator.hpp"

#include <iostream>
#include <utility>

const char* IteratorStateName(IteratorState state) {
  switch (state) {
    case IteratorState::kReady:
      return "Ready";
    case IteratorState::kWaiting:
      return "Waiting";
    case IteratorState::kInvalidated:
      return "Invalidated";
    case IteratorState::kExhausted:
      return "Exhausted";
    case IteratorState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

JournalIterator::JournalIterator(Journal* journal, IteratorOptions options)
    : journal_(journal),
      options_(options),
      state_(IteratorState::kReady),
      valid_(false),
      placeholder_(false),
      consecutive_errors_(0),
      status_(Result::OK()) {
  if (journal_ == nullptr) {
    status_ = Result::InvalidArgument("JournalIterator: journal cannot be null.");
    state_ = IteratorState::kFailed;
  }
}

bool JournalIterator::Next() {
  valid_ = false;
  placeholder_ = false;

  if (state_ == IteratorState::kFailed) {
    return false;
  }
  if (state_ == IteratorState::kExhausted) {
    if (options_.timeout_policy == TimeoutPolicy::kTerminate) {
      return false;
    }
    state_ = IteratorState::kReady;
  }
  if (!journal_->IsOpen()) {
    return Fail(Result::NotSupported("JournalIterator: journal is not open."));
  }
  status_ = Result::OK();

  // Each pass either yields, ends the call, or goes round again after a
  // wakeup. Long quiet periods just mean more passes.
  for (;;) {
    bool advanced = false;
    Result next_res = journal_->Next(&advanced);
    if (!next_res.ok()) {
      // Position did not move, so there is no cursor to report.
      return YieldPlaceholder(next_res, std::string());
    }
    if (advanced) {
      return YieldCurrent();
    }

    state_ = IteratorState::kWaiting;
    WaitResult wait_result = WaitResult::kTimeout;
    Result wait_res = journal_->Wait(&wait_result);
    if (!wait_res.ok()) {
      // Same outcome as a timeout; the timeout policy decides what follows.
      std::cout << "[JournalIterator::Next] Wait failed, ending this call: "
                << wait_res.ToString() << std::endl;
      status_ = wait_res;
      state_ = IteratorState::kExhausted;
      return false;
    }

    switch (wait_result) {
      case WaitResult::kDataAvailable:
        state_ = IteratorState::kReady;
        break;
      case WaitResult::kTimeout:
        state_ = IteratorState::kExhausted;
        return false;
      case WaitResult::kInvalidated: {
        state_ = IteratorState::kInvalidated;
        Result inval_res = HandleInvalidation();
        if (!inval_res.ok()) {
          return Fail(inval_res);
        }
        state_ = IteratorState::kReady;
        break;
      }
    }
  }
}

bool JournalIterator::YieldCurrent() {
  JournalRecord record;
  Result read_res = journal_->ReadRecord(&record);
  if (!read_res.ok()) {
    std::string entry_cursor;
    if (!journal_->GetCursor(&entry_cursor).ok()) {
      entry_cursor.clear();
    }
    return YieldPlaceholder(read_res, std::move(entry_cursor));
  }

  std::string entry_cursor;
  Result cursor_res = journal_->GetCursor(&entry_cursor);
  if (!cursor_res.ok()) {
    return YieldPlaceholder(cursor_res, std::string());
  }

  record_ = std::move(record);
  cursor_ = std::move(entry_cursor);
  valid_ = true;
  placeholder_ = false;
  consecutive_errors_ = 0;
  state_ = IteratorState::kReady;
  return true;
}

bool JournalIterator::YieldPlaceholder(const Result& error, std::string entry_cursor) {
  ++consecutive_errors_;
  if (consecutive_errors_ > options_.max_consecutive_errors) {
    std::cout << "[JournalIterator::Next] " << consecutive_errors_
              << " consecutive read errors, giving up: " << error.ToString() << std::endl;
    cursor_.clear();
    return Fail(error);
  }

  std::cout << "[JournalIterator::Next] Error reading a journal entry, yielding placeholder: "
            << error.ToString() << std::endl;
  record_.clear();
  record_.emplace(kReadErrorField, error.ToString());
  cursor_ = std::move(entry_cursor);
  valid_ = true;
  placeholder_ = true;
  status_ = error;
  state_ = IteratorState::kReady;
  return true;
}

bool JournalIterator::Fail(const Result& error) {
  std::cout << "[JournalIterator::Next] Iterator failed: " << error.ToString() << std::endl;
  valid_ = false;
  placeholder_ = false;
  status_ = error;
  state_ = IteratorState::kFailed;
  return false;
}

Result JournalIterator::HandleInvalidation() {
  std::cout << "[JournalIterator::Next] Journal invalidated (rotation or new files)." << std::endl;
  if (options_.invalidation_policy == InvalidationPolicy::kRetryInPlace) {
    return Result::OK();
  }

  Result tail_res = journal_->SeekTail();
  if (!tail_res.ok()) {
    return tail_res;
  }
  // Park on the last entry so the next advance yields only what comes after.
  bool moved = false;
  return journal_->Previous(&moved);
}
