#include "cursor.hpp"

#include <iostream>
#include <memory>

namespace {

// Hands a store-allocated cursor back to the store that allocated it.
struct CursorReleaser {
  JournalStore* store;
  void operator()(char* cursor) const {
    if (cursor != nullptr) {
      store->ReleaseCursor(cursor);
    }
  }
};

using ScopedCursor = std::unique_ptr<char, CursorReleaser>;

}  // namespace

const char* SeekOutcomeName(SeekOutcome outcome) {
  switch (outcome) {
    case SeekOutcome::kSeekSuccess:
      return "SeekSuccess";
    case SeekOutcome::kClosestSeek:
      return "ClosestSeek";
  }
  return "Unknown";
}

Result CaptureCursor(JournalStore& store, std::string* cursor_out) {
  if (cursor_out == nullptr) {
    return Result::InvalidArgument("CaptureCursor: cursor_out cannot be null.");
  }

  char* raw = nullptr;
  int r = store.GetCursor(&raw);
  ScopedCursor owned(raw, CursorReleaser{&store});
  if (r < 0) {
    return Result::ReadError("Failed to get cursor for current entry", r);
  }
  if (!owned) {
    return Result::ReadError("Store returned no cursor for current entry");
  }

  *cursor_out = std::string(owned.get());
  return Result::OK();
}

Result RestoreCursor(JournalStore& store, const std::string& cursor, SeekOutcome* outcome_out) {
  if (outcome_out == nullptr) {
    return Result::InvalidArgument("RestoreCursor: outcome_out cannot be null.");
  }
  if (cursor.empty()) {
    return Result::InvalidArgument("RestoreCursor: cursor is empty.");
  }

  int r = store.SeekCursor(cursor.c_str());
  if (r < 0) {
    return Result::SeekError("Failed to seek to cursor", r);
  }

  // sd_journal_test_cursor only answers once the position sits on an entry,
  // so step onto whatever the seek landed before.
  int moved = store.Next();
  if (moved < 0) {
    return Result::SeekError("Failed to step onto cursor entry", moved);
  }

  int matched = 0;
  if (moved > 0) {
    matched = store.TestCursor(cursor.c_str());
    if (matched < 0) {
      return Result::SeekError("Failed to test cursor", matched);
    }
  }

  if (matched > 0) {
    *outcome_out = SeekOutcome::kSeekSuccess;
    std::cout << "[RestoreCursor] Exact match for cursor " << cursor << std::endl;
    return Result::OK();
  }

  // The entry we stepped onto is the nearest survivor; put it back in front
  // of the read position so the caller's next advance yields it.
  r = store.SeekCursor(cursor.c_str());
  if (r < 0) {
    return Result::SeekError("Failed to re-seek to cursor after closest match", r);
  }
  *outcome_out = SeekOutcome::kClosestSeek;
  std::cout << "[RestoreCursor] Closest seek for cursor " << cursor << std::endl;
  return Result::OK();
}
