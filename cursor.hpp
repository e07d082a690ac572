#ifndef CURSOR_HPP
#define CURSOR_HPP

#include <string>

#include "journal_store.hpp"
#include "result.hpp"

enum class SeekOutcome {
  kSeekSuccess,  // Positioned on the exact entry the cursor names
  kClosestSeek,  // That entry is gone; positioned before the nearest later one
};

const char* SeekOutcomeName(SeekOutcome outcome);

// Copies the cursor of the current entry into *cursor_out. The store's own
// allocation is released before returning, on every path.
Result CaptureCursor(JournalStore& store, std::string* cursor_out);

// Restores a previously captured cursor.
//
// kSeekSuccess: the next Next() yields the entry after the cursor's entry.
// kClosestSeek: the next Next() yields the nearest surviving entry at or
// after the cursor's position.
Result RestoreCursor(JournalStore& store, const std::string& cursor, SeekOutcome* outcome_out);

#endif // CURSOR_HPP
