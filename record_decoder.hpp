#ifndef RECORD_DECODER_HPP
#define RECORD_DECODER_HPP

#include <string>

#include "journal_record.hpp"
#include "journal_store.hpp"
#include "result.hpp"
#include "slice.hpp"

// Splits one "NAME=value" buffer on the first '='. The value keeps any
// further '=' characters. A buffer without '=' is Corruption.
Result SplitField(const Slice& field, std::string* name_out, std::string* value_out);

// Builds the full field map of the entry the store is positioned at.
//
// Restarts field enumeration, then copies every enumerated buffer out before
// asking for the next one (the store reuses its buffers). On failure
// *record_out is left untouched.
//
// A name enumerated twice keeps its last value.
Result DecodeRecord(JournalStore& store, JournalRecord* record_out);

#endif // RECORD_DECODER_HPP
