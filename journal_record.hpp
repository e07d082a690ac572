#ifndef JOURNAL_RECORD_HPP
#define JOURNAL_RECORD_HPP

#include <map>
#include <string>

// Field name -> field value for one journal entry. Values may hold arbitrary
// bytes. Ordered by name so enumeration is deterministic.
using JournalRecord = std::map<std::string, std::string>;

#endif // JOURNAL_RECORD_HPP
