#include "record_decoder.hpp"

#include <iostream>

Result SplitField(const Slice& field, std::string* name_out, std::string* value_out) {
  if (name_out == nullptr || value_out == nullptr) {
    return Result::InvalidArgument("SplitField: Output parameters cannot be null.");
  }
  size_t separator = field.find('=');
  if (separator == Slice::npos) {
    return Result::Corruption("Field buffer has no '=' separator: '" +
                              field.prefix(64).ToString() + "'");
  }
  *name_out = field.prefix(separator).ToString();
  *value_out = field.suffix_from(separator + 1).ToString();
  return Result::OK();
}

Result DecodeRecord(JournalStore& store, JournalRecord* record_out) {
  if (record_out == nullptr) {
    return Result::InvalidArgument("DecodeRecord: record_out cannot be null.");
  }

  store.RestartData();

  JournalRecord record;
  for (;;) {
    const void* data = nullptr;
    size_t length = 0;
    int r = store.EnumerateData(&data, &length);
    if (r < 0) {
      std::cout << "[DecodeRecord] EnumerateData failed: " << r << std::endl;
      return Result::ReadError("Failed to enumerate entry fields", r);
    }
    if (r == 0) {
      break;
    }

    std::string name;
    std::string value;
    Result split_res = SplitField(Slice(data, length), &name, &value);
    if (!split_res.ok()) {
      std::cout << "[DecodeRecord] Malformed field: " << split_res.message() << std::endl;
      return split_res;
    }
    // A repeated name keeps the value enumerated last.
    record.insert_or_assign(std::move(name), std::move(value));
  }

  *record_out = std::move(record);
  return Result::OK();
}
