#include "journal.hpp"

#include <iostream>
#include <utility>

#include "record_decoder.hpp"
#include "systemd_journal_store.hpp"

const char* WaitResultName(WaitResult result) {
  switch (result) {
    case WaitResult::kDataAvailable:
      return "DataAvailable";
    case WaitResult::kTimeout:
      return "Timeout";
    case WaitResult::kInvalidated:
      return "Invalidated";
  }
  return "Unknown";
}

int MakeOpenFlags(JournalFiles files, bool runtime_only, bool local_only) {
  int flags = 0;
  if (runtime_only) {
    flags |= kOpenRuntimeOnly;
  }
  if (local_only) {
    flags |= kOpenLocalOnly;
  }
  switch (files) {
    case JournalFiles::kSystem:
      flags |= kOpenSystem;
      break;
    case JournalFiles::kCurrentUser:
      flags |= kOpenCurrentUser;
      break;
    case JournalFiles::kAll:
      break;
  }
  return flags;
}

Journal::Journal() : Journal(std::make_unique<SystemdJournalStore>()) {}

Journal::Journal(std::unique_ptr<JournalStore> store)
    : store_(std::move(store)),
      is_open_(false),
      files_(JournalFiles::kAll),
      runtime_only_(false),
      local_only_(false),
      open_flags_(0),
      wait_timeout_usec_(kInfiniteWait) {}

Journal::~Journal() {
  Close();
}

Journal::Journal(Journal&& other) noexcept
    : store_(std::move(other.store_)),
      is_open_(other.is_open_),
      files_(other.files_),
      runtime_only_(other.runtime_only_),
      local_only_(other.local_only_),
      open_flags_(other.open_flags_),
      wait_timeout_usec_(other.wait_timeout_usec_) {
  other.is_open_ = false;
}

Journal& Journal::operator=(Journal&& other) noexcept {
  if (this != &other) {
    Close();
    store_ = std::move(other.store_);
    is_open_ = other.is_open_;
    files_ = other.files_;
    runtime_only_ = other.runtime_only_;
    local_only_ = other.local_only_;
    open_flags_ = other.open_flags_;
    wait_timeout_usec_ = other.wait_timeout_usec_;
    other.is_open_ = false;
  }
  return *this;
}

Result Journal::Open(JournalFiles files, bool runtime_only, bool local_only) {
  if (is_open_) {
    return Result::NotSupported("Journal already open.");
  }
  if (!store_) {
    return Result::OpenError("Journal has no store.");
  }

  files_ = files;
  runtime_only_ = runtime_only;
  local_only_ = local_only;
  open_flags_ = MakeOpenFlags(files, runtime_only, local_only);

  std::cout << "[Journal::Open] Opening with flags " << open_flags_ << std::endl;
  int r = store_->Open(open_flags_);
  if (r < 0) {
    std::cout << "[Journal::Open] Store open failed: " << r << std::endl;
    store_->Close();
    return Result::OpenError("Failed to open journal", r);
  }

  r = store_->SeekHead();
  if (r < 0) {
    std::cout << "[Journal::Open] Seek to head failed: " << r << ". Closing store." << std::endl;
    store_->Close();
    return Result::OpenError("Failed to seek to journal head", r);
  }

  is_open_ = true;
  std::cout << "[Journal::Open] Opened and positioned at head." << std::endl;
  return Result::OK();
}

void Journal::Close() {
  if (!is_open_) {
    return;
  }
  std::cout << "[Journal::Close] Closing store." << std::endl;
  store_->Close();
  is_open_ = false;
}

void Journal::SetIteratorTimeout(uint64_t seconds) {
  constexpr uint64_t kUsecPerSec = 1000000;
  if (seconds > kInfiniteWait / kUsecPerSec) {
    wait_timeout_usec_ = kInfiniteWait;
  } else {
    wait_timeout_usec_ = seconds * kUsecPerSec;
  }
}

Result Journal::CheckOpen(const char* operation) const {
  if (!is_open_) {
    return Result::NotSupported(std::string(operation) + ": journal is not open.");
  }
  return Result::OK();
}

Result Journal::Next(bool* advanced) {
  Result state = CheckOpen("Next");
  if (!state.ok()) return state;
  if (advanced == nullptr) {
    return Result::InvalidArgument("Next: advanced cannot be null.");
  }

  int r = store_->Next();
  if (r < 0) {
    return Result::ReadError("Failed to advance to next entry", r);
  }
  *advanced = r > 0;
  if (*advanced) {
    // Field enumeration state belongs to the previous entry.
    store_->RestartData();
  }
  return Result::OK();
}

Result Journal::Previous(bool* moved) {
  Result state = CheckOpen("Previous");
  if (!state.ok()) return state;
  if (moved == nullptr) {
    return Result::InvalidArgument("Previous: moved cannot be null.");
  }

  int r = store_->Previous();
  if (r < 0) {
    return Result::ReadError("Failed to move to previous entry", r);
  }
  *moved = r > 0;
  if (*moved) {
    store_->RestartData();
  }
  return Result::OK();
}

Result Journal::SeekHead() {
  Result state = CheckOpen("SeekHead");
  if (!state.ok()) return state;
  int r = store_->SeekHead();
  if (r < 0) {
    return Result::SeekError("Failed to seek to journal head", r);
  }
  return Result::OK();
}

Result Journal::SeekTail() {
  Result state = CheckOpen("SeekTail");
  if (!state.ok()) return state;
  int r = store_->SeekTail();
  if (r < 0) {
    return Result::SeekError("Failed to seek to journal tail", r);
  }
  return Result::OK();
}

Result Journal::ReadRecord(JournalRecord* record_out) {
  Result state = CheckOpen("ReadRecord");
  if (!state.ok()) return state;
  return DecodeRecord(*store_, record_out);
}

Result Journal::NextRecord(std::optional<JournalRecord>* record_out) {
  if (record_out == nullptr) {
    return Result::InvalidArgument("NextRecord: record_out cannot be null.");
  }
  bool advanced = false;
  Result next_res = Next(&advanced);
  if (!next_res.ok()) {
    return next_res;
  }
  if (!advanced) {
    record_out->reset();
    return Result::OK();
  }

  JournalRecord record;
  Result decode_res = DecodeRecord(*store_, &record);
  if (!decode_res.ok()) {
    return decode_res;
  }
  *record_out = std::move(record);
  return Result::OK();
}

Result Journal::Wait(WaitResult* result_out) {
  Result state = CheckOpen("Wait");
  if (!state.ok()) return state;
  if (result_out == nullptr) {
    return Result::InvalidArgument("Wait: result_out cannot be null.");
  }

  int r = store_->Wait(wait_timeout_usec_);
  if (r < 0) {
    std::cout << "[Journal::Wait] Wait failed: " << r << std::endl;
    return Result::WaitError("Failed to wait for journal changes", r);
  }
  switch (r) {
    case WaitStatus::kNop:
      *result_out = WaitResult::kTimeout;
      break;
    case WaitStatus::kAppend:
      *result_out = WaitResult::kDataAvailable;
      break;
    case WaitStatus::kInvalidate:
      *result_out = WaitResult::kInvalidated;
      break;
    default:
      return Result::WaitError("Unexpected wait status " + std::to_string(r));
  }
  return Result::OK();
}

Result Journal::GetCursor(std::string* cursor_out) {
  Result state = CheckOpen("GetCursor");
  if (!state.ok()) return state;
  return CaptureCursor(*store_, cursor_out);
}

Result Journal::Seek(const std::string& cursor, SeekOutcome* outcome_out) {
  Result state = CheckOpen("Seek");
  if (!state.ok()) return state;
  return RestoreCursor(*store_, cursor, outcome_out);
}

Result Journal::GetRealtimeUsec(uint64_t* usec_out) {
  Result state = CheckOpen("GetRealtimeUsec");
  if (!state.ok()) return state;
  if (usec_out == nullptr) {
    return Result::InvalidArgument("GetRealtimeUsec: usec_out cannot be null.");
  }
  uint64_t usec = 0;
  int r = store_->GetRealtimeUsec(&usec);
  if (r < 0) {
    return Result::ReadError("Failed to get realtime timestamp", r);
  }
  *usec_out = usec;
  return Result::OK();
}
