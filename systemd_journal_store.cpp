#include "systemd_journal_store.hpp"

#include <cerrno>
#include <cstdlib>  // For std::free
#include <iostream>

SystemdJournalStore::SystemdJournalStore() : journal_(nullptr) {}

SystemdJournalStore::~SystemdJournalStore() {
  Close();
}

int SystemdJournalStore::ToNativeFlags(int flags) {
  int native = 0;
  if (flags & kOpenLocalOnly) {
    native |= SD_JOURNAL_LOCAL_ONLY;
  }
  if (flags & kOpenRuntimeOnly) {
    native |= SD_JOURNAL_RUNTIME_ONLY;
  }
  if (flags & kOpenSystem) {
    native |= SD_JOURNAL_SYSTEM;
  }
  if (flags & kOpenCurrentUser) {
    native |= SD_JOURNAL_CURRENT_USER;
  }
  return native;
}

int SystemdJournalStore::Open(int flags) {
  if (journal_ != nullptr) {
    return -EBUSY;
  }
  int native_flags = ToNativeFlags(flags);
  std::cout << "[SystemdJournalStore::Open] sd_journal_open flags: " << native_flags << std::endl;
  int r = sd_journal_open(&journal_, native_flags);
  if (r < 0) {
    journal_ = nullptr;
  }
  return r;
}

void SystemdJournalStore::Close() {
  if (journal_ != nullptr) {
    sd_journal_close(journal_);
    journal_ = nullptr;
  }
}

int SystemdJournalStore::SeekHead() {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_seek_head(journal_);
}

int SystemdJournalStore::SeekTail() {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_seek_tail(journal_);
}

int SystemdJournalStore::Next() {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_next(journal_);
}

int SystemdJournalStore::Previous() {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_previous(journal_);
}

void SystemdJournalStore::RestartData() {
  if (journal_ != nullptr) {
    sd_journal_restart_data(journal_);
  }
}

int SystemdJournalStore::EnumerateData(const void** data, size_t* length) {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_enumerate_data(journal_, data, length);
}

int SystemdJournalStore::GetCursor(char** cursor) {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_get_cursor(journal_, cursor);
}

void SystemdJournalStore::ReleaseCursor(char* cursor) {
  // sd_journal_get_cursor allocates with malloc.
  std::free(cursor);
}

int SystemdJournalStore::SeekCursor(const char* cursor) {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_seek_cursor(journal_, cursor);
}

int SystemdJournalStore::TestCursor(const char* cursor) {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_test_cursor(journal_, cursor);
}

int SystemdJournalStore::GetRealtimeUsec(uint64_t* usec) {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_get_realtime_usec(journal_, usec);
}

int SystemdJournalStore::Wait(uint64_t timeout_usec) {
  if (journal_ == nullptr) return -EBADF;
  return sd_journal_wait(journal_, timeout_usec);
}

int SystemdJournalStore::Send(const struct iovec* iov, int count) {
  return sd_journal_sendv(iov, count);
}
