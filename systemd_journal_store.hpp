#ifndef SYSTEMD_JOURNAL_STORE_HPP
#define SYSTEMD_JOURNAL_STORE_HPP

#include <cstdint>

#include <systemd/sd-journal.h>

#include "journal_store.hpp"

// JournalStore backed by libsystemd's sd_journal.
struct SystemdJournalStore : public JournalStore {
 public:
  SystemdJournalStore();
  ~SystemdJournalStore() override;

  SystemdJournalStore(const SystemdJournalStore&) = delete;
  SystemdJournalStore& operator=(const SystemdJournalStore&) = delete;
  SystemdJournalStore(SystemdJournalStore&&) = delete;
  SystemdJournalStore& operator=(SystemdJournalStore&&) = delete;

  int Open(int flags) override;
  void Close() override;

  int SeekHead() override;
  int SeekTail() override;
  int Next() override;
  int Previous() override;

  void RestartData() override;
  int EnumerateData(const void** data, size_t* length) override;

  int GetCursor(char** cursor) override;
  void ReleaseCursor(char* cursor) override;
  int SeekCursor(const char* cursor) override;
  int TestCursor(const char* cursor) override;

  int GetRealtimeUsec(uint64_t* usec) override;
  int Wait(uint64_t timeout_usec) override;

  int Send(const struct iovec* iov, int count) override;

 private:
  // Translates OpenFlag bits to SD_JOURNAL_* bits.
  static int ToNativeFlags(int flags);

  sd_journal* journal_;
};

#endif // SYSTEMD_JOURNAL_STORE_HPP
