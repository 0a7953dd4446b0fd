#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

// Append-only JSON-lines journal of committed strategy notifications.
// Each record is stamped with a process-wide sequence number ("seq") at
// enqueue time, so the file order matches the commit order.
class EventJournal {
public:
  static EventJournal& Instance();

  // Opens (appends to) file_path and starts the writer. Returns false when the
  // file cannot be opened; records are then dropped.
  bool Open(const std::string& file_path);
  // Writes everything queued so far, then stops the writer
  void Close();
  bool IsOpen();

  // Returns the sequence number assigned, or 0 when the journal is closed
  std::uint64_t Append(nlohmann::json record);
  std::uint64_t RecordsWritten();

private:
  EventJournal() = default;
  ~EventJournal();
  void Writer();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  std::thread writer_;
  bool open_ = false;
  std::string file_path_;
  std::uint64_t next_seq_ = 1;
  std::uint64_t written_ = 0;
};
