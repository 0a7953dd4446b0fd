#include "telemetry/event_journal.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <fstream>

EventJournal& EventJournal::Instance() {
  static EventJournal inst;
  return inst;
}

EventJournal::~EventJournal() { Close(); }

bool EventJournal::Open(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_) {
    Logger::Warning("event journal already open at " + file_path_, __FILE__, __LINE__);
    return true;
  }
  {
    std::ofstream probe(file_path, std::ios::app | std::ios::out);
    if (!probe.is_open()) {
      Logger::Error("cannot open event journal " + file_path, __FILE__, __LINE__);
      return false;
    }
  }
  file_path_ = file_path;
  open_ = true;
  writer_ = std::thread(&EventJournal::Writer, this);
  Logger::Info("event journal " + file_path_ + " opened", __FILE__, __LINE__);
  return true;
}

void EventJournal::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
  }
  cv_.notify_all();
  if (writer_.joinable()) writer_.join();
}

bool EventJournal::IsOpen() {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

std::uint64_t EventJournal::Append(nlohmann::json record) {
  std::uint64_t seq = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) return 0;
    seq = next_seq_++;
    record["seq"] = seq;
    pending_.push_back(record.dump());
  }
  cv_.notify_one();
  return seq;
}

std::uint64_t EventJournal::RecordsWritten() {
  std::lock_guard<std::mutex> lock(mutex_);
  return written_;
}

void EventJournal::Writer() {
  std::ofstream out(file_path_, std::ios::app | std::ios::out);
  std::string batch;
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(50), [&]{ return !pending_.empty() || !open_; });
    if (!open_ && pending_.empty()) break;
    std::uint64_t lines = 0;
    while (!pending_.empty() && batch.size() < 4096) {
      batch.append(pending_.front());
      batch.push_back('\n');
      pending_.pop_front();
      ++lines;
    }
    lock.unlock();
    if (batch.empty()) continue;
    out << batch;
    out.flush();
    batch.clear();
    if (!out) {
      Logger::Error("event journal write failed, " + std::to_string(lines) + " record(s) lost", __FILE__, __LINE__);
      out.clear();
      continue;
    }
    lock.lock();
    written_ += lines;
  }
}
