#include "telemetry/structured_logger.hpp"
#include <stdexcept>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger journal;
  return journal;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  out_.open(file_path, std::ios::out | std::ios::app);
  if (!out_.is_open()) throw std::runtime_error("cannot open events file: " + file_path);
  lines_written_ = 0;
  running_ = true;
  writer_ = std::thread(&StructuredLogger::Writer, this);
}

bool StructuredLogger::Running() {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

size_t StructuredLogger::LinesWritten() {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_written_;
}

void StructuredLogger::LogJsonLine(const std::string& json_line) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    pending_.push_back(json_line);
  }
  cv_.notify_one();
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (writer_.joinable()) writer_.join();
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) out_.close();
}

void StructuredLogger::Writer() {
  std::deque<std::string> batch;
  while (true) {
    bool stopping = false;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [&]{ return !pending_.empty() || !running_; });
      batch.swap(pending_);
      stopping = !running_;
    }
    // out_ is only touched by this thread while running
    for (const auto& line : batch) out_ << line << '\n';
    out_.flush();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_written_ += batch.size();
    }
    batch.clear();
    if (stopping) break;
  }
}
