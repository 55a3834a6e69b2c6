#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <deque>

// Append-only JSON-lines journal for strategy signals. One background writer.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Opens `file_path` for append and starts the writer. Throws if the file cannot be opened.
  void Initialize(const std::string& file_path);
  // Queues one JSON object (no trailing newline). Dropped when not running.
  void LogJsonLine(const std::string& json_line);
  // Writes everything queued so far, then stops the writer and closes the file
  void Shutdown();
  bool Running();
  // Lines written since the last Initialize
  size_t LinesWritten();
private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Writer();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  std::ofstream out_;
  std::thread writer_;
  bool running_ = false;
  size_t lines_written_ = 0;
};
