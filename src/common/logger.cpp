#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

static std::string TimestampToString(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
  localtime_r(&t, &tm_buf);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

LogLevel ParseLogLevel(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info") return LogLevel::INFO;
  if (s == "warn" || s == "warning") return LogLevel::WARNING;
  if (s == "error") return LogLevel::ERROR;
  if (s == "critical" || s == "crit") return LogLevel::CRITICAL;
  throw std::invalid_argument("unknown log level: " + name);
}

void Logger::Initialize(const std::string& path, LogLevel min_level, bool mirror_stderr) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) return;
  std::unique_ptr<Logger> inst(new Logger());
  inst->log_file_.open(path, std::ios::out | std::ios::app);
  if (!inst->log_file_.is_open()) throw std::runtime_error("cannot open log file: " + path);
  inst->min_level_ = min_level;
  inst->mirror_stderr_ = mirror_stderr;
  inst->running_ = true;
  inst->worker_thread_ = std::thread(&Logger::WorkerFunction, inst.get());
  instance_ = std::move(inst);
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> inst;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    inst = std::move(instance_);
  }
  // destructor drains the queue and joins the worker
}

bool Logger::IsInitialized() {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return static_cast<bool>(instance_);
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) worker_thread_.join();
  if (log_file_.is_open()) log_file_.close();
}

void Logger::WorkerFunction() {
  while (true) {
    std::unique_lock<std::mutex> lock(log_mutex_);
    cv_.wait(lock, [&]{ return !log_queue_.empty() || !running_; });
    if (!running_ && log_queue_.empty()) break;
    auto entry = std::move(log_queue_.front());
    log_queue_.pop();
    lock.unlock();
    WriteLogEntry(entry);
  }
}

const char* Logger::LevelToString(LogLevel l) {
  switch (l) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRIT";
  }
  return "UNK";
}

std::string Logger::FormatLogEntry(const LogEntry& e) {
  std::string file = e.file;
  auto slash = file.find_last_of('/');
  if (slash != std::string::npos) file = file.substr(slash + 1);
  std::ostringstream oss;
  oss << TimestampToString(e.timestamp) << " [" << LevelToString(e.level) << "]"
      << " (" << e.thread_id << ") " << file << ":" << e.line << " - ";
  if (!e.component.empty()) oss << e.component << ": ";
  oss << e.message << '\n';
  return oss.str();
}

void Logger::WriteLogEntry(const LogEntry& e) {
  std::string line = FormatLogEntry(e);
  if (log_file_.is_open()) {
    log_file_ << line;
    log_file_.flush();
  }
  if (mirror_stderr_ && e.level >= LogLevel::WARNING) std::cerr << line;
}

void Logger::Log(LogLevel level, const std::string& component, const std::string& message,
                 const std::string& file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) return;
  if (level < instance_->min_level_) return;
  LogEntry e{std::chrono::system_clock::now(), level, component, message, file, line, std::this_thread::get_id()};
  {
    std::lock_guard<std::mutex> qlock(instance_->log_mutex_);
    instance_->log_queue_.push(std::move(e));
  }
  instance_->cv_.notify_one();
}

void Logger::Debug(const std::string& m, const std::string& f, int l) { Log(LogLevel::DEBUG, "", m, f, l); }
void Logger::Info(const std::string& m, const std::string& f, int l) { Log(LogLevel::INFO, "", m, f, l); }
void Logger::Warning(const std::string& m, const std::string& f, int l) { Log(LogLevel::WARNING, "", m, f, l); }
void Logger::Error(const std::string& m, const std::string& f, int l) { Log(LogLevel::ERROR, "", m, f, l); }
void Logger::Critical(const std::string& m, const std::string& f, int l) { Log(LogLevel::CRITICAL, "", m, f, l); }
