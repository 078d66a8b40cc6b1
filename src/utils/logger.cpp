#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
LogConfig log_config;
std::string log_file_path;
bool file_sink_enabled = false;
std::atomic<int> min_level{static_cast<int>(LogLevel::INFO)};

const char* getLevelStr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// 调用方持有 log_mutex
void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() || !std::filesystem::exists(log_file_path, ec)) {
    return;
  }
  auto size = std::filesystem::file_size(log_file_path, ec);
  if (ec || size < log_config.maxFileSize) return;

  log_file.close();
  for (int i = static_cast<int>(log_config.maxBackupFiles) - 1; i >= 0; --i) {
    std::string old_name =
        log_file_path + (i == 0 ? "" : ("." + std::to_string(i)));
    std::string new_name = log_file_path + "." + std::to_string(i + 1);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

void openLogFile() {
  std::error_code ec;
  std::filesystem::create_directories(log_config.logDir, ec);
  log_file_path =
      (std::filesystem::path(log_config.logDir) / log_config.logFileName)
          .string();
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
  }
}
}  // namespace

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  log_config = config;
  if (log_config.logFileName.empty()) {
    log_config.logFileName = LogConfig().logFileName;
  }
  if (log_config.maxFileSize == 0) log_config.maxFileSize = 10 * 1024 * 1024;
  if (log_config.maxBackupFiles == 0) log_config.maxBackupFiles = 3;
  min_level.store(static_cast<int>(config.minLevel));

  if (log_file.is_open()) log_file.close();
  // 目录为空时只输出到控制台
  file_sink_enabled = !log_config.logDir.empty();
  if (file_sink_enabled) openLogFile();
}

void Logger::setMinLevel(LogLevel level) {
  min_level.store(static_cast<int>(level));
}

bool Logger::isEnabled(LogLevel level) {
  return static_cast<int>(level) >= min_level.load();
}

bool Logger::parseLevel(const std::string& name, LogLevel* level) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "debug") {
    *level = LogLevel::DEBUG;
  } else if (lowered == "info") {
    *level = LogLevel::INFO;
  } else if (lowered == "warn" || lowered == "warning") {
    *level = LogLevel::WARN;
  } else if (lowered == "error") {
    *level = LogLevel::ERROR;
  } else if (lowered == "fatal") {
    *level = LogLevel::FATAL;
  } else {
    return false;
  }
  return true;
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : enabled_(Logger::isEnabled(level)), oss_() {
  if (!enabled_) return;
  oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
       << std::filesystem::path(file).filename().string() << ":" << line << " "
       << func << ": ";
}

Logger::LogStream::~LogStream() {
  if (!enabled_) return;
  oss_ << "\n";
  std::string msg = oss_.str();
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_config.toConsole) std::cout << msg << std::flush;
  if (file_sink_enabled) {
    if (!log_file.is_open()) openLogFile();
    rotateLogsIfNeeded();
    if (log_file.is_open()) log_file << msg, log_file.flush();
  }
}

}  // namespace utils
