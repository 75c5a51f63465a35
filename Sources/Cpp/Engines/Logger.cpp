// 표준 라이브러리
#include <filesystem>
#include <iostream>
#include <stdexcept>

// 파일 헤더
#include "Engines/Logger.hpp"

// 내부 헤더
#include "Engines/TimeUtils.hpp"

// 네임 스페이스
namespace rolling_stdev {
using namespace utils;
}  // namespace rolling_stdev

namespace rolling_stdev::logger {

// 정적 멤버 변수 정의
mutex Logger::instance_mutex_;
shared_ptr<Logger> Logger::instance_;
string Logger::log_directory_;

const char* Logger::GetLevelString(const LogLevel level) {
  switch (level) {
    case DEBUG_L: {
      return "DEBUG";
    }

    case INFO_L: {
      return "INFO";
    }

    case WARN_L: {
      return "WARN";
    }

    case ERROR_L: {
      return "ERROR";
    }

    default: {
      return "UNKNOWN";
    }
  }
}

// 역방향 구분자까지의 파일명 추출
const char* Logger::ExtractFilename(const char* filepath) {
  if (!filepath) return "";

  const char* filename = filepath;
  const char* p = filepath;

  while (*p) {
    if (*p == '/' || *p == '\\') {
      filename = p + 1;
    }
    ++p;
  }

  return filename;
}

string Logger::FormatMessage(const LogLevel level, const string& file,
                             const int line, const string& message) {
  string formatted;
  formatted.reserve(message.size() + 64);

  formatted += "[";
  formatted += GetCurrentLocalDatetime();
  formatted += "] [";
  formatted += GetLevelString(level);
  formatted += "] [";
  formatted += ExtractFilename(file.c_str());
  formatted += ":";
  formatted += to_string(line);
  formatted += "] | ";
  formatted += message;

  return formatted;
}

Logger::Logger(const string& debug_log_name, const string& info_log_name,
               const string& warn_log_name, const string& error_log_name,
               const string& run_log_name)
    : debug_log_name_(debug_log_name),
      info_log_name_(info_log_name),
      warn_log_name_(warn_log_name),
      error_log_name_(error_log_name),
      run_log_name_(run_log_name) {
  OpenFiles();
}

Logger::~Logger() { CloseFiles(); }

void Logger::Deleter::operator()(Logger* p) const {
  if (p) {
    p->Flush();
    delete p;
  }
}

void Logger::OpenFiles() {
  const string& log_path =
      log_directory_.empty() ? "./" : log_directory_ + "/";

  debug_log_.open(log_path + debug_log_name_, ios::app);
  info_log_.open(log_path + info_log_name_, ios::app);
  warn_log_.open(log_path + warn_log_name_, ios::app);
  error_log_.open(log_path + error_log_name_, ios::app);

  // 실행 로그는 프로그램 실행마다 새로 시작
  run_log_.open(log_path + run_log_name_, ios::out | ios::trunc);
}

void Logger::CloseFiles() {
  for (ofstream* file :
       {&debug_log_, &info_log_, &warn_log_, &error_log_, &run_log_}) {
    if (file->is_open()) {
      file->flush();
      file->close();
    }
  }
}

void Logger::SetLogDirectory(const string& log_directory) {
  try {
    if (!filesystem::exists(log_directory)) {
      filesystem::create_directories(log_directory);
    }
  } catch (const filesystem::filesystem_error& e) {
    // 로그 폴더를 만들 수 없으면 기존 폴더에 계속 기록
    GetLogger()->Log(WARN_L,
                     "로그 폴더 [" + log_directory +
                         "]을(를) 생성할 수 없습니다: " + e.what(),
                     __FILE__, __LINE__, true);
    return;
  }

  lock_guard lock(instance_mutex_);
  log_directory_ = log_directory;

  // 이전에 생성된 로거 인스턴스가 있으면 파일을 닫고 새 폴더에서 다시 염
  if (instance_) {
    lock_guard write_lock(instance_->write_mutex_);
    instance_->CloseFiles();
    instance_->OpenFiles();
  }
}

shared_ptr<Logger>& Logger::GetLogger(const string& debug_log_name,
                                      const string& info_log_name,
                                      const string& warn_log_name,
                                      const string& error_log_name,
                                      const string& run_log_name) {
  lock_guard lock(instance_mutex_);
  if (!instance_) {
    instance_ = shared_ptr<Logger>(
        new Logger(debug_log_name, info_log_name, warn_log_name, error_log_name,
                   run_log_name),
        Deleter());
  }

  return instance_;
}

void Logger::Log(const LogLevel& log_level, const string& message,
                 const string& file, const int line,
                 const bool log_to_console) {
  const string& formatted = FormatMessage(log_level, file, line, message);

  if (log_to_console) {
    ConsoleLog(log_level, formatted);
  }

  WriteLine(log_level, formatted);
}

void Logger::WriteLine(const LogLevel log_level, const string& line) {
  lock_guard lock(write_mutex_);

  ofstream* target;
  switch (log_level) {
    case DEBUG_L: {
      target = &debug_log_;
      break;
    }

    case WARN_L: {
      target = &warn_log_;
      break;
    }

    case ERROR_L: {
      target = &error_log_;
      break;
    }

    default: {
      target = &info_log_;
      break;
    }
  }

  if (target->is_open()) {
    *target << line << '\n';
  }

  if (run_log_.is_open()) {
    run_log_ << line << '\n';
  }

  // 오류는 즉시 디스크에 반영
  if (log_level == ERROR_L) {
    target->flush();
    run_log_.flush();
  }
}

void Logger::Flush() {
  lock_guard lock(write_mutex_);
  for (ofstream* file :
       {&debug_log_, &info_log_, &warn_log_, &error_log_, &run_log_}) {
    if (file->is_open()) {
      file->flush();
    }
  }
}

void Logger::LogAndThrowError(const string& message, const string& file,
                              const int line) {
  GetLogger()->Log(ERROR_L, message, file, line, true);
  throw runtime_error(message);
}

void Logger::ConsoleLog(const LogLevel level, const string& message) {
  switch (level) {
    case DEBUG_L: {
      cout << "\033[90m" << message << "\033[0m" << endl;  // Gray
      break;
    }

    case WARN_L: {
      cout << "\033[33m" << message << "\033[0m" << endl;  // Yellow
      break;
    }

    case ERROR_L: {
      cerr << "\033[31m" << message << "\033[0m" << endl;  // Red
      break;
    }

    default: {
      cout << "\033[38;2;200;200;200m" << message << "\033[0m"
           << endl;  // White
      break;
    }
  }
}

}  // namespace rolling_stdev::logger
