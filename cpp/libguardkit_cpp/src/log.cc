#include "guardkit/log.hpp"

#include <stdarg.h>
#include <string.h>

#include <mutex>

#include "guardkit/admission.hpp"
#include "guardkit/limits.hpp"

namespace guardkit {

namespace {

const char kBudgetNotice[] = "[guardkit][WARN] log budget exhausted\n";

struct LogState {
  std::mutex mtx;
  LogLevel level;
  FILE* stream;
  uint64_t budget;
  uint64_t written;
  uint64_t dropped;
  bool notice_sent;
  LogState()
      : level(LogLevel::kInfo),
        stream(nullptr),
        budget(0),
        written(0),
        dropped(0),
        notice_sent(false) {}
};

LogState& State() {
  static LogState state;
  return state;
}

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarning:
      return "WARN";
    case LogLevel::kError:
    default:
      return "ERROR";
  }
}

}  // namespace

void SetLogLevel(LogLevel level) {
  LogState& s = State();
  std::lock_guard<std::mutex> lk(s.mtx);
  s.level = level;
}

LogLevel GetLogLevel() {
  LogState& s = State();
  std::lock_guard<std::mutex> lk(s.mtx);
  return s.level;
}

void SetLogStream(FILE* stream) {
  LogState& s = State();
  std::lock_guard<std::mutex> lk(s.mtx);
  s.stream = stream;
}

void SetLogByteBudget(uint64_t bytes) {
  LogState& s = State();
  std::lock_guard<std::mutex> lk(s.mtx);
  s.budget = bytes;
}

void ApplyLogLimits(const ResourceLimits& limits) {
  SetLogByteBudget(limits.max_log_bytes);
}

uint64_t LogBytesWritten() {
  LogState& s = State();
  std::lock_guard<std::mutex> lk(s.mtx);
  return s.written;
}

uint64_t LogLinesDropped() {
  LogState& s = State();
  std::lock_guard<std::mutex> lk(s.mtx);
  return s.dropped;
}

void ResetLogStats() {
  LogState& s = State();
  std::lock_guard<std::mutex> lk(s.mtx);
  s.written = 0;
  s.dropped = 0;
  s.notice_sent = false;
}

void Logf(LogLevel level, const char* fmt, ...) {
  LogState& s = State();
  {
    std::lock_guard<std::mutex> lk(s.mtx);
    if (level < s.level) return;
  }

  char line[kLogLineMax];
  int prefix =
      snprintf(line, sizeof(line), "[guardkit][%s] ", LevelTag(level));
  if (prefix < 0) return;
  va_list ap;
  va_start(ap, fmt);
  vsnprintf(line + prefix, sizeof(line) - static_cast<size_t>(prefix) - 1, fmt,
            ap);
  va_end(ap);
  size_t len = strlen(line);
  line[len++] = '\n';

  std::lock_guard<std::mutex> lk(s.mtx);
  FILE* out = s.stream ? s.stream : stderr;
  if (s.budget != 0) {
    // Room for the notice is kept back so the total stays within budget.
    const uint64_t notice_len = sizeof(kBudgetNotice) - 1;
    const uint64_t usable = s.budget > notice_len ? s.budget - notice_len : 0;
    if (s.notice_sent || !CheckAdmissionU64(s.written, usable, len)) {
      ++s.dropped;
      if (!s.notice_sent) {
        s.notice_sent = true;
        if (CheckAdmissionU64(s.written, s.budget, notice_len)) {
          fwrite(kBudgetNotice, 1, notice_len, out);
          s.written += notice_len;
        }
      }
      return;
    }
  }
  fwrite(line, 1, len, out);
  s.written += len;
}

}  // namespace guardkit
