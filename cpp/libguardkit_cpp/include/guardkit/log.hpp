/**
 * @file log.hpp
 * @brief printf-style leveled logging with a total byte budget.
 *
 * Lines go to stderr by default, prefixed with "[guardkit][LEVEL] ". Each
 * line is formatted into a fixed buffer and truncated past kLogLineMax bytes,
 * so one call never writes an unbounded amount. Across calls the total is
 * bounded by the byte budget, notice included: room for a single notice is
 * held back, the first line that would eat into it is replaced by that notice,
 * and everything after is dropped and counted.
 *
 * All functions are thread-safe.
 */
#pragma once

#include <stdint.h>
#include <stdio.h>

namespace guardkit {

struct ResourceLimits;

enum class LogLevel { kDebug = 0, kInfo = 1, kWarning = 2, kError = 3 };

constexpr size_t kLogLineMax = 512;

/** Minimum level that is emitted. Default: kInfo. */
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

/** Destination stream; nullptr restores stderr. Not owned. */
void SetLogStream(FILE* stream);

/** Total bytes that may be written before lines are dropped. 0 = unlimited. */
void SetLogByteBudget(uint64_t bytes);

/** Copy max_log_bytes from @p limits into the logger. */
void ApplyLogLimits(const ResourceLimits& limits);

/** Bytes written since the last ResetLogStats(), the notice included. */
uint64_t LogBytesWritten();
/** Lines dropped because the budget was spent. */
uint64_t LogLinesDropped();
/** Zero the counters and re-arm the budget notice. */
void ResetLogStats();

void Logf(LogLevel level, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

}  // namespace guardkit
