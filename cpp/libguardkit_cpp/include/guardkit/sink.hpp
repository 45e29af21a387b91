/**
 * @file sink.hpp
 * @brief Byte sinks with guaranteed release and checked flush.
 *
 * A Sink is an output resource: a file, or a decorator that owns an inner
 * sink (buffering, size limiting). Decorators release themselves first and
 * their inner sink last, so a chain built file -> buffer -> limit is released
 * limit -> buffer -> file.
 *
 * Error rules
 * - Flush() and Close() report failures; callers must check them.
 * - Close() releases the resource even if flushing pending data fails. The
 *   flush failure is the primary error and any later release failure is
 *   attached via Result::Suppressed().
 * - Close() is idempotent. Write()/Flush() after Close() give
 *   kAlreadyReleased.
 * - Destructors close unclosed sinks and log failures at error level; they
 *   cannot report them. Close explicitly to see the error.
 *
 * @code{.cpp}
 * auto f = guardkit::FileSink::Open("out.bin");
 * if (!f) return guardkit::Result<void>::From(f);
 * std::unique_ptr<guardkit::Sink> sink(
 *     new guardkit::BufferedSink(std::unique_ptr<guardkit::Sink>(f.MoveValue())));
 * return guardkit::UsingSink(std::move(sink), [&](guardkit::Sink& s) {
 *   return s.Write(data, size);
 * });
 * @endcode
 */
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include <memory>
#include <string>
#include <vector>

#include "guardkit/error.hpp"
#include "guardkit/result.hpp"
#include "guardkit/scope.hpp"

namespace guardkit {

/** Abstract byte sink. */
class Sink {
 public:
  virtual ~Sink() {}

  virtual Result<void> Write(const void* data, size_t size) = 0;
  /** Push buffered bytes all the way down the chain. */
  virtual Result<void> Flush() = 0;
  /** Release the resource. Safe to call multiple times. */
  virtual Result<void> Close() = 0;
  virtual const std::string& Name() const = 0;
};

/** Sink over a stdio FILE*. */
class FileSink : public Sink {
 public:
  /**
   * @brief Open @p path with fopen() @p mode.
   * @return kOpenFailed with the errno text on failure.
   */
  static Result<std::unique_ptr<FileSink>> Open(const std::string& path,
                                                const char* mode = "wb");

  ~FileSink() override;
  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  Result<void> Write(const void* data, size_t size) override;
  Result<void> Flush() override;
  Result<void> Close() override;
  const std::string& Name() const override { return name_; }

  bool IsOpen() const { return file_ != nullptr; }

 private:
  FileSink(FILE* file, const std::string& path);
  Result<void> CloseFile();

  FILE* file_;
  std::string name_;
};

/**
 * Decorator that batches small writes into a fixed-capacity buffer. Buffered
 * bytes are dropped once handed to the inner sink, even if that write fails,
 * so a later Flush() or Close() never repeats bytes the inner sink may have
 * already taken.
 */
class BufferedSink : public Sink {
 public:
  static constexpr size_t kDefaultCapacity = 64 * 1024;

  /**
   * @param inner Owned inner sink.
   * @param capacity Buffer size; writes of at least this size bypass the
   *        buffer. 0 makes the sink unbuffered.
   */
  explicit BufferedSink(std::unique_ptr<Sink> inner,
                        size_t capacity = kDefaultCapacity);
  ~BufferedSink() override;
  BufferedSink(const BufferedSink&) = delete;
  BufferedSink& operator=(const BufferedSink&) = delete;

  Result<void> Write(const void* data, size_t size) override;
  Result<void> Flush() override;
  /** Flush the buffer, then close the inner sink even if that flush failed. */
  Result<void> Close() override;
  const std::string& Name() const override { return name_; }

  size_t Buffered() const { return buf_.size(); }

 private:
  Result<void> FlushBuffer();
  Result<void> CloseChain();

  std::unique_ptr<Sink> inner_;
  std::vector<char> buf_;
  size_t capacity_;
  bool closed_;
  std::string name_;
};

/** Decorator that refuses writes past a total byte count. */
class LimitedSink : public Sink {
 public:
  LimitedSink(std::unique_ptr<Sink> inner, uint64_t max_bytes);
  ~LimitedSink() override;
  LimitedSink(const LimitedSink&) = delete;
  LimitedSink& operator=(const LimitedSink&) = delete;

  /**
   * @return kLimitExceeded if the write would pass max_bytes; nothing is
   *         forwarded in that case.
   */
  Result<void> Write(const void* data, size_t size) override;
  Result<void> Flush() override;
  Result<void> Close() override;
  const std::string& Name() const override { return name_; }

  uint64_t Written() const { return written_; }

 private:
  Result<void> CloseChain();

  std::unique_ptr<Sink> inner_;
  uint64_t max_bytes_;
  uint64_t written_;
  bool closed_;
  std::string name_;
};

namespace detail {
void LogReleaseFailure(const Sink& sink, const Result<void>& r);
}  // namespace detail

/**
 * @brief Run @p action on @p sink and release it on every exit path.
 *
 * On success the sink is flushed explicitly and then closed; a failure of
 * either is returned. On an action error the sink is still closed, the
 * action error is returned and a close failure is attached as suppressed.
 * If @p action throws, the sink is closed before the exception propagates.
 *
 * @param action Callable `Result<void>(Sink&)`.
 */
template <typename F>
Result<void> UsingSink(std::unique_ptr<Sink> sink, F&& action) {
  if (!sink) {
    return Result<void>::Error(ErrorCode::kNotInitialized,
                               [] { return std::string("Null sink"); });
  }
  Sink& s = *sink;
  auto on_throw = MakeScopeGuard([&s] {
    Result<void> c = s.Close();
    if (!c) detail::LogReleaseFailure(s, c);
  });
  Result<void> r = action(s);
  if (r) r = s.Flush();
  on_throw.Dismiss();
  Result<void> c = s.Close();
  if (!r) {
    r.Suppress(c);
    return r;
  }
  return c;
}

struct WriteOptions {
  /** Buffer capacity of the BufferedSink layer. */
  size_t buffer_size = BufferedSink::kDefaultCapacity;
  /** Output ceiling; 0 means no LimitedSink layer. */
  uint64_t max_bytes = 0;
  /** fopen() mode. */
  const char* mode = "wb";
};

/**
 * @brief Write @p size bytes to @p path through file, buffer and optional
 * limit layers, flushing before release.
 */
Result<void> WriteFile(const std::string& path, const void* data, size_t size,
                       const WriteOptions& options = WriteOptions());

}  // namespace guardkit
