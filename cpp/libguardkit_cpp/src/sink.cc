#include "guardkit/sink.hpp"

#include <errno.h>
#include <string.h>

#include <utility>

#include "guardkit/admission.hpp"
#include "guardkit/log.hpp"

namespace guardkit {

constexpr size_t BufferedSink::kDefaultCapacity;

namespace {

Result<void> IoError(ErrorCode code, const char* op, const std::string& name,
                     int err) {
  return Result<void>::Error(code, [=] {
    return std::string(op) + " " + name + ": " + strerror(err);
  });
}

Result<void> Released(const std::string& name) {
  return Result<void>::Error(ErrorCode::kAlreadyReleased, [name] {
    return name + " already closed";
  });
}

Result<void> NoInner(const std::string& name) {
  return Result<void>::Error(ErrorCode::kNotInitialized, [name] {
    return name + " has no inner sink";
  });
}

}  // namespace

namespace detail {
void LogReleaseFailure(const Sink& sink, const Result<void>& r) {
  Logf(LogLevel::kError, "release of %s failed: %s", sink.Name().c_str(),
       r.Message().c_str());
  for (size_t i = 0; i < r.Suppressed().size(); ++i) {
    Logf(LogLevel::kError, "  suppressed: %s",
         r.Suppressed()[i].message.c_str());
  }
}
}  // namespace detail

// FileSink

Result<std::unique_ptr<FileSink>> FileSink::Open(const std::string& path,
                                                 const char* mode) {
  FILE* f = fopen(path.c_str(), mode ? mode : "wb");
  if (!f) {
    const int err = errno;
    return Result<std::unique_ptr<FileSink>>::Error(
        ErrorCode::kOpenFailed, [path, err] {
          return std::string("open ") + path + ": " + strerror(err);
        });
  }
  std::unique_ptr<FileSink> sink;
  try {
    sink.reset(new FileSink(f, path));
  } catch (...) {
    fclose(f);
    throw;
  }
  return Result<std::unique_ptr<FileSink>>::Ok(std::move(sink));
}

FileSink::FileSink(FILE* file, const std::string& path)
    : file_(file), name_(path) {}

FileSink::~FileSink() {
  if (!file_) return;
  Result<void> r = CloseFile();
  if (!r) detail::LogReleaseFailure(*this, r);
}

Result<void> FileSink::Write(const void* data, size_t size) {
  if (!file_) return Released(name_);
  if (size == 0) return Result<void>::Ok();
  if (!data) {
    return Result<void>::Error(ErrorCode::kInvalidArgument,
                               [] { return std::string("Null data"); });
  }
  if (fwrite(data, 1, size, file_) != size) {
    return IoError(ErrorCode::kWriteFailed, "write", name_, errno);
  }
  return Result<void>::Ok();
}

Result<void> FileSink::Flush() {
  if (!file_) return Released(name_);
  if (fflush(file_) != 0) {
    return IoError(ErrorCode::kFlushFailed, "flush", name_, errno);
  }
  return Result<void>::Ok();
}

Result<void> FileSink::Close() {
  if (!file_) return Result<void>::Ok();
  return CloseFile();
}

Result<void> FileSink::CloseFile() {
  // fclose releases the stream even when its implicit flush fails.
  FILE* f = file_;
  file_ = nullptr;
  if (fclose(f) != 0) {
    return IoError(ErrorCode::kCloseFailed, "close", name_, errno);
  }
  return Result<void>::Ok();
}

// BufferedSink

BufferedSink::BufferedSink(std::unique_ptr<Sink> inner, size_t capacity)
    : inner_(std::move(inner)), capacity_(capacity), closed_(false) {
  name_ = "buffered(" + (inner_ ? inner_->Name() : std::string("null")) + ")";
  buf_.reserve(capacity_);
}

BufferedSink::~BufferedSink() {
  if (closed_) return;
  Result<void> r = CloseChain();
  if (!r) detail::LogReleaseFailure(*this, r);
}

Result<void> BufferedSink::Write(const void* data, size_t size) {
  if (closed_) return Released(name_);
  if (!inner_) return NoInner(name_);
  if (size == 0) return Result<void>::Ok();
  if (!data) {
    return Result<void>::Error(ErrorCode::kInvalidArgument,
                               [] { return std::string("Null data"); });
  }
  if (buf_.size() + size > capacity_) {
    Result<void> r = FlushBuffer();
    if (!r) return r;
  }
  if (size >= capacity_) {
    return inner_->Write(data, size);
  }
  const char* p = static_cast<const char*>(data);
  buf_.insert(buf_.end(), p, p + size);
  return Result<void>::Ok();
}

Result<void> BufferedSink::Flush() {
  if (closed_) return Released(name_);
  if (!inner_) return NoInner(name_);
  Result<void> r = FlushBuffer();
  if (!r) return r;
  return inner_->Flush();
}

Result<void> BufferedSink::Close() {
  if (closed_) return Result<void>::Ok();
  return CloseChain();
}

Result<void> BufferedSink::FlushBuffer() {
  if (buf_.empty()) return Result<void>::Ok();
  // The inner sink may have taken part of the buffer before failing, so the
  // bytes are dropped either way; a retry must not write a prefix twice.
  Result<void> r = inner_->Write(buf_.data(), buf_.size());
  buf_.clear();
  return r;
}

Result<void> BufferedSink::CloseChain() {
  closed_ = true;
  if (!inner_) return Result<void>::Ok();
  Result<void> r = FlushBuffer();
  Result<void> c = inner_->Close();
  if (!r) {
    r.Suppress(c);
    return r;
  }
  return c;
}

// LimitedSink

LimitedSink::LimitedSink(std::unique_ptr<Sink> inner, uint64_t max_bytes)
    : inner_(std::move(inner)),
      max_bytes_(max_bytes),
      written_(0),
      closed_(false) {
  name_ = "limited(" + (inner_ ? inner_->Name() : std::string("null")) + ")";
}

LimitedSink::~LimitedSink() {
  if (closed_) return;
  Result<void> r = CloseChain();
  if (!r) detail::LogReleaseFailure(*this, r);
}

Result<void> LimitedSink::Write(const void* data, size_t size) {
  if (closed_) return Released(name_);
  if (!inner_) return NoInner(name_);
  Result<void> admit =
      CheckAdmissionU64(written_, max_bytes_, static_cast<uint64_t>(size));
  if (!admit) {
    const std::string name = name_;
    const std::string why = admit.Message();
    return Result<void>::Error(ErrorCode::kLimitExceeded, [name, why] {
      return name + ": " + why;
    });
  }
  Result<void> r = inner_->Write(data, size);
  if (!r) return r;
  written_ += size;
  return Result<void>::Ok();
}

Result<void> LimitedSink::Flush() {
  if (closed_) return Released(name_);
  if (!inner_) return NoInner(name_);
  return inner_->Flush();
}

Result<void> LimitedSink::Close() {
  if (closed_) return Result<void>::Ok();
  return CloseChain();
}

Result<void> LimitedSink::CloseChain() {
  closed_ = true;
  if (!inner_) return Result<void>::Ok();
  return inner_->Close();
}

// WriteFile

Result<void> WriteFile(const std::string& path, const void* data, size_t size,
                       const WriteOptions& options) {
  Result<std::unique_ptr<FileSink>> file = FileSink::Open(path, options.mode);
  if (!file) return Result<void>::From(file);

  std::unique_ptr<Sink> raw(file.MoveValue());
  std::unique_ptr<Sink> chain(
      new BufferedSink(std::move(raw), options.buffer_size));
  if (options.max_bytes != 0) {
    std::unique_ptr<Sink> limited(
        new LimitedSink(std::move(chain), options.max_bytes));
    chain = std::move(limited);
  }
  Logf(LogLevel::kDebug, "writing %zu bytes via %s", size,
       chain->Name().c_str());
  return UsingSink(std::move(chain),
                   [data, size](Sink& s) { return s.Write(data, size); });
}

}  // namespace guardkit
