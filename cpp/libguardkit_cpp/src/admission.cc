#include "guardkit/admission.hpp"

#include <inttypes.h>
#include <stdio.h>

#include <string>

namespace guardkit {

namespace {

std::string FormatRejection(const char* what, int64_t current, int64_t max,
                            int64_t extra) {
  char buf[160];
  snprintf(buf, sizeof(buf),
           "%s (current=%" PRId64 " max=%" PRId64 " extra=%" PRId64 ")", what,
           current, max, extra);
  return std::string(buf);
}

std::string FormatRejectionU(const char* what, uint64_t current, uint64_t max,
                             uint64_t extra) {
  char buf[160];
  snprintf(buf, sizeof(buf),
           "%s (current=%" PRIu64 " max=%" PRIu64 " extra=%" PRIu64 ")", what,
           current, max, extra);
  return std::string(buf);
}

Result<void> CheckOperands(int64_t current, int64_t max, int64_t extra) {
  if (extra < 0) {
    return Result<void>::Error(ErrorCode::kInvalidArgument, [=] {
      return FormatRejection("Negative increment", current, max, extra);
    });
  }
  if (current < 0 || max < 0) {
    return Result<void>::Error(ErrorCode::kInvalidArgument, [=] {
      return FormatRejection("Negative total or ceiling", current, max, extra);
    });
  }
  return Result<void>::Ok();
}

}  // namespace

Result<void> CheckAdmission(int64_t current, int64_t max, int64_t extra) {
  Result<void> r = CheckOperands(current, max, extra);
  if (!r) return r;
  // max >= 0 and extra >= 0, so max - extra cannot overflow.
  if (current > max - extra) {
    return Result<void>::Error(ErrorCode::kInvalidArgument, [=] {
      return FormatRejection("Admission exceeds limit", current, max, extra);
    });
  }
  return Result<void>::Ok();
}

Result<void> CheckAdmissionU64(uint64_t current, uint64_t max,
                               uint64_t extra) {
  if (extra > max || current > max - extra) {
    return Result<void>::Error(ErrorCode::kInvalidArgument, [=] {
      return FormatRejectionU("Admission exceeds limit", current, max, extra);
    });
  }
  return Result<void>::Ok();
}

Result<void> CheckAdmissionExact(int64_t current, int64_t max, int64_t extra) {
  Result<void> r = CheckOperands(current, max, extra);
  if (!r) return r;
  __extension__ typedef __int128 wide_t;
  const wide_t sum = static_cast<wide_t>(current) + static_cast<wide_t>(extra);
  if (sum > static_cast<wide_t>(max)) {
    return Result<void>::Error(ErrorCode::kInvalidArgument, [=] {
      return FormatRejection("Admission exceeds limit", current, max, extra);
    });
  }
  return Result<void>::Ok();
}

Result<void> CheckedAdd(uint64_t a, uint64_t b, uint64_t* out) {
  if (!out) {
    return Result<void>::Error(ErrorCode::kInvalidArgument,
                               [] { return std::string("Null output"); });
  }
  if (b > UINT64_MAX - a) {
    return Result<void>::Error(ErrorCode::kOverflow, [=] {
      char buf[96];
      snprintf(buf, sizeof(buf), "Overflow in %" PRIu64 " + %" PRIu64, a, b);
      return std::string(buf);
    });
  }
  *out = a + b;
  return Result<void>::Ok();
}

Result<void> CheckedMul(uint64_t a, uint64_t b, uint64_t* out) {
  if (!out) {
    return Result<void>::Error(ErrorCode::kInvalidArgument,
                               [] { return std::string("Null output"); });
  }
  if (a != 0 && b > UINT64_MAX / a) {
    return Result<void>::Error(ErrorCode::kOverflow, [=] {
      char buf[96];
      snprintf(buf, sizeof(buf), "Overflow in %" PRIu64 " * %" PRIu64, a, b);
      return std::string(buf);
    });
  }
  *out = a * b;
  return Result<void>::Ok();
}

AdmissionBudget::AdmissionBudget(int64_t max)
    : max_(max < 0 ? 0 : max), current_(0) {}

Result<int64_t> AdmissionBudget::TryAdmit(int64_t extra) {
  std::lock_guard<std::mutex> lk(mtx_);
  Result<void> r = CheckAdmission(current_, max_, extra);
  if (!r) return Result<int64_t>::From(r);
  current_ += extra;
  return Result<int64_t>::Ok(current_);
}

Result<void> AdmissionBudget::Release(int64_t amount) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (amount < 0 || amount > current_) {
    const int64_t cur = current_;
    return Result<void>::Error(ErrorCode::kInvalidArgument, [=] {
      char buf[96];
      snprintf(buf, sizeof(buf),
               "Release of %" PRId64 " exceeds total %" PRId64, amount, cur);
      return std::string(buf);
    });
  }
  current_ -= amount;
  return Result<void>::Ok();
}

int64_t AdmissionBudget::Current() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return current_;
}

}  // namespace guardkit
