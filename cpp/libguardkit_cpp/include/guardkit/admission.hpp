/**
 * @file admission.hpp
 * @brief Overflow-safe admission checks for bounded resources.
 *
 * An admission check decides whether a running total may grow by a proposed
 * increment without passing a ceiling. The naive form
 * `current + extra > max` wraps around for values near the top of the
 * representable range and then admits requests it should reject. The checks
 * here compare `current > max - extra` instead, which cannot overflow once
 * `extra` is known to be non-negative and `max` is non-negative.
 *
 * CheckAdmissionExact() is the wide-precision form: it computes the sum in
 * 128 bits and is the reference the fast form is tested against.
 *
 * @code{.cpp}
 * auto r = guardkit::CheckAdmission(used, quota, request);
 * if (!r) { return guardkit::Result<void>::From(r); }
 * used += request;
 * @endcode
 */
#pragma once

#include <stdint.h>

#include <mutex>

#include "guardkit/error.hpp"
#include "guardkit/result.hpp"

namespace guardkit {

/**
 * @brief Check that @p current may grow by @p extra without passing @p max.
 * @return kInvalidArgument if any operand is negative or if the grown total
 *         would exceed @p max; ok otherwise.
 */
Result<void> CheckAdmission(int64_t current, int64_t max, int64_t extra);

/** @brief Unsigned form of CheckAdmission(); rejects only on the limit. */
Result<void> CheckAdmissionU64(uint64_t current, uint64_t max,
                               uint64_t extra);

/**
 * @brief Wide-precision admission check.
 *
 * Accepts and rejects exactly the same inputs as the int64_t CheckAdmission()
 * but evaluates `current + extra > max` in 128-bit arithmetic.
 */
Result<void> CheckAdmissionExact(int64_t current, int64_t max, int64_t extra);

/** @brief a + b into *out, or kOverflow. *out is untouched on failure. */
Result<void> CheckedAdd(uint64_t a, uint64_t b, uint64_t* out);

/** @brief a * b into *out, or kOverflow. *out is untouched on failure. */
Result<void> CheckedMul(uint64_t a, uint64_t b, uint64_t* out);

/**
 * @brief Thread-safe running total guarded by a ceiling.
 *
 * TryAdmit() grows the total only if CheckAdmission() accepts the request,
 * so the total never exceeds Max(). Release() gives capacity back.
 */
class AdmissionBudget {
 public:
  /** @param max Ceiling; negative values are clamped to 0. */
  explicit AdmissionBudget(int64_t max);
  AdmissionBudget(const AdmissionBudget&) = delete;
  AdmissionBudget& operator=(const AdmissionBudget&) = delete;

  /**
   * @brief Grow the total by @p extra.
   * @return New total on success; the total is unchanged on failure.
   */
  Result<int64_t> TryAdmit(int64_t extra);

  /**
   * @brief Shrink the total by @p amount.
   * @return kInvalidArgument if @p amount is negative or larger than the
   *         current total.
   */
  Result<void> Release(int64_t amount);

  int64_t Current() const;
  int64_t Max() const { return max_; }

 private:
  const int64_t max_;
  mutable std::mutex mtx_;
  int64_t current_;
};

}  // namespace guardkit
