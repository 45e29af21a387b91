/**
 * @file limits.hpp
 * @brief Limits configuration and guards against disproportionate resource
 * consumption by untrusted input.
 *
 * Each guard is checked before the expensive step it protects:
 * - CheckDimensions(): declared image/font dimensions, before allocating.
 * - ExpansionMeter: output growth while decompressing or expanding entities.
 * - IterationBudget: loops whose progress depends on malformed input.
 * - LimitedSink (sink.hpp) and the log byte budget (log.hpp): output volume.
 *
 * Hash-collision blowup, catastrophic regex backtracking, unbounded query
 * cost and unsafe deserialization have no guard here. Callers choose
 * containers with bounded worst-case cost, avoid backtracking regex on input,
 * cap query work with IterationBudget and deserialize only into explicit
 * types.
 */
#pragma once

#include <stdint.h>

#include "guardkit/error.hpp"
#include "guardkit/result.hpp"

namespace guardkit {

/** Ceilings applied to untrusted input. All sizes are in bytes. */
struct ResourceLimits {
  uint64_t max_output_bytes;
  uint64_t max_dimension;
  uint64_t max_image_bytes;
  uint64_t max_expansion_ratio;
  uint64_t max_expanded_bytes;
  uint64_t max_iterations;
  uint64_t max_log_bytes;

  /** Built-in defaults. */
  static ResourceLimits Defaults();
};

/**
 * @brief Override @p base from GUARDKIT_MAX_* environment variables.
 *
 * Recognized: GUARDKIT_MAX_OUTPUT_BYTES, GUARDKIT_MAX_DIMENSION,
 * GUARDKIT_MAX_IMAGE_BYTES, GUARDKIT_MAX_EXPANSION_RATIO,
 * GUARDKIT_MAX_EXPANDED_BYTES, GUARDKIT_MAX_ITERATIONS, GUARDKIT_MAX_LOG_BYTES.
 * Unset variables keep the value from @p base.
 *
 * @return kInvalidArgument naming the variable if a value is not a plain
 *         decimal unsigned integer that fits in 64 bits.
 */
Result<ResourceLimits> LoadLimitsFromEnv(
    const ResourceLimits& base = ResourceLimits::Defaults());

/**
 * @brief Validate declared dimensions and compute the buffer size.
 * @return Byte count width * height * bytes_per_pixel.
 */
Result<uint64_t> CheckDimensions(uint64_t width, uint64_t height,
                                 uint64_t bytes_per_pixel,
                                 const ResourceLimits& limits);

/**
 * @brief Tracks input consumed against output produced.
 *
 * Feed AddInput() with compressed bytes read and AddOutput() with bytes
 * produced. AddOutput() fails once the output passes max_expanded_bytes or
 * grows beyond max_expansion_ratio times the input. Output is only allowed
 * against input already seen, so feed input first. A ratio of 0 disables the
 * ratio check. After a failure the counters keep the rejected amount out.
 */
class ExpansionMeter {
 public:
  explicit ExpansionMeter(const ResourceLimits& limits);

  Result<void> AddInput(uint64_t n);
  Result<void> AddOutput(uint64_t n);

  uint64_t Input() const { return input_; }
  uint64_t Output() const { return output_; }
  /** Output / input; 0 when nothing was read. */
  double Ratio() const;

 private:
  uint64_t max_ratio_;
  uint64_t max_output_;
  uint64_t input_;
  uint64_t output_;
};

/** Bounds the number of steps a loop may take. */
class IterationBudget {
 public:
  explicit IterationBudget(uint64_t max_steps)
      : max_(max_steps), taken_(0) {}
  /** Uses limits.max_iterations as the step ceiling. */
  explicit IterationBudget(const ResourceLimits& limits)
      : max_(limits.max_iterations), taken_(0) {}

  /** @return kIterationLimit once more than max_steps steps were taken. */
  Result<void> Step();

  uint64_t Remaining() const { return taken_ >= max_ ? 0 : max_ - taken_; }
  void Reset() { taken_ = 0; }

 private:
  uint64_t max_;
  uint64_t taken_;
};

}  // namespace guardkit
