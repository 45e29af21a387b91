#include "guardkit/limits.hpp"

#include <errno.h>
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>

#include <string>

#include "guardkit/admission.hpp"

namespace guardkit {

namespace {

struct EnvField {
  const char* name;
  uint64_t ResourceLimits::*field;
};

const EnvField kEnvFields[] = {
    {"GUARDKIT_MAX_OUTPUT_BYTES", &ResourceLimits::max_output_bytes},
    {"GUARDKIT_MAX_DIMENSION", &ResourceLimits::max_dimension},
    {"GUARDKIT_MAX_IMAGE_BYTES", &ResourceLimits::max_image_bytes},
    {"GUARDKIT_MAX_EXPANSION_RATIO", &ResourceLimits::max_expansion_ratio},
    {"GUARDKIT_MAX_EXPANDED_BYTES", &ResourceLimits::max_expanded_bytes},
    {"GUARDKIT_MAX_ITERATIONS", &ResourceLimits::max_iterations},
    {"GUARDKIT_MAX_LOG_BYTES", &ResourceLimits::max_log_bytes},
};

// strtoull accepts leading whitespace and a minus sign; reject both.
bool ParseU64(const char* text, uint64_t* out) {
  if (!text || *text < '0' || *text > '9') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long v = strtoull(text, &end, 10);
  if (errno == ERANGE || end == text || *end != '\0') return false;
  *out = static_cast<uint64_t>(v);
  return true;
}

}  // namespace

ResourceLimits ResourceLimits::Defaults() {
  ResourceLimits l;
  l.max_output_bytes = 64ull * 1024 * 1024;
  l.max_dimension = 16384;
  l.max_image_bytes = 256ull * 1024 * 1024;
  l.max_expansion_ratio = 100;
  l.max_expanded_bytes = 256ull * 1024 * 1024;
  l.max_iterations = 1000000;
  l.max_log_bytes = 1024 * 1024;
  return l;
}

Result<ResourceLimits> LoadLimitsFromEnv(const ResourceLimits& base) {
  ResourceLimits l = base;
  for (size_t i = 0; i < sizeof(kEnvFields) / sizeof(kEnvFields[0]); ++i) {
    const char* name = kEnvFields[i].name;
    const char* text = getenv(name);
    if (!text) continue;
    uint64_t v = 0;
    if (!ParseU64(text, &v)) {
      std::string value(text);
      return Result<ResourceLimits>::Error(
          ErrorCode::kInvalidArgument, [name, value] {
            return std::string(name) + ": not an unsigned integer: '" + value +
                   "'";
          });
    }
    l.*(kEnvFields[i].field) = v;
  }
  return Result<ResourceLimits>::Ok(l);
}

Result<uint64_t> CheckDimensions(uint64_t width, uint64_t height,
                                 uint64_t bytes_per_pixel,
                                 const ResourceLimits& limits) {
  if (width == 0 || height == 0 || bytes_per_pixel == 0) {
    return Result<uint64_t>::Error(ErrorCode::kInvalidArgument, [] {
      return std::string("Zero dimension");
    });
  }
  if (width > limits.max_dimension || height > limits.max_dimension) {
    const uint64_t max_dim = limits.max_dimension;
    return Result<uint64_t>::Error(ErrorCode::kLimitExceeded, [=] {
      char buf[128];
      snprintf(buf, sizeof(buf),
               "Dimension %" PRIu64 "x%" PRIu64 " exceeds %" PRIu64, width,
               height, max_dim);
      return std::string(buf);
    });
  }
  uint64_t pixels = 0;
  Result<void> r = CheckedMul(width, height, &pixels);
  if (!r) return Result<uint64_t>::From(r);
  uint64_t bytes = 0;
  r = CheckedMul(pixels, bytes_per_pixel, &bytes);
  if (!r) return Result<uint64_t>::From(r);
  if (bytes > limits.max_image_bytes) {
    const uint64_t max_bytes = limits.max_image_bytes;
    return Result<uint64_t>::Error(ErrorCode::kLimitExceeded, [=] {
      char buf[128];
      snprintf(buf, sizeof(buf), "Image of %" PRIu64 " bytes exceeds %" PRIu64,
               bytes, max_bytes);
      return std::string(buf);
    });
  }
  return Result<uint64_t>::Ok(bytes);
}

ExpansionMeter::ExpansionMeter(const ResourceLimits& limits)
    : max_ratio_(limits.max_expansion_ratio),
      max_output_(limits.max_expanded_bytes),
      input_(0),
      output_(0) {}

Result<void> ExpansionMeter::AddInput(uint64_t n) {
  uint64_t total = 0;
  Result<void> r = CheckedAdd(input_, n, &total);
  if (!r) return r;
  input_ = total;
  return Result<void>::Ok();
}

Result<void> ExpansionMeter::AddOutput(uint64_t n) {
  Result<void> r = CheckAdmissionU64(output_, max_output_, n);
  if (!r) {
    const uint64_t out = output_;
    const uint64_t max_out = max_output_;
    return Result<void>::Error(ErrorCode::kLimitExceeded, [=] {
      char buf[128];
      snprintf(buf, sizeof(buf),
               "Expanded output %" PRIu64 " + %" PRIu64 " exceeds %" PRIu64,
               out, n, max_out);
      return std::string(buf);
    });
  }
  const uint64_t total = output_ + n;
  if (max_ratio_ != 0) {
    uint64_t allowed = 0;
    // An allowance that overflows 64 bits cannot be exceeded.
    if (CheckedMul(input_, max_ratio_, &allowed) && total > allowed) {
      const uint64_t in = input_;
      const uint64_t ratio = max_ratio_;
      return Result<void>::Error(ErrorCode::kExpansionExceeded, [=] {
        char buf[128];
        snprintf(buf, sizeof(buf),
                 "Output %" PRIu64 " from input %" PRIu64
                 " exceeds ratio %" PRIu64,
                 total, in, ratio);
        return std::string(buf);
      });
    }
  }
  output_ = total;
  return Result<void>::Ok();
}

double ExpansionMeter::Ratio() const {
  if (input_ == 0) return 0.0;
  return static_cast<double>(output_) / static_cast<double>(input_);
}

Result<void> IterationBudget::Step() {
  if (taken_ >= max_) {
    const uint64_t max = max_;
    return Result<void>::Error(ErrorCode::kIterationLimit, [max] {
      char buf[64];
      snprintf(buf, sizeof(buf), "Exceeded %" PRIu64 " iterations", max);
      return std::string(buf);
    });
  }
  ++taken_;
  return Result<void>::Ok();
}

}  // namespace guardkit
