// C system headers
#include <errno.h>
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>

// C++ headers
#include <string>
#include <vector>

// libguardkit_cpp
#include "guardkit/guardkit.hpp"

namespace {

constexpr size_t kPayloadLen = 256 * 1024;  // 256 KiB

std::vector<char> MakePayload(size_t len) {
  std::vector<char> v(len);
  for (size_t i = 0; i < len; ++i) {
    v[i] = static_cast<char>('0' + i % 10);
  }
  return v;
}

void PrintError(const char* what, const guardkit::Result<void>& r) {
  printf("%s failed: %s (%s)\n", what, r.Message().c_str(),
         guardkit::ErrorCodeToString(r.Code()));
  for (size_t i = 0; i < r.Suppressed().size(); ++i) {
    printf("  suppressed: %s\n", r.Suppressed()[i].message.c_str());
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    printf("usage: %s <path> [max_bytes]\n", argv[0]);
    printf("  try /dev/full to see a flush failure reported\n");
    return 2;
  }

  guardkit::Result<guardkit::ResourceLimits> limits =
      guardkit::LoadLimitsFromEnv();
  if (!limits) {
    printf("config: %s\n", limits.Message().c_str());
    return 2;
  }
  guardkit::ApplyLogLimits(*limits);
  guardkit::SetLogLevel(guardkit::LogLevel::kDebug);

  guardkit::WriteOptions opts;
  opts.max_bytes = limits->max_output_bytes;
  if (argc == 3) {
    errno = 0;
    char* end = nullptr;
    unsigned long long v = strtoull(argv[2], &end, 10);
    if (errno == ERANGE || end == argv[2] || *end != '\0') {
      printf("max_bytes must be an unsigned integer\n");
      return 2;
    }
    opts.max_bytes = static_cast<uint64_t>(v);
  }

  std::vector<char> payload = MakePayload(kPayloadLen);
  printf("writing %zu bytes to %s (limit %" PRIu64 ")\n", payload.size(),
         argv[1], opts.max_bytes);
  guardkit::Result<void> r =
      guardkit::WriteFile(argv[1], payload.data(), payload.size(), opts);
  if (!r) {
    PrintError("write", r);
    return 1;
  }
  printf("scoped write pass\n");
  return 0;
}
