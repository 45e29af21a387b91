// C system headers
#include <errno.h>
#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>

// libguardkit_cpp
#include "guardkit/guardkit.hpp"

namespace {

bool ParseI64(const char* text, int64_t* out) {
  errno = 0;
  char* end = nullptr;
  long long v = strtoll(text, &end, 10);
  if (errno == ERANGE || end == text || *end != '\0') return false;
  *out = static_cast<int64_t>(v);
  return true;
}

void Report(const char* label, const guardkit::Result<void>& r) {
  if (r) {
    printf("%-6s admit\n", label);
  } else {
    printf("%-6s reject: %s (%s)\n", label, r.Message().c_str(),
           guardkit::ErrorCodeToString(r.Code()));
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc != 4) {
    printf("usage: %s <current> <max> <extra>\n", argv[0]);
    return 2;
  }
  int64_t current = 0;
  int64_t max = 0;
  int64_t extra = 0;
  if (!ParseI64(argv[1], &current) || !ParseI64(argv[2], &max) ||
      !ParseI64(argv[3], &extra)) {
    printf("arguments must be 64-bit signed integers\n");
    return 2;
  }

  // What the unchecked comparison would decide, with the sum computed in
  // unsigned arithmetic so the wraparound is visible without UB.
  const int64_t wrapped = static_cast<int64_t>(static_cast<uint64_t>(current) +
                                               static_cast<uint64_t>(extra));
  printf("naive  %s (current + extra = %" PRId64 ")\n",
         wrapped > max ? "reject" : "admit", wrapped);

  guardkit::Result<void> fast = guardkit::CheckAdmission(current, max, extra);
  guardkit::Result<void> exact =
      guardkit::CheckAdmissionExact(current, max, extra);
  Report("check", fast);
  Report("exact", exact);

  if (static_cast<bool>(fast) != static_cast<bool>(exact)) {
    printf("mismatch between checks\n");
    return 3;
  }
  return fast ? 0 : 1;
}
