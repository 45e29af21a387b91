#include "guardkit/resource_stack.hpp"

#include <exception>
#include <utility>

#include "guardkit/log.hpp"

namespace guardkit {

ResourceStack::~ResourceStack() {
  if (entries_.empty()) return;
  Result<void> r;
  try {
    r = ReleaseAll();
  } catch (const std::exception& e) {
    Logf(LogLevel::kError, "resource release threw: %s", e.what());
  } catch (...) {
    Logf(LogLevel::kError, "resource release threw a non-standard exception");
  }
  if (!r) {
    Logf(LogLevel::kError, "resource release failed: %s", r.Message().c_str());
    for (size_t i = 0; i < r.Suppressed().size(); ++i) {
      Logf(LogLevel::kError, "  suppressed: %s",
           r.Suppressed()[i].message.c_str());
    }
  }
}

Result<void> ResourceStack::Push(const std::string& name, Releaser releaser) {
  if (!releaser) {
    return Result<void>::Error(ErrorCode::kInvalidArgument, [name] {
      return std::string("Empty releaser for ") + name;
    });
  }
  Entry e;
  e.name = name;
  e.releaser = std::move(releaser);
  entries_.push_back(std::move(e));
  return Result<void>::Ok();
}

Result<void> ResourceStack::ReleaseAll() {
  // Take the entries first so a releaser that pushes or re-enters cannot
  // run anything twice.
  std::vector<Entry> entries;
  entries.swap(entries_);

  Result<void> first;
  std::exception_ptr thrown;
  for (size_t i = entries.size(); i-- > 0;) {
    Result<void> r;
    try {
      r = entries[i].releaser();
    } catch (...) {
      // Older resources are still released; the first exception is
      // rethrown once the stack is empty.
      Logf(LogLevel::kError, "release of %s threw", entries[i].name.c_str());
      if (!thrown) thrown = std::current_exception();
      continue;
    }
    if (r) continue;
    Logf(LogLevel::kWarning, "release of %s failed: %s",
         entries[i].name.c_str(), r.Message().c_str());
    if (first) {
      first = r;
    } else {
      first.Suppress(r);
    }
  }
  if (thrown) std::rethrow_exception(thrown);
  return first;
}

}  // namespace guardkit
