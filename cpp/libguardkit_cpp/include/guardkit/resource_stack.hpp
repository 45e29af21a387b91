/**
 * @file resource_stack.hpp
 * @brief Releases heterogeneous resources in reverse acquisition order.
 *
 * Push a releaser right after each successful acquisition. ReleaseAll() (or
 * the destructor) runs every releaser exactly once, last pushed first, and
 * keeps going when one fails. The first failure is the primary error and
 * later ones are attached as suppressed errors. A releaser that throws does
 * not stop the older ones either; the first exception is rethrown after the
 * last releaser has run.
 *
 * @code{.cpp}
 * guardkit::ResourceStack stack;
 * int fd = open(path, O_RDONLY);
 * if (fd < 0) return ...;
 * stack.Push("fd", [fd] { return CloseFd(fd); });
 * // a lock taken by hand is released the same way
 * mtx.lock();
 * stack.Push("mtx", [&mtx] { mtx.unlock(); return guardkit::Result<void>(); });
 * ...
 * return stack.ReleaseAll();
 * @endcode
 */
#pragma once

#include <functional>
#include <string>
#include <vector>

#include "guardkit/result.hpp"

namespace guardkit {

class ResourceStack {
 public:
  typedef std::function<Result<void>()> Releaser;

  ResourceStack() = default;
  /** Runs ReleaseAll() and logs a failure or exception; never throws. */
  ~ResourceStack();
  ResourceStack(const ResourceStack&) = delete;
  ResourceStack& operator=(const ResourceStack&) = delete;

  /**
   * @brief Register @p releaser for a resource acquired just before.
   * @return kInvalidArgument if @p releaser is empty.
   */
  Result<void> Push(const std::string& name, Releaser releaser);

  /**
   * @brief Release everything, newest first.
   * @return Ok when every releaser succeeded; a second call is a no-op.
   * @throws the first exception a releaser threw, after all have run.
   */
  Result<void> ReleaseAll();

  size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }

 private:
  struct Entry {
    std::string name;
    Releaser releaser;
  };
  std::vector<Entry> entries_;
};

}  // namespace guardkit
