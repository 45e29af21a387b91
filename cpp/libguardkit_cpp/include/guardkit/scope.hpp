/**
 * @file scope.hpp
 * @brief Scoped release helpers: ScopeGuard and WithLock.
 *
 * ScopeGuard runs a release action exactly once when it leaves scope, on
 * normal return, early return and exception alike. WithLock runs an action
 * while holding a lock and releases it on every exit path.
 *
 * @code{.cpp}
 * FILE* f = fopen(path, "rb");
 * if (!f) return ...;
 * auto close_f = guardkit::MakeScopeGuard([f] { fclose(f); });
 * // ... every return below closes f ...
 * @endcode
 */
#pragma once

#include <mutex>
#include <utility>

namespace guardkit {

/**
 * @brief Runs a release action once on scope exit.
 * @note Non-copyable, movable. A moved-from guard is inert.
 */
template <typename F>
class ScopeGuard {
 public:
  explicit ScopeGuard(F release) : release_(std::move(release)), armed_(true) {}
  ScopeGuard(ScopeGuard&& other)
      : release_(std::move(other.release_)), armed_(other.armed_) {
    other.armed_ = false;
  }
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() { Release(); }

  /** Run the action now. Later calls and the destructor do nothing. */
  void Release() {
    if (!armed_) return;
    armed_ = false;
    release_();
  }

  /** Cancel the action. */
  void Dismiss() { armed_ = false; }

  bool Armed() const { return armed_; }

 private:
  F release_;
  bool armed_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F release) {
  return ScopeGuard<F>(std::move(release));
}

/**
 * @brief Run @p action while holding @p m.
 *
 * Acquisition blocks. The lock is released when @p action returns, returns
 * an error Result or throws. Not reentrant: calling WithLock on the same
 * non-recursive mutex from inside @p action deadlocks.
 *
 * @return Whatever @p action returns.
 */
template <typename Mutex, typename F>
auto WithLock(Mutex& m, F&& action) -> decltype(action()) {
  std::lock_guard<Mutex> lk(m);
  return action();
}

}  // namespace guardkit
