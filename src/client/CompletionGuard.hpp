#ifndef __HL_COMPLETION_GUARD__
#define __HL_COMPLETION_GUARD__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Lets completions that capture `this` outlive their owner.
 *
 * The owner keeps one guard in a shared_ptr and hands copies to the
 * completions it registers; its destructor calls release().  A completion
 * wraps its body in runIfAlive(), which skips the body once the owner is
 * gone and otherwise holds the guard so the owner cannot be destroyed
 * while the body runs.
 */
class CompletionGuard {
 public:
  CompletionGuard() : alive(true) {}

  /** @return false when the owner was released and `body` was skipped. */
  bool runIfAlive(const function<void()>& body) {
    lock_guard<recursive_mutex> guard(guardMutex);
    if (!alive) {
      return false;
    }
    body();
    return true;
  }

  /** @brief Waits for a running completion, then disables the rest. */
  void release() {
    lock_guard<recursive_mutex> guard(guardMutex);
    alive = false;
  }

 protected:
  recursive_mutex guardMutex;
  bool alive;
};
}  // namespace hl

#endif  // __HL_COMPLETION_GUARD__
