#ifndef __HL_CALLBACK_DISPATCHER__
#define __HL_CALLBACK_DISPATCHER__

#include "Headers.hpp"

namespace hl {
/**
 * @brief Decides on which thread an observer's callbacks run.  Tasks
 * posted to one dispatcher run in posting order.
 */
class CallbackDispatcher {
 public:
  virtual ~CallbackDispatcher() {}

  virtual void post(function<void()> task) = 0;
};

/** @brief Runs every task immediately on the posting thread. */
class InlineDispatcher : public CallbackDispatcher {
 public:
  virtual void post(function<void()> task);
};

/**
 * @brief Holds tasks until the owning thread drains them, for callers with
 * an event loop of their own.
 */
class QueuedDispatcher : public CallbackDispatcher {
 public:
  virtual void post(function<void()> task);

  /** @brief Runs every queued task.  @return how many ran. */
  int runPending();

  /**
   * @brief Waits up to `timeout` for at least one task, then runs all of
   * them.  @return how many ran.
   */
  int waitAndRunPending(std::chrono::milliseconds timeout);

  size_t pendingCount();

 protected:
  mutex queueMutex;
  condition_variable queueCondition;
  deque<function<void()>> tasks;
};
}  // namespace hl

#endif  // __HL_CALLBACK_DISPATCHER__
