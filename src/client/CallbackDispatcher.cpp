#include "CallbackDispatcher.hpp"

namespace hl {
namespace {
void runTask(const function<void()>& task) {
  try {
    task();
  } catch (const std::exception& e) {
    STERROR << "Callback threw: " << e.what();
  }
}
}  // namespace

void InlineDispatcher::post(function<void()> task) { runTask(task); }

void QueuedDispatcher::post(function<void()> task) {
  {
    lock_guard<mutex> guard(queueMutex);
    tasks.push_back(task);
  }
  queueCondition.notify_all();
}

int QueuedDispatcher::runPending() {
  deque<function<void()>> batch;
  {
    lock_guard<mutex> guard(queueMutex);
    batch.swap(tasks);
  }
  for (const auto& task : batch) {
    runTask(task);
  }
  return int(batch.size());
}

int QueuedDispatcher::waitAndRunPending(std::chrono::milliseconds timeout) {
  {
    unique_lock<mutex> lock(queueMutex);
    queueCondition.wait_for(lock, timeout, [this] { return !tasks.empty(); });
  }
  return runPending();
}

size_t QueuedDispatcher::pendingCount() {
  lock_guard<mutex> guard(queueMutex);
  return tasks.size();
}
}  // namespace hl
