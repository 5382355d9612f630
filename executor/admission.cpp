#include "executor/admission.hpp"

namespace executor {

Admission::Admission(size_t max_running, size_t max_queued)
    : max_running_(max_running), max_queued_(max_queued) {}

size_t Admission::Running() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return running_;
}

size_t Admission::Queued() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return queued_;
}

Admission::Slot::Slot(Admission* admission, Deadline deadline)
    : admission_(admission) {
  std::unique_lock<std::mutex> lck(admission_->mutex_);
  // Requests that are already waiting go first: a free slot is taken right
  // away only if every waiter can still get one.
  size_t free_slots = admission_->max_running_ - admission_->running_;
  if (admission_->queued_ < free_slots) {
    admission_->running_++;
    return;
  }
  // Waiters that have been woken up for a free slot are leaving the queue.
  if (admission_->queued_ - free_slots >= admission_->max_queued_) {
    throw too_many_executions("Execution failed: too many pending requests");
  }
  admission_->queued_++;
  bool acquired = admission_->slot_freed_.wait_until(lck, deadline, [this]() {
    return admission_->running_ < admission_->max_running_;
  });
  admission_->queued_--;
  if (!acquired) {
    throw too_many_executions(
        "Execution failed: no free slot within the wall time limit");
  }
  admission_->running_++;
}

Admission::Slot::~Slot() {
  std::lock_guard<std::mutex> lck(admission_->mutex_);
  admission_->running_--;
  admission_->slot_freed_.notify_all();
}

}  // namespace executor
