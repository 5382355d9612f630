#ifndef EXECUTOR_ADMISSION_HPP
#define EXECUTOR_ADMISSION_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace executor {

class too_many_executions : public std::runtime_error {
 public:
  explicit too_many_executions(const char* msg) : std::runtime_error(msg) {}
};

// Bounds the number of programs running at the same time, and the number of
// requests waiting for one of them to finish.
class Admission {
 public:
  using Deadline = std::chrono::steady_clock::time_point;

  // Holds one execution slot for its lifetime.
  class Slot {
   public:
    // Waits for a free slot until deadline. Throws too_many_executions if
    // the waiting queue is full or the deadline passes first.
    Slot(Admission* admission, Deadline deadline);
    ~Slot();
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot(Slot&&) = delete;
    Slot& operator=(Slot&&) = delete;

   private:
    Admission* admission_;
  };

  Admission(size_t max_running, size_t max_queued);
  Admission(const Admission&) = delete;
  Admission& operator=(const Admission&) = delete;

  size_t MaxRunning() const { return max_running_; }
  size_t MaxQueued() const { return max_queued_; }
  size_t Running() const;
  size_t Queued() const;

 private:
  const size_t max_running_;
  const size_t max_queued_;
  mutable std::mutex mutex_;
  std::condition_variable slot_freed_;
  size_t running_ = 0;
  size_t queued_ = 0;
};

}  // namespace executor

#endif
