/**
 * @file job_queue.hpp
 * @brief Bounded queue of jobs awaiting a worker, with admission control.
 *
 * Entries stay ordered by (retry_count descending, arrival ascending):
 * fresh jobs append at the back, retried jobs are placed ahead of every
 * job with fewer retries. Jobs with equal retry counts keep FIFO arrival
 * order. A full queue fails fast with kAdmissionRejected.
 */

#ifndef PPX_JOB_QUEUE_HPP_
#define PPX_JOB_QUEUE_HPP_

#include "ppx/job.hpp"
#include "ppx/platform.hpp"
#include "ppx/vocabulary.hpp"

#include <cstdint>
#include <deque>

namespace ppx {

class JobQueue final {
 public:
  explicit JobQueue(uint32_t capacity) noexcept : capacity_(capacity) {
    PPX_ASSERT(capacity > 0U);
  }

  /// Append a fresh job. Job ids are issued in arrival order.
  expected<void, ProxyError> Enqueue(JobId job) {
    if (Full()) {
      return expected<void, ProxyError>::error(ProxyError::kAdmissionRejected);
    }
    entries_.push_back(Entry{job, 0U});
    return expected<void, ProxyError>::success();
  }

  /// Re-insert a retried job at the front of its retry class.
  expected<void, ProxyError> EnqueueFront(JobId job, uint32_t retry_count) {
    if (Full()) {
      return expected<void, ProxyError>::error(ProxyError::kAdmissionRejected);
    }
    auto it = entries_.begin();
    while (it != entries_.end() &&
           (it->retry_count > retry_count ||
            (it->retry_count == retry_count && it->job < job))) {
      ++it;
    }
    entries_.insert(it, Entry{job, retry_count});
    return expected<void, ProxyError>::success();
  }

  optional<JobId> Dequeue() {
    if (entries_.empty()) return optional<JobId>();
    JobId job = entries_.front().job;
    entries_.pop_front();
    return optional<JobId>(job);
  }

  uint32_t Size() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }
  uint32_t Capacity() const noexcept { return capacity_; }
  bool Empty() const noexcept { return entries_.empty(); }
  bool Full() const noexcept { return entries_.size() >= capacity_; }

 private:
  struct Entry {
    JobId job;
    uint32_t retry_count;
  };

  std::deque<Entry> entries_;
  uint32_t capacity_;
};

}  // namespace ppx

#endif  // PPX_JOB_QUEUE_HPP_
