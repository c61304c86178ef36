#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include "work/work_item.hpp"

namespace agentflow::work {

// FIFO of work items run in batches of at most `capacity`.
//
// process() starts one batch concurrently and waits for all of it before
// returning; capacity is given back only when the whole batch is done, so a
// slow item holds back everything queued behind it.
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity = 5,
                       std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(1000));

    // Non-copyable
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Throws InvalidStateError unless the item is PENDING
    void enqueue(std::shared_ptr<WorkItem> item);
    // Oldest item, or nullptr when empty
    std::shared_ptr<WorkItem> dequeue();

    // Run one batch; returns the number of items it ran
    size_t process();

    // process() until stop(), pausing refresh_interval between batches
    void execute();
    void stop();
    bool stopped() const { return stop_; }

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t capacity() const { return capacity_; }
    size_t available_capacity() const;

private:
    const size_t capacity_;
    const std::chrono::milliseconds refresh_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::shared_ptr<WorkItem>> queue_;
    size_t available_capacity_;
    std::atomic<bool> stop_{false};
};

} // namespace agentflow::work
