#include "work/work_queue.hpp"
#include "core/errors.hpp"
#include <future>
#include <spdlog/spdlog.h>
#include <vector>

namespace agentflow::work {

WorkQueue::WorkQueue(size_t capacity, std::chrono::milliseconds refresh_interval)
    : capacity_(capacity)
    , refresh_interval_(refresh_interval)
    , available_capacity_(capacity) {
    if (capacity_ == 0) {
        throw InvalidValueError("work queue capacity must be positive");
    }
}

void WorkQueue::enqueue(std::shared_ptr<WorkItem> item) {
    if (!item) {
        throw InvalidValueError("cannot enqueue a null work item");
    }
    if (item->status() != WorkStatus::PENDING) {
        throw InvalidStateError(std::string("work item ") + item->id() + " is " +
            work_status_to_string(item->status()) + ", not pending");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& queued : queue_) {
        if (queued->id() == item->id()) {
            throw ItemExistsError("work item " + item->id() + " is already queued");
        }
    }
    queue_.push_back(std::move(item));
}

std::shared_ptr<WorkItem> WorkQueue::dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return nullptr;
    }
    auto item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

size_t WorkQueue::process() {
    // Capacity comes back once the whole batch is done, or if it fails to start
    struct CapacityRestore {
        WorkQueue* queue;
        ~CapacityRestore() {
            std::lock_guard<std::mutex> lock(queue->mutex_);
            queue->available_capacity_ = queue->capacity_;
        }
    };

    CapacityRestore restore{this};

    std::vector<std::shared_ptr<WorkItem>> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (available_capacity_ > 0 && !queue_.empty()) {
            auto item = std::move(queue_.front());
            queue_.pop_front();
            // Items started elsewhere since enqueue are not run twice
            try {
                item->set_status(WorkStatus::IN_PROGRESS);
            } catch (const InvalidStateError& e) {
                spdlog::warn("WorkQueue: dropping work item {}: {}", item->id(), e.what());
                continue;
            }
            batch.push_back(std::move(item));
            --available_capacity_;
        }
    }
    if (batch.empty()) {
        return 0;
    }

    spdlog::debug("WorkQueue: running batch of {} ({} queued)", batch.size(), size());

    // Declared after restore: pending futures are joined before capacity returns
    std::vector<std::future<void>> running;
    running.reserve(batch.size());
    for (const auto& item : batch) {
        running.push_back(std::async(std::launch::async, [item]() { item->perform(); }));
    }

    for (auto& future : running) {
        future.get();
    }
    return batch.size();
}

void WorkQueue::execute() {
    spdlog::debug("WorkQueue: starting loop (capacity={}, refresh={}ms)", capacity_,
        refresh_interval_.count());
    while (!stopped()) {
        process();
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, refresh_interval_, [this]() { return stop_.load(); });
    }
    spdlog::debug("WorkQueue: loop stopped");
}

void WorkQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t WorkQueue::available_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_capacity_;
}

} // namespace agentflow::work
