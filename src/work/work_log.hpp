#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/pile.hpp"
#include "core/progression.hpp"
#include "work/work_item.hpp"
#include "work/work_queue.hpp"

namespace agentflow::work {

// Ledger of every work item submitted, plus the queue that runs them.
// Items wait in `pending` until forward() hands them to the queue.
class WorkLog {
public:
    explicit WorkLog(size_t capacity = 5,
                     std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(1000));

    // Non-copyable
    WorkLog(const WorkLog&) = delete;
    WorkLog& operator=(const WorkLog&) = delete;

    // Throws InvalidStateError unless the item is PENDING,
    // ItemExistsError if it was appended before
    void append(std::shared_ptr<WorkItem> item);

    // Move pending items into the queue and run one batch
    void forward();

    // forward() until stop()
    void execute();
    void stop();
    bool stopped() const { return stop_; }

    size_t size() const { return items_.size(); }
    size_t pending_count() const;
    // Items not yet finished (waiting in the log or in the queue)
    size_t outstanding_count() const;

    std::shared_ptr<WorkItem> get(const ElementId& id) const { return items_.get(id); }
    const Pile<WorkItem>& items() const { return items_; }
    WorkQueue& queue() { return queue_; }

    std::vector<std::shared_ptr<WorkItem>> pending_work() const;
    std::vector<std::shared_ptr<WorkItem>> completed_work() const;
    std::vector<std::shared_ptr<WorkItem>> failed_work() const;

    nlohmann::json to_json() const;

private:
    Pile<WorkItem> items_;
    Progression pending_;
    WorkQueue queue_;
    const std::chrono::milliseconds refresh_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_{false};

    std::vector<std::shared_ptr<WorkItem>> with_status(WorkStatus status) const;
};

} // namespace agentflow::work
