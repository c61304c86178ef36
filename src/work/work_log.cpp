#include "work/work_log.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace agentflow::work {

WorkLog::WorkLog(size_t capacity, std::chrono::milliseconds refresh_interval)
    : queue_(capacity, refresh_interval)
    , refresh_interval_(refresh_interval) {}

void WorkLog::append(std::shared_ptr<WorkItem> item) {
    if (!item) {
        throw InvalidValueError("cannot append a null work item");
    }
    if (item->status() != WorkStatus::PENDING) {
        throw InvalidStateError(std::string("work item ") + item->id() + " is " +
            work_status_to_string(item->status()) + ", not pending");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.contains(item->id())) {
        throw ItemExistsError("work item " + item->id() + " is already in the log");
    }
    items_.include(item);
    pending_.append(item->id());
}

void WorkLog::forward() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!pending_.empty()) {
            queue_.enqueue(items_.get(pending_.popleft()));
        }
    }
    auto ran = queue_.process();
    if (ran > 0) {
        spdlog::debug("WorkLog: batch of {} done, {} still queued", ran, queue_.size());
    }
}

void WorkLog::execute() {
    while (!stopped()) {
        forward();
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, refresh_interval_, [this]() { return stop_.load(); });
    }
}

void WorkLog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    queue_.stop();
    cv_.notify_all();
}

size_t WorkLog::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t WorkLog::outstanding_count() const {
    size_t count = 0;
    for (const auto& item : items_.values()) {
        if (!item->done()) {
            ++count;
        }
    }
    return count;
}

std::vector<std::shared_ptr<WorkItem>> WorkLog::with_status(WorkStatus status) const {
    std::vector<std::shared_ptr<WorkItem>> result;
    for (const auto& item : items_.values()) {
        if (item->status() == status) {
            result.push_back(item);
        }
    }
    return result;
}

std::vector<std::shared_ptr<WorkItem>> WorkLog::pending_work() const {
    return with_status(WorkStatus::PENDING);
}

std::vector<std::shared_ptr<WorkItem>> WorkLog::completed_work() const {
    return with_status(WorkStatus::COMPLETED);
}

std::vector<std::shared_ptr<WorkItem>> WorkLog::failed_work() const {
    return with_status(WorkStatus::FAILED);
}

nlohmann::json WorkLog::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"items", items_.to_json()["items"]},
        {"pending", pending_.order()},
        {"queued", queue_.size()}
    };
}

} // namespace agentflow::work
