#include "work/work_item.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace agentflow::work {

const char* work_status_to_string(WorkStatus status) {
    switch (status) {
        case WorkStatus::PENDING: return "pending";
        case WorkStatus::IN_PROGRESS: return "in_progress";
        case WorkStatus::COMPLETED: return "completed";
        case WorkStatus::FAILED: return "failed";
    }
    return "unknown";
}

namespace {

bool is_allowed(WorkStatus from, WorkStatus to) {
    switch (from) {
        case WorkStatus::PENDING:
            return to == WorkStatus::IN_PROGRESS;
        case WorkStatus::IN_PROGRESS:
            return to == WorkStatus::COMPLETED || to == WorkStatus::FAILED;
        case WorkStatus::COMPLETED:
        case WorkStatus::FAILED:
            return false;
    }
    return false;
}

} // namespace

WorkItem::WorkItem(WorkTask task, std::string name)
    : task_(std::move(task))
    , name_(std::move(name)) {
    if (!task_) {
        throw InvalidValueError("work item requires a task");
    }
}

WorkStatus WorkItem::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void WorkItem::set_status(WorkStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_allowed(status_, status)) {
        throw InvalidStateError(std::string("work item ") + id() + " cannot move from " +
            work_status_to_string(status_) + " to " + work_status_to_string(status));
    }
    status_ = status;
}

bool WorkItem::done() const {
    auto current = status();
    return current == WorkStatus::COMPLETED || current == WorkStatus::FAILED;
}

void WorkItem::perform() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ == WorkStatus::COMPLETED || status_ == WorkStatus::FAILED) {
            throw InvalidStateError("work item " + id() + " has already run");
        }
        status_ = WorkStatus::IN_PROGRESS;
    }

    auto start = std::chrono::steady_clock::now();
    nlohmann::json result;
    std::string error;
    bool ok = true;
    try {
        result = task_();
    } catch (const std::exception& e) {
        ok = false;
        error = e.what();
    } catch (...) {
        ok = false;
        error = "unknown exception";
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::lock_guard<std::mutex> lock(mutex_);
    if (ok) {
        result_ = std::move(result);
        duration_ = elapsed;
        status_ = WorkStatus::COMPLETED;
    } else {
        error_ = std::move(error);
        status_ = WorkStatus::FAILED;
        spdlog::warn("Work item {} ({}) failed: {}", id(), name_, error_);
    }
    completed_at_ = Clock::now();
}

nlohmann::json WorkItem::result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

std::string WorkItem::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::chrono::milliseconds WorkItem::duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duration_;
}

std::optional<Element::Clock::time_point> WorkItem::completed_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_at_;
}

nlohmann::json WorkItem::to_json() const {
    auto j = Element::to_json();
    std::lock_guard<std::mutex> lock(mutex_);
    j["name"] = name_;
    j["status"] = work_status_to_string(status_);
    j["result"] = result_;
    j["error"] = error_;
    j["duration_ms"] = duration_.count();
    if (completed_at_) {
        j["completed_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            completed_at_->time_since_epoch()).count();
    } else {
        j["completed_at"] = nullptr;
    }
    return j;
}

} // namespace agentflow::work
