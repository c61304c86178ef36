#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/element.hpp"

namespace agentflow::work {

// Work item lifecycle: PENDING -> IN_PROGRESS -> COMPLETED | FAILED
enum class WorkStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

const char* work_status_to_string(WorkStatus status);

using WorkTask = std::function<nlohmann::json()>;

// One unit of scheduled work. Status only moves forward.
class WorkItem : public Element {
public:
    explicit WorkItem(WorkTask task, std::string name = {});

    const std::string& name() const { return name_; }

    WorkStatus status() const;
    // Throws InvalidStateError for a backward or skipped transition
    void set_status(WorkStatus status);
    bool done() const;

    // Run the task. Task exceptions are recorded as error() with status
    // FAILED and never rethrown.
    void perform();

    nlohmann::json result() const;
    std::string error() const;
    std::chrono::milliseconds duration() const;
    std::optional<Clock::time_point> completed_at() const;

    nlohmann::json to_json() const override;

private:
    WorkTask task_;
    std::string name_;

    mutable std::mutex mutex_;
    WorkStatus status_ = WorkStatus::PENDING;
    nlohmann::json result_;
    std::string error_;
    std::chrono::milliseconds duration_{0};
    std::optional<Clock::time_point> completed_at_;
};

} // namespace agentflow::work
