#include "work/worker.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace agentflow::work {

Worker::Worker(std::string name)
    : name_(std::move(name)) {}

void Worker::add_function(const std::string& function, WorkFunction fn, size_t capacity,
                          std::chrono::milliseconds refresh_interval) {
    if (!fn) {
        throw InvalidValueError("work function " + function + " is empty");
    }
    if (has_function(function)) {
        throw ItemExistsError("worker " + name_ + " already has work function " + function);
    }
    functions_.emplace(function, Entry{std::move(fn), std::make_unique<WorkLog>(capacity, refresh_interval)});
    spdlog::debug("Worker {}: registered {} (capacity={})", name_, function, capacity);
}

std::vector<std::string> Worker::function_names() const {
    std::vector<std::string> names;
    names.reserve(functions_.size());
    for (const auto& [function, entry] : functions_) {
        names.push_back(function);
    }
    return names;
}

Worker::Entry& Worker::entry(const std::string& function) {
    auto it = functions_.find(function);
    if (it == functions_.end()) {
        throw ItemNotFoundError("worker " + name_ + " has no work function " + function);
    }
    return it->second;
}

std::shared_ptr<WorkItem> Worker::submit(const std::string& function, nlohmann::json args) {
    auto& target = entry(function);
    if (stopped_) {
        throw InvalidStateError("worker " + name_ + " is stopped");
    }
    auto fn = target.fn;
    auto item = std::make_shared<WorkItem>(
        [fn, args = std::move(args)]() { return fn(args); }, function);
    target.log->append(item);
    return item;
}

WorkLog& Worker::log(const std::string& function) {
    return *entry(function).log;
}

void Worker::forward() {
    for (auto& [function, entry] : functions_) {
        entry.log->forward();
    }
}

void Worker::stop() {
    stopped_ = true;
    for (auto& [function, entry] : functions_) {
        entry.log->stop();
    }
    spdlog::info("Worker {} stopped", name_);
}

bool Worker::is_progressable() const {
    if (stopped_) {
        return false;
    }
    for (const auto& [function, entry] : functions_) {
        if (entry.log->outstanding_count() > 0) {
            return true;
        }
    }
    return false;
}

nlohmann::json Worker::to_json() const {
    auto j = Element::to_json();
    j["name"] = name_;
    nlohmann::json logs = nlohmann::json::object();
    for (const auto& [function, entry] : functions_) {
        logs[function] = entry.log->to_json();
    }
    j["functions"] = logs;
    return j;
}

} // namespace agentflow::work
