#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/element.hpp"
#include "work/work_log.hpp"

namespace agentflow::work {

using WorkFunction = std::function<nlohmann::json(const nlohmann::json& args)>;

// A named set of work functions, each with its own WorkLog
class Worker : public Element {
public:
    explicit Worker(std::string name = "worker");

    // Non-copyable
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    const std::string& name() const { return name_; }

    // Throws ItemExistsError for a name already registered
    void add_function(const std::string& function, WorkFunction fn,
                      size_t capacity = 5,
                      std::chrono::milliseconds refresh_interval = std::chrono::milliseconds(1000));
    bool has_function(const std::string& function) const { return functions_.count(function) > 0; }
    std::vector<std::string> function_names() const;

    // Bind args to the function and append the item to its log.
    // Throws ItemNotFoundError for an unknown function.
    std::shared_ptr<WorkItem> submit(const std::string& function,
                                     nlohmann::json args = nlohmann::json::object());

    // One forward() on every log
    void forward();

    void stop();
    bool stopped() const { return stopped_; }

    // Not stopped and some log still has unfinished work
    bool is_progressable() const;

    WorkLog& log(const std::string& function);

    nlohmann::json to_json() const override;

private:
    struct Entry {
        WorkFunction fn;
        std::unique_ptr<WorkLog> log;
    };

    std::string name_;
    std::map<std::string, Entry> functions_;
    bool stopped_ = false;

    Entry& entry(const std::string& function);
};

} // namespace agentflow::work
