#pragma once
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/runtime_config.hpp"
#include "exec/branch.hpp"
#include "exec/coordinator.hpp"
#include "exec/graph_executor.hpp"
#include "graph/graph.hpp"
#include "mail/mail_manager.hpp"

namespace agentflow::exec {

struct BranchOutcome {
    ElementId branch_id;
    std::vector<ElementId> visited;
    std::vector<nlohmann::json> history;
};

struct SessionResult {
    size_t steps = 0;
    std::vector<BranchOutcome> branches;

    nlohmann::json to_json() const;
};

// Wires an executor, a coordinator and a mail manager together and runs
// one traversal of a graph on the calling thread.
class Session {
public:
    Session(graph::Graph graph, NodeHandler handler,
            config::RuntimeConfig config = config::RuntimeConfig{});

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Throws RelationError for a cyclic graph, InvalidStateError once
    // max_steps rounds pass without finishing
    SessionResult run(nlohmann::json context = nlohmann::json::object());

    // One round: collect, deliver, executor, coordinator (and its branches)
    void step();

    bool finished() const;

    GraphExecutor& executor() { return *executor_; }
    Coordinator& coordinator() { return *coordinator_; }
    mail::MailManager& mail_manager() { return mail_manager_; }

private:
    config::RuntimeConfig config_;
    mail::MailManager mail_manager_;
    std::shared_ptr<GraphExecutor> executor_;
    std::shared_ptr<Coordinator> coordinator_;
    bool started_ = false;
};

} // namespace agentflow::exec
