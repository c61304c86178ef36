#include "exec/session.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace agentflow::exec {

nlohmann::json SessionResult::to_json() const {
    nlohmann::json branches_json = nlohmann::json::array();
    for (const auto& branch : branches) {
        branches_json.push_back({
            {"id", branch.branch_id},
            {"visited", branch.visited},
            {"history", branch.history}
        });
    }
    return {
        {"steps", steps},
        {"branches", branches_json}
    };
}

Session::Session(graph::Graph graph, NodeHandler handler, config::RuntimeConfig config)
    : config_(std::move(config)) {
    ExecutorOptions options;
    options.condition_timeout = config_.condition_timeout;
    executor_ = std::make_shared<GraphExecutor>(std::move(graph), options);
    coordinator_ = std::make_shared<Coordinator>(mail_manager_, executor_->id(), std::move(handler));
    mail_manager_.add_sources({executor_, coordinator_});
}

bool Session::finished() const {
    return coordinator_->complete() && executor_->state() == ExecutorState::TERMINAL;
}

void Session::step() {
    mail_manager_.collect_all();
    mail_manager_.send_all();
    executor_->forward();
    coordinator_->forward();
}

SessionResult Session::run(nlohmann::json context) {
    if (started_) {
        throw InvalidStateError("session has already run");
    }
    if (!executor_->graph().is_acyclic()) {
        throw RelationError("graph " + executor_->graph().id() + " is not acyclic");
    }
    started_ = true;

    spdlog::info("Session: running graph {} ({} nodes, {} edges)", executor_->graph().id(),
        executor_->graph().node_count(), executor_->graph().edge_count());

    coordinator_->start(std::move(context));

    SessionResult result;
    while (!finished()) {
        if (config_.max_steps > 0 && result.steps >= config_.max_steps) {
            throw InvalidStateError("session did not finish within " +
                std::to_string(config_.max_steps) + " steps");
        }
        step();
        ++result.steps;
    }

    for (const auto& branch : coordinator_->branches()) {
        result.branches.push_back({branch->id(), branch->visited(), branch->history()});
    }
    spdlog::info("Session: finished in {} steps across {} branches", result.steps, result.branches.size());
    return result;
}

} // namespace agentflow::exec
