#pragma once
#include <functional>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "graph/node.hpp"
#include "mail/actor.hpp"
#include "mail/mail.hpp"

namespace agentflow::exec {

class Branch;

// Performs one node for a branch; the result is appended to its history
using NodeHandler = std::function<nlohmann::json(Branch& branch, const graph::Node& node)>;

enum class BranchState {
    IDLE,
    RUNNING,
    FINISHED
};

const char* branch_state_to_string(BranchState state);

// One line of execution through a graph.
//
// Asks the executor for work, performs each node it is handed and reports
// the node id back. Node lists are passed to the coordinator, which forks
// clones of this branch for the extra nodes. Executable conditions are
// evaluated against state_json().
class Branch : public mail::Actor {
public:
    Branch(ElementId executor_id, ElementId coordinator_id, NodeHandler handler,
           nlohmann::json context = nlohmann::json::object());

    const ElementId& executor_id() const { return executor_id_; }
    const ElementId& coordinator_id() const { return coordinator_id_; }
    BranchState state() const { return state_; }
    bool finished() const { return state_ == BranchState::FINISHED; }

    nlohmann::json& context() { return context_; }
    const nlohmann::json& context() const { return context_; }
    const std::vector<nlohmann::json>& history() const { return history_; }
    const std::vector<ElementId>& visited() const { return visited_; }

    // {"context": ..., "history": [...]}
    nlohmann::json state_json() const;

    // Same executor, coordinator, handler, context and history; new id
    std::shared_ptr<Branch> clone() const;

    // Queue the start mail for the executor
    void begin();

    void forward() override;

private:
    ElementId executor_id_;
    ElementId coordinator_id_;
    NodeHandler handler_;
    nlohmann::json context_;
    std::vector<nlohmann::json> history_;
    std::vector<ElementId> visited_;
    BranchState state_ = BranchState::IDLE;

    void perform(const mail::Mail& mail, const graph::Node& node);
    void evaluate(const mail::Mail& mail, const mail::ConditionPackage& package);
};

} // namespace agentflow::exec
