#include "exec/branch.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace agentflow::exec {

const char* branch_state_to_string(BranchState state) {
    switch (state) {
        case BranchState::IDLE: return "idle";
        case BranchState::RUNNING: return "running";
        case BranchState::FINISHED: return "finished";
    }
    return "unknown";
}

Branch::Branch(ElementId executor_id, ElementId coordinator_id, NodeHandler handler,
               nlohmann::json context)
    : executor_id_(std::move(executor_id))
    , coordinator_id_(std::move(coordinator_id))
    , handler_(std::move(handler))
    , context_(std::move(context)) {
    if (executor_id_.empty() || coordinator_id_.empty()) {
        throw InvalidValueError("branch requires an executor and a coordinator");
    }
    if (!handler_) {
        throw InvalidValueError("branch requires a node handler");
    }
}

nlohmann::json Branch::state_json() const {
    return {
        {"context", context_},
        {"history", history_}
    };
}

std::shared_ptr<Branch> Branch::clone() const {
    auto branch = std::make_shared<Branch>(executor_id_, coordinator_id_, handler_, context_);
    branch->history_ = history_;
    branch->visited_ = visited_;
    branch->state_ = state_;
    return branch;
}

void Branch::begin() {
    state_ = BranchState::RUNNING;
    send(executor_id_, mail::StartSignal{context_});
    spdlog::debug("Branch {} requested start from {}", id(), executor_id_);
}

void Branch::forward() {
    for (const auto& sender : mailbox().pending_senders()) {
        while (auto mail = mailbox().pop_in(sender)) {
            std::visit(mail::Overloaded{
                [&](const mail::NodePackage& package) {
                    if (!package.node) {
                        throw TraversalError("node mail carries no node", mail->id(), "node");
                    }
                    perform(*mail, *package.node);
                },
                [&](const mail::NodeListPackage& package) {
                    spdlog::debug("Branch {} forking on {} nodes", id(), package.nodes.size());
                    send(coordinator_id_, package);
                },
                [&](const mail::ConditionPackage& package) {
                    evaluate(*mail, package);
                },
                [&](const mail::EndSignal&) {
                    state_ = BranchState::FINISHED;
                    send(coordinator_id_, mail::EndSignal{});
                    spdlog::info("Branch {} finished after {} nodes", id(), visited_.size());
                    stop();
                },
                [&](const mail::StartSignal&) {
                    throw TraversalError("branch cannot handle start mail", mail->id(), "start");
                },
                [&](const mail::NodeIdPackage& package) {
                    throw TraversalError("branch cannot handle node_id mail", mail->id(), "node_id",
                        package.node_id);
                },
            }, mail->payload());

            if (finished()) {
                return;
            }
        }
    }
}

void Branch::perform(const mail::Mail& mail, const graph::Node& node) {
    ElementId node_id = node.id();
    if (auto action = dynamic_cast<const graph::ActionNode*>(&node)) {
        node_id = action->instruction()->id();
    }

    nlohmann::json result;
    try {
        result = handler_(*this, node);
    } catch (const std::exception& e) {
        throw TraversalError("branch " + id() + " failed to perform node " + node_id + ": " + e.what(),
            mail.id(), "node", node_id);
    } catch (...) {
        throw TraversalError("branch " + id() + " failed to perform node " + node_id + ": unknown exception",
            mail.id(), "node", node_id);
    }

    history_.push_back(std::move(result));
    visited_.push_back(node_id);
    send(executor_id_, mail::NodeIdPackage{node_id});
}

void Branch::evaluate(const mail::Mail& mail, const mail::ConditionPackage& package) {
    if (package.result || !package.edge) {
        throw TraversalError("malformed condition request for edge " + package.edge_id,
            mail.id(), "condition");
    }
    auto condition = std::dynamic_pointer_cast<const graph::ExecutableCondition>(
        package.edge->condition());
    if (!condition) {
        throw TraversalError("edge " + package.edge_id + " has no executable condition",
            mail.id(), "condition");
    }

    bool passed = false;
    try {
        passed = condition->check(state_json());
    } catch (const std::exception& e) {
        throw TraversalError("condition on edge " + package.edge_id + " failed: " + e.what(),
            mail.id(), "condition");
    } catch (...) {
        throw TraversalError("condition on edge " + package.edge_id + " failed: unknown exception",
            mail.id(), "condition");
    }

    send(mail.sender(), mail::ConditionPackage{package.edge_id, nullptr, passed});
}

} // namespace agentflow::exec
