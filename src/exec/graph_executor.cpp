#include "exec/graph_executor.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace agentflow::exec {

const char* executor_state_to_string(ExecutorState state) {
    switch (state) {
        case ExecutorState::IDLE: return "idle";
        case ExecutorState::RUNNING: return "running";
        case ExecutorState::TERMINAL: return "terminal";
    }
    return "unknown";
}

namespace {

// Re-raise anything thrown while interpreting mail as a TraversalError
// naming the mail and node involved
template <typename Fn>
void interpret(const mail::Mail& mail, const ElementId& node_id, Fn&& fn) {
    try {
        fn();
    } catch (const TraversalError&) {
        throw;
    } catch (const ConditionTimeoutError&) {
        throw;
    } catch (const std::exception& e) {
        throw TraversalError(
            std::string("failed to handle ") + mail::mail_category_to_string(mail.category()) +
                " mail " + mail.id() + ": " + e.what(),
            mail.id(), mail::mail_category_to_string(mail.category()), node_id);
    } catch (...) {
        throw TraversalError(
            std::string("failed to handle ") + mail::mail_category_to_string(mail.category()) +
                " mail " + mail.id() + ": unknown exception",
            mail.id(), mail::mail_category_to_string(mail.category()), node_id);
    }
}

} // namespace

GraphExecutor::GraphExecutor(graph::Graph graph, ExecutorOptions options)
    : graph_(std::move(graph))
    , options_(options) {}

bool GraphExecutor::traversal_ended(const ElementId& requester) const {
    return ended_.count(requester) > 0;
}

// ============================================================================
// Mail loop
// ============================================================================

void GraphExecutor::forward() {
    if (state_ == ExecutorState::TERMINAL) {
        return;
    }

    if (suspended_) {
        if (!poll_condition()) {
            return;
        }
        resume();
        if (suspended_) {
            return;
        }
    }

    for (const auto& sender : mailbox().pending_senders()) {
        while (auto mail = mailbox().pop_in(sender)) {
            if (mail->get_if<mail::EndSignal>()) {
                state_ = ExecutorState::TERMINAL;
                spdlog::info("Executor {} received end from {}, terminating", id(), sender);
                stop();
                return;
            }
            handle_mail(mail);
            if (suspended_) {
                return;
            }
        }
    }
}

void GraphExecutor::execute(std::chrono::milliseconds refresh_interval) {
    if (!graph_.is_acyclic()) {
        throw RelationError("graph " + graph_.id() + " is not acyclic");
    }
    Actor::execute(refresh_interval);
}

void GraphExecutor::handle_mail(const std::shared_ptr<const mail::Mail>& mail) {
    spdlog::debug("Executor {} handling {} mail from {}", id(),
        mail::mail_category_to_string(mail->category()), mail->sender());

    std::visit(mail::Overloaded{
        [&](const mail::StartSignal&) {
            interpret(*mail, {}, [&] {
                if (ended_.count(mail->sender())) {
                    throw TraversalError("traversal for " + mail->sender() + " has already ended");
                }
                state_ = ExecutorState::RUNNING;
                Step step;
                step.mail = mail;
                for (const auto& head : graph_.get_heads().values()) {
                    step.next_nodes.push_back(merge_bundles(head));
                }
                emit(step);
            });
        },
        [&](const mail::EndSignal&) {},
        [&](const mail::NodePackage& package) {
            ElementId node_id;
            if (package.node) {
                auto action = std::dynamic_pointer_cast<const graph::ActionNode>(package.node);
                node_id = action ? action->instruction()->id() : package.node->id();
            }
            interpret(*mail, node_id, [&] {
                if (!package.node) {
                    throw InvalidValueError("node mail carries no node");
                }
                begin_step(mail, node_id);
            });
        },
        [&](const mail::NodeIdPackage& package) {
            interpret(*mail, package.node_id, [&] { begin_step(mail, package.node_id); });
        },
        [&](const mail::NodeListPackage&) {
            throw TraversalError("a node list cannot be interpreted by the executor",
                mail->id(), mail::mail_category_to_string(mail->category()));
        },
        [&](const mail::ConditionPackage& package) {
            throw TraversalError("unexpected condition mail for edge " + package.edge_id,
                mail->id(), mail::mail_category_to_string(mail->category()));
        },
    }, mail->payload());
}

// ============================================================================
// Next-node computation
// ============================================================================

void GraphExecutor::begin_step(const std::shared_ptr<const mail::Mail>& mail, const ElementId& node_id) {
    if (ended_.count(mail->sender())) {
        throw TraversalError("traversal for " + mail->sender() + " has already ended");
    }
    if (!graph_.has_node(node_id)) {
        throw ItemNotFoundError("node " + node_id + " is not in graph " + graph_.id());
    }
    state_ = ExecutorState::RUNNING;

    Step step;
    step.mail = mail;
    step.node_id = node_id;
    step.edges = graph_.find_node_edges(node_id, graph::EdgeDirection::OUT);

    if (!run_step(step)) {
        suspended_ = std::move(step);
        return;
    }
    emit(step);
}

// false when the step stopped on an executable condition
bool GraphExecutor::run_step(Step& step) {
    while (step.next_edge < step.edges.size()) {
        const auto& edge = step.edges[step.next_edge];
        if (edge->bundle()) {
            ++step.next_edge;
            continue;
        }

        if (edge->has_condition()) {
            const auto& condition = edge->condition();
            switch (condition->source_type()) {
                case graph::ConditionSource::STRUCTURE: {
                    auto structure = std::dynamic_pointer_cast<const graph::StructureCondition>(condition);
                    if (!structure) {
                        throw InvalidValueError("edge " + edge->id() + " has a malformed structure condition");
                    }
                    if (!structure->check(graph_, *edge)) {
                        ++step.next_edge;
                        continue;
                    }
                    break;
                }
                case graph::ConditionSource::EXECUTABLE: {
                    auto executable = std::dynamic_pointer_cast<const graph::ExecutableCondition>(condition);
                    if (!executable) {
                        throw InvalidValueError("edge " + edge->id() + " has a malformed executable condition");
                    }
                    request_condition(step, *edge, *executable);
                    return false;
                }
            }
        }

        take_edge(step, *edge);
        ++step.next_edge;
    }
    return true;
}

void GraphExecutor::take_edge(Step& step, const graph::Edge& edge) const {
    step.next_nodes.push_back(merge_bundles(graph_.node(edge.tail())));
}

std::shared_ptr<const graph::Node> GraphExecutor::merge_bundles(const std::shared_ptr<graph::Node>& node) const {
    std::vector<std::shared_ptr<const graph::Node>> bundled;
    for (const auto& edge : graph_.find_node_edges(node->id(), graph::EdgeDirection::OUT)) {
        if (edge->bundle()) {
            bundled.push_back(graph_.node(edge->tail())->clone());
        }
    }
    if (bundled.empty()) {
        return node->clone();
    }
    return parse_bundled_to_action(node->clone(), bundled);
}

std::shared_ptr<graph::ActionNode> GraphExecutor::parse_bundled_to_action(
    const std::shared_ptr<const graph::Node>& instruction,
    const std::vector<std::shared_ptr<const graph::Node>>& bundled) {
    auto action = std::make_shared<graph::ActionNode>(instruction);
    for (const auto& node : bundled) {
        if (auto directive = std::dynamic_pointer_cast<const graph::DirectiveNode>(node)) {
            action->set_directive(directive->directive(), directive->kwargs());
        } else if (auto tool = std::dynamic_pointer_cast<const graph::ToolNode>(node)) {
            action->add_tool(tool);
        } else {
            throw TraversalError(std::string("cannot bundle a ") + (node ? node->type_name() : "null") +
                " node into an action", {}, {}, instruction ? instruction->id() : ElementId{});
        }
    }
    return action;
}

void GraphExecutor::emit(const Step& step) {
    const auto& requester = step.mail->sender();
    if (step.next_nodes.empty()) {
        send(requester, mail::EndSignal{});
        ended_.insert(requester);
        spdlog::info("Executor {}: traversal for {} reached the end", id(), requester);
    } else if (step.next_nodes.size() == 1) {
        send(requester, mail::NodePackage{step.next_nodes.front()});
    } else {
        spdlog::debug("Executor {}: {} next nodes for {}", id(), step.next_nodes.size(), requester);
        send(requester, mail::NodeListPackage{step.next_nodes});
    }
}

// ============================================================================
// Executable conditions
// ============================================================================

void GraphExecutor::request_condition(const Step& step, const graph::Edge& edge,
                                      const graph::ExecutableCondition& condition) {
    const auto& evaluator = condition.evaluator_id().empty() ? step.mail->sender()
                                                             : condition.evaluator_id();

    std::promise<bool> promise;
    condition_result_ = promise.get_future();
    pending_conditions_.clear();
    pending_conditions_.emplace(edge.id(), std::move(promise));
    condition_deadline_ = std::chrono::steady_clock::now() + options_.condition_timeout;

    send(evaluator, mail::ConditionPackage{edge.id(), std::make_shared<graph::Edge>(edge), std::nullopt});
    spdlog::debug("Executor {}: asked {} to evaluate condition on edge {}", id(), evaluator, edge.id());
}

// true once the outstanding condition has a result
bool GraphExecutor::poll_condition() {
    while (auto reply = mailbox().take_in_if([this](const mail::Mail& mail) {
               auto package = mail.get_if<mail::ConditionPackage>();
               return package && package->result && pending_conditions_.count(package->edge_id) > 0;
           })) {
        auto package = reply->get_if<mail::ConditionPackage>();
        auto it = pending_conditions_.find(package->edge_id);
        it->second.set_value(*package->result);
        pending_conditions_.erase(it);
    }

    if (condition_result_.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
        return true;
    }

    if (std::chrono::steady_clock::now() >= condition_deadline_) {
        auto edge_id = pending_conditions_.empty() ? ElementId{} : pending_conditions_.begin()->first;
        pending_conditions_.clear();
        suspended_.reset();
        spdlog::error("Executor {}: no condition reply for edge {} within {}ms", id(), edge_id,
            options_.condition_timeout.count());
        throw ConditionTimeoutError("condition on edge " + edge_id + " timed out", edge_id);
    }
    return false;
}

void GraphExecutor::resume() {
    Step step = std::move(*suspended_);
    suspended_.reset();

    interpret(*step.mail, step.node_id, [&] {
        bool passed = condition_result_.get();
        const auto& edge = step.edges[step.next_edge];
        spdlog::debug("Executor {}: condition on edge {} -> {}", id(), edge->id(), passed);
        if (passed) {
            take_edge(step, *edge);
        }
        ++step.next_edge;

        if (!run_step(step)) {
            suspended_ = std::move(step);
            return;
        }
        emit(step);
    });
}

} // namespace agentflow::exec
