#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "graph/graph.hpp"
#include "graph/node.hpp"
#include "mail/actor.hpp"
#include "mail/mail.hpp"

namespace agentflow::exec {

// Executor state
enum class ExecutorState {
    IDLE,
    RUNNING,
    TERMINAL
};

const char* executor_state_to_string(ExecutorState state);

struct ExecutorOptions {
    std::chrono::milliseconds condition_timeout{30000};
};

// Walks a Graph on request, driven entirely by inbox mail.
//
//   start            -> head node(s) back to the sender
//   node / node_id   -> the next node(s) after that one, end when there are none
//   end              -> executor turns TERMINAL and stops
//
// Outgoing edges marked bundle are skipped as steps; the bundle edges of each
// next node are merged into it as one ActionNode. An executable condition
// sends a condition mail and blocks this executor until the matching reply
// arrives (or condition_timeout passes); other mail stays queued meanwhile.
//
// The executor owns its graph for the whole run. Errors while interpreting a
// mail surface as TraversalError and are fatal to the executor.
class GraphExecutor : public mail::Actor {
public:
    explicit GraphExecutor(graph::Graph graph, ExecutorOptions options = {});

    const graph::Graph& graph() const { return graph_; }
    ExecutorState state() const { return state_; }

    // Waiting on an executable condition reply
    bool awaiting_condition() const { return suspended_.has_value(); }

    // An end mail has been sent to this requester
    bool traversal_ended(const ElementId& requester) const;

    void forward() override;

    // Throws RelationError if the graph has a cycle
    void execute(std::chrono::milliseconds refresh_interval) override;

    // instruction + directive/tool nodes -> one ActionNode.
    // Throws TraversalError for any other bundled node kind.
    static std::shared_ptr<graph::ActionNode> parse_bundled_to_action(
        const std::shared_ptr<const graph::Node>& instruction,
        const std::vector<std::shared_ptr<const graph::Node>>& bundled);

private:
    // Next-node computation for one mail; survives a condition round trip
    struct Step {
        std::shared_ptr<const mail::Mail> mail;
        ElementId node_id;
        std::vector<std::shared_ptr<graph::Edge>> edges;
        size_t next_edge = 0;
        std::vector<std::shared_ptr<const graph::Node>> next_nodes;
    };

    graph::Graph graph_;
    ExecutorOptions options_;
    ExecutorState state_ = ExecutorState::IDLE;
    std::unordered_set<ElementId> ended_;

    std::optional<Step> suspended_;
    // edge id -> reply channel for the outstanding condition request
    std::unordered_map<ElementId, std::promise<bool>> pending_conditions_;
    std::future<bool> condition_result_;
    std::chrono::steady_clock::time_point condition_deadline_;

    void handle_mail(const std::shared_ptr<const mail::Mail>& mail);
    void begin_step(const std::shared_ptr<const mail::Mail>& mail, const ElementId& node_id);
    bool run_step(Step& step);
    void take_edge(Step& step, const graph::Edge& edge) const;
    void request_condition(const Step& step, const graph::Edge& edge,
                           const graph::ExecutableCondition& condition);
    bool poll_condition();
    void resume();
    void emit(const Step& step);

    std::shared_ptr<const graph::Node> merge_bundles(const std::shared_ptr<graph::Node>& node) const;
};

} // namespace agentflow::exec
