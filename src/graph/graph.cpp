#include "graph/graph.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <utility>

namespace agentflow::graph {

Graph::Graph()
    : edges_(Pile<Edge>::TypeSet{std::type_index(typeid(Edge))}) {}

void Graph::add_node(std::shared_ptr<Node> node) {
    if (!node) {
        throw RelationError("cannot add a null node");
    }
    try {
        nodes_.insert(static_cast<std::ptrdiff_t>(nodes_.size()), node);
    } catch (const ItemExistsError& e) {
        throw RelationError(std::string("error adding node: ") + e.what());
    }
    relations_.emplace(node->id(), Relations{});
    spdlog::debug("Graph {}: added {} node {}", id(), node->type_name(), node->id());
}

std::shared_ptr<Node> Graph::remove_node(const ElementId& node_id) {
    if (!nodes_.contains(node_id)) {
        throw RelationError("node " + node_id + " not found in the graph");
    }

    // cascade: every edge touching the node goes with it
    Relations rel = relations_.at(node_id);
    for (const auto& edge_id : rel.in) {
        if (edges_.contains(edge_id)) {
            remove_edge(edge_id);
        }
    }
    for (const auto& edge_id : rel.out) {
        if (edges_.contains(edge_id)) {
            remove_edge(edge_id);
        }
    }

    relations_.erase(node_id);
    spdlog::debug("Graph {}: removed node {}", id(), node_id);
    return nodes_.pop(node_id);
}

std::shared_ptr<Edge> Graph::add_edge(const ElementId& head, const ElementId& tail,
                                      std::shared_ptr<const EdgeCondition> condition,
                                      bool bundle,
                                      std::string label) {
    if (!nodes_.contains(head) || !nodes_.contains(tail)) {
        throw RelationError("failed to add edge: head " + head + " or tail " + tail +
            " is not a node of the graph");
    }
    auto edge = std::make_shared<Edge>(head, tail, std::move(condition), bundle, std::move(label));
    add_edge(edge);
    return edge;
}

void Graph::add_edge(std::shared_ptr<Edge> edge) {
    if (!edge) {
        throw RelationError("cannot add a null edge");
    }
    if (!nodes_.contains(edge->head()) || !nodes_.contains(edge->tail())) {
        throw RelationError("failed to add edge: head " + edge->head() + " or tail " +
            edge->tail() + " is not a node of the graph");
    }
    try {
        edges_.insert(static_cast<std::ptrdiff_t>(edges_.size()), edge);
    } catch (const ItemExistsError& e) {
        throw RelationError(std::string("error adding edge: ") + e.what());
    }
    relations_[edge->head()].out.append(edge->id());
    relations_[edge->tail()].in.append(edge->id());
    spdlog::debug("Graph {}: added edge {} -> {}{}", id(), edge->head(), edge->tail(),
        edge->bundle() ? " (bundle)" : "");
}

std::shared_ptr<Edge> Graph::remove_edge(const ElementId& edge_id) {
    auto edge = edges_.get(edge_id, nullptr);
    if (!edge) {
        throw RelationError("edge " + edge_id + " not found in the graph");
    }
    relations_[edge->head()].out.exclude(edge_id);
    relations_[edge->tail()].in.exclude(edge_id);
    return edges_.pop(edge_id);
}

std::shared_ptr<Node> Graph::node(const ElementId& node_id) const {
    return nodes_.get(node_id);
}

std::shared_ptr<Edge> Graph::edge(const ElementId& edge_id) const {
    return edges_.get(edge_id);
}

const Graph::Relations& Graph::relations_of(const ElementId& node_id) const {
    auto it = relations_.find(node_id);
    if (it == relations_.end()) {
        throw RelationError("node " + node_id + " not found in the graph");
    }
    return it->second;
}

std::vector<std::shared_ptr<Edge>> Graph::find_node_edges(const ElementId& node_id,
                                                          EdgeDirection direction) const {
    const auto& rel = relations_of(node_id);

    std::vector<std::shared_ptr<Edge>> result;
    if (direction == EdgeDirection::IN || direction == EdgeDirection::BOTH) {
        for (const auto& edge_id : rel.in) {
            result.push_back(edges_.get(edge_id));
        }
    }
    if (direction == EdgeDirection::OUT || direction == EdgeDirection::BOTH) {
        for (const auto& edge_id : rel.out) {
            result.push_back(edges_.get(edge_id));
        }
    }
    return result;
}

Pile<Node> Graph::get_heads() const {
    std::vector<std::shared_ptr<Node>> heads;
    for (const auto& node : nodes_.values()) {
        if (relations_of(node->id()).in.empty()) {
            heads.push_back(node);
        }
    }
    return Pile<Node>(heads);
}

Pile<Node> Graph::get_predecessors(const ElementId& node_id) const {
    std::vector<std::shared_ptr<Node>> result;
    for (const auto& edge : find_node_edges(node_id, EdgeDirection::IN)) {
        result.push_back(nodes_.get(edge->head()));
    }
    return Pile<Node>(result);
}

Pile<Node> Graph::get_successors(const ElementId& node_id) const {
    std::vector<std::shared_ptr<Node>> result;
    for (const auto& edge : find_node_edges(node_id, EdgeDirection::OUT)) {
        result.push_back(nodes_.get(edge->tail()));
    }
    return Pile<Node>(result);
}

bool Graph::is_acyclic() const {
    enum class Mark : uint8_t { UNVISITED, IN_PROGRESS, DONE };

    std::unordered_map<ElementId, Mark> marks;
    for (const auto& node_id : nodes_.keys()) {
        marks[node_id] = Mark::UNVISITED;
    }

    // (node, index of the next outgoing edge to look at)
    std::vector<std::pair<ElementId, size_t>> stack;

    for (const auto& root : nodes_.keys()) {
        if (marks[root] != Mark::UNVISITED) {
            continue;
        }
        marks[root] = Mark::IN_PROGRESS;
        stack.emplace_back(root, 0);

        while (!stack.empty()) {
            auto& [current, next] = stack.back();
            const auto& out = relations_of(current).out;

            if (next >= out.size()) {
                marks[current] = Mark::DONE;
                stack.pop_back();
                continue;
            }

            const ElementId child = edges_.get(out.get(static_cast<std::ptrdiff_t>(next)))->tail();
            next++;

            Mark& mark = marks[child];
            if (mark == Mark::IN_PROGRESS) {
                spdlog::debug("Graph {}: cycle through node {}", id(), child);
                return false;
            }
            if (mark == Mark::UNVISITED) {
                mark = Mark::IN_PROGRESS;
                stack.emplace_back(child, 0);
            }
        }
    }
    return true;
}

void Graph::clear() {
    nodes_.clear();
    edges_.clear();
    relations_.clear();
}

nlohmann::json Graph::to_json() const {
    auto j = Element::to_json();
    j["nodes"] = nlohmann::json::array();
    for (const auto& node : nodes_.values()) {
        j["nodes"].push_back(node->to_json());
    }
    j["edges"] = nlohmann::json::array();
    for (const auto& edge : edges_.values()) {
        j["edges"].push_back(edge->to_json());
    }
    return j;
}

} // namespace agentflow::graph
