#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/element.hpp"
#include "core/pile.hpp"
#include "core/progression.hpp"
#include "graph/edge.hpp"
#include "graph/node.hpp"

namespace agentflow::graph {

enum class EdgeDirection {
    IN,
    OUT,
    BOTH
};

// Directed graph of nodes and edges.
//
// The graph owns the canonical node and edge Piles plus a node -> edge index;
// nodes and edges refer to each other by id only. Cycles are allowed at build
// time; is_acyclic() must be checked before a graph is executed.
// Not synchronized beyond the Piles: one writer at a time.
class Graph : public Element {
public:
    Graph();

    // Throws RelationError if the node (id) is already in the graph
    void add_node(std::shared_ptr<Node> node);

    // Removes the node and every edge touching it
    std::shared_ptr<Node> remove_node(const ElementId& node_id);

    // Throws RelationError unless head and tail are already graph members
    std::shared_ptr<Edge> add_edge(const ElementId& head, const ElementId& tail,
                                   std::shared_ptr<const EdgeCondition> condition = nullptr,
                                   bool bundle = false,
                                   std::string label = {});
    void add_edge(std::shared_ptr<Edge> edge);

    std::shared_ptr<Edge> remove_edge(const ElementId& edge_id);

    // Throw ItemNotFoundError for unknown ids
    std::shared_ptr<Node> node(const ElementId& node_id) const;
    std::shared_ptr<Edge> edge(const ElementId& edge_id) const;

    bool has_node(const ElementId& id) const { return nodes_.contains(id); }
    bool has_edge(const ElementId& id) const { return edges_.contains(id); }
    bool contains(const ElementId& id) const { return has_node(id) || has_edge(id); }

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    const Pile<Node>& nodes() const { return nodes_; }
    const Pile<Edge>& edges() const { return edges_; }

    // Edges in insertion order; throws RelationError for an unknown node
    std::vector<std::shared_ptr<Edge>> find_node_edges(const ElementId& node_id,
                                                       EdgeDirection direction = EdgeDirection::BOTH) const;

    // Nodes with no incoming edges
    Pile<Node> get_heads() const;
    Pile<Node> get_predecessors(const ElementId& node_id) const;
    Pile<Node> get_successors(const ElementId& node_id) const;

    bool is_acyclic() const;

    void clear();

    nlohmann::json to_json() const override;

private:
    struct Relations {
        Progression in;   // incoming edge ids
        Progression out;  // outgoing edge ids
    };

    Pile<Node> nodes_;
    Pile<Edge> edges_;
    std::unordered_map<ElementId, Relations> relations_;

    const Relations& relations_of(const ElementId& node_id) const;
};

} // namespace agentflow::graph
