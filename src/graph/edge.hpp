#pragma once
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/element.hpp"

namespace agentflow::graph {

class Graph;
class Edge;

// Where an edge condition is evaluated
enum class ConditionSource {
    STRUCTURE,   // locally, against the graph
    EXECUTABLE   // remotely, by an actor answering a condition mail
};

const char* condition_source_to_string(ConditionSource source);

class EdgeCondition {
public:
    virtual ~EdgeCondition() = default;
    virtual ConditionSource source_type() const = 0;
};

class StructureCondition : public EdgeCondition {
public:
    ConditionSource source_type() const override { return ConditionSource::STRUCTURE; }
    virtual bool check(const Graph& graph, const Edge& edge) const = 0;
};

// Evaluated against the state of the actor it is sent to. An empty
// evaluator id means "whoever asked for the next step".
class ExecutableCondition : public EdgeCondition {
public:
    explicit ExecutableCondition(ElementId evaluator_id = {})
        : evaluator_id_(std::move(evaluator_id)) {}

    ConditionSource source_type() const override { return ConditionSource::EXECUTABLE; }
    const ElementId& evaluator_id() const { return evaluator_id_; }

    virtual bool check(const nlohmann::json& state) const = 0;

private:
    ElementId evaluator_id_;
};

using StructurePredicate = std::function<bool(const Graph&, const Edge&)>;
using ExecutablePredicate = std::function<bool(const nlohmann::json&)>;

std::shared_ptr<StructureCondition> make_structure_condition(StructurePredicate predicate);
std::shared_ptr<ExecutableCondition> make_executable_condition(ExecutablePredicate predicate,
                                                               ElementId evaluator_id = {});

// Directed relation head -> tail. A bundle edge attaches its tail to the
// head's step instead of being a step of its own.
class Edge : public Element {
public:
    Edge(ElementId head, ElementId tail,
         std::shared_ptr<const EdgeCondition> condition = nullptr,
         bool bundle = false,
         std::string label = {});

    const ElementId& head() const { return head_; }
    const ElementId& tail() const { return tail_; }
    const std::shared_ptr<const EdgeCondition>& condition() const { return condition_; }
    bool has_condition() const { return condition_ != nullptr; }
    bool bundle() const { return bundle_; }
    const std::string& label() const { return label_; }

    nlohmann::json to_json() const override;

private:
    ElementId head_;
    ElementId tail_;
    std::shared_ptr<const EdgeCondition> condition_;
    bool bundle_;
    std::string label_;
};

} // namespace agentflow::graph
