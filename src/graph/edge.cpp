#include "graph/edge.hpp"
#include "core/errors.hpp"

namespace agentflow::graph {

const char* condition_source_to_string(ConditionSource source) {
    switch (source) {
        case ConditionSource::STRUCTURE: return "structure";
        case ConditionSource::EXECUTABLE: return "executable";
    }
    return "unknown";
}

namespace {

class FunctionStructureCondition final : public StructureCondition {
public:
    explicit FunctionStructureCondition(StructurePredicate predicate)
        : predicate_(std::move(predicate)) {}

    bool check(const Graph& graph, const Edge& edge) const override {
        return predicate_(graph, edge);
    }

private:
    StructurePredicate predicate_;
};

class FunctionExecutableCondition final : public ExecutableCondition {
public:
    FunctionExecutableCondition(ExecutablePredicate predicate, ElementId evaluator_id)
        : ExecutableCondition(std::move(evaluator_id))
        , predicate_(std::move(predicate)) {}

    bool check(const nlohmann::json& state) const override {
        return predicate_(state);
    }

private:
    ExecutablePredicate predicate_;
};

} // namespace

std::shared_ptr<StructureCondition> make_structure_condition(StructurePredicate predicate) {
    if (!predicate) {
        throw InvalidValueError("structure condition requires a predicate");
    }
    return std::make_shared<FunctionStructureCondition>(std::move(predicate));
}

std::shared_ptr<ExecutableCondition> make_executable_condition(ExecutablePredicate predicate,
                                                               ElementId evaluator_id) {
    if (!predicate) {
        throw InvalidValueError("executable condition requires a predicate");
    }
    return std::make_shared<FunctionExecutableCondition>(std::move(predicate), std::move(evaluator_id));
}

Edge::Edge(ElementId head, ElementId tail,
           std::shared_ptr<const EdgeCondition> condition,
           bool bundle,
           std::string label)
    : head_(std::move(head))
    , tail_(std::move(tail))
    , condition_(std::move(condition))
    , bundle_(bundle)
    , label_(std::move(label)) {
    if (head_.empty() || tail_.empty()) {
        throw InvalidValueError("edge head and tail are required");
    }
}

nlohmann::json Edge::to_json() const {
    auto j = Element::to_json();
    j["head"] = head_;
    j["tail"] = tail_;
    j["bundle"] = bundle_;
    if (!label_.empty()) {
        j["label"] = label_;
    }
    if (condition_) {
        j["condition"] = condition_source_to_string(condition_->source_type());
    }
    return j;
}

} // namespace agentflow::graph
