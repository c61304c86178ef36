#include "graph/node.hpp"
#include "core/errors.hpp"

namespace agentflow::graph {

// ============================================================================
// Node
// ============================================================================

Node::Node(nlohmann::json content)
    : content_(std::move(content)) {}

Node::Node(ElementId id, nlohmann::json content)
    : Element(std::move(id))
    , content_(std::move(content)) {}

std::shared_ptr<Node> Node::clone() const {
    return std::make_shared<Node>(*this);
}

nlohmann::json Node::to_json() const {
    auto j = Element::to_json();
    j["type"] = type_name();
    j["content"] = content_;
    if (!metadata_.empty()) {
        j["metadata"] = metadata_;
    }
    return j;
}

// ============================================================================
// ToolNode
// ============================================================================

ToolNode::ToolNode(std::string name, nlohmann::json schema)
    : name_(std::move(name))
    , schema_(std::move(schema)) {
    if (name_.empty()) {
        throw InvalidValueError("tool name required");
    }
}

std::shared_ptr<Node> ToolNode::clone() const {
    return std::make_shared<ToolNode>(*this);
}

nlohmann::json ToolNode::to_json() const {
    auto j = Node::to_json();
    j["name"] = name_;
    j["schema"] = schema_;
    return j;
}

// ============================================================================
// DirectiveNode
// ============================================================================

DirectiveNode::DirectiveNode(std::string directive, nlohmann::json kwargs)
    : directive_(std::move(directive))
    , kwargs_(std::move(kwargs)) {
    if (directive_.empty()) {
        throw InvalidValueError("directive name required");
    }
}

std::shared_ptr<Node> DirectiveNode::clone() const {
    return std::make_shared<DirectiveNode>(*this);
}

nlohmann::json DirectiveNode::to_json() const {
    auto j = Node::to_json();
    j["directive"] = directive_;
    j["kwargs"] = kwargs_;
    return j;
}

// ============================================================================
// ActionNode
// ============================================================================

ActionNode::ActionNode(std::shared_ptr<const Node> instruction)
    : instruction_(std::move(instruction)) {
    if (!instruction_) {
        throw InvalidValueError("action node requires an instruction node");
    }
}

void ActionNode::add_tool(std::shared_ptr<const ToolNode> tool) {
    tools_.push_back(std::move(tool));
}

void ActionNode::set_directive(std::string directive, nlohmann::json kwargs) {
    directive_ = std::move(directive);
    directive_kwargs_ = std::move(kwargs);
}

std::shared_ptr<Node> ActionNode::clone() const {
    return std::make_shared<ActionNode>(*this);
}

nlohmann::json ActionNode::to_json() const {
    auto j = Node::to_json();
    j["instruction"] = instruction_->to_json();
    j["tools"] = nlohmann::json::array();
    for (const auto& tool : tools_) {
        j["tools"].push_back(tool->to_json());
    }
    if (!directive_.empty()) {
        j["directive"] = directive_;
        j["directive_kwargs"] = directive_kwargs_;
    }
    return j;
}

} // namespace agentflow::graph
