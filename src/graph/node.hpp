#pragma once
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/element.hpp"

namespace agentflow::graph {

// A unit of work/state in a workflow. Edges are held by the owning Graph and
// refer to nodes by id only.
class Node : public Element {
public:
    Node() = default;
    explicit Node(nlohmann::json content);
    Node(ElementId id, nlohmann::json content);

    const nlohmann::json& content() const { return content_; }
    nlohmann::json& content() { return content_; }

    nlohmann::json& metadata() { return metadata_; }
    const nlohmann::json& metadata() const { return metadata_; }

    virtual const char* type_name() const { return "node"; }

    // Copy with the same id; mail always carries clones, never graph nodes
    virtual std::shared_ptr<Node> clone() const;

    nlohmann::json to_json() const override;

private:
    nlohmann::json content_;
    nlohmann::json metadata_ = nlohmann::json::object();
};

// A callable tool attached to a step through a bundle edge
class ToolNode : public Node {
public:
    ToolNode(std::string name, nlohmann::json schema = nlohmann::json::object());

    const std::string& name() const { return name_; }
    const nlohmann::json& schema() const { return schema_; }

    const char* type_name() const override { return "tool"; }
    std::shared_ptr<Node> clone() const override;
    nlohmann::json to_json() const override;

private:
    std::string name_;
    nlohmann::json schema_;
};

// Selects how a step is carried out, attached through a bundle edge
class DirectiveNode : public Node {
public:
    DirectiveNode(std::string directive, nlohmann::json kwargs = nlohmann::json::object());

    const std::string& directive() const { return directive_; }
    const nlohmann::json& kwargs() const { return kwargs_; }

    const char* type_name() const override { return "directive"; }
    std::shared_ptr<Node> clone() const override;
    nlohmann::json to_json() const override;

private:
    std::string directive_;
    nlohmann::json kwargs_;
};

// Composite synthesized during traversal: a step plus everything bundled to it
class ActionNode : public Node {
public:
    explicit ActionNode(std::shared_ptr<const Node> instruction);

    const std::shared_ptr<const Node>& instruction() const { return instruction_; }
    const std::vector<std::shared_ptr<const ToolNode>>& tools() const { return tools_; }
    const std::string& directive() const { return directive_; }
    const nlohmann::json& directive_kwargs() const { return directive_kwargs_; }

    void add_tool(std::shared_ptr<const ToolNode> tool);
    void set_directive(std::string directive, nlohmann::json kwargs);

    const char* type_name() const override { return "action"; }
    std::shared_ptr<Node> clone() const override;
    nlohmann::json to_json() const override;

private:
    std::shared_ptr<const Node> instruction_;
    std::vector<std::shared_ptr<const ToolNode>> tools_;
    std::string directive_;
    nlohmann::json directive_kwargs_ = nlohmann::json::object();
};

} // namespace agentflow::graph
