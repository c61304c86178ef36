#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/element.hpp"
#include "graph/edge.hpp"
#include "graph/node.hpp"

namespace agentflow::mail {

enum class MailCategory {
    START,
    END,
    NODE,
    NODE_LIST,
    NODE_ID,
    CONDITION
};

const char* mail_category_to_string(MailCategory category);

// Begin a traversal; context seeds the requesting branch
struct StartSignal {
    nlohmann::json context = nlohmann::json::object();
};

struct EndSignal {};

struct NodePackage {
    std::shared_ptr<const graph::Node> node;
};

struct NodeListPackage {
    std::vector<std::shared_ptr<const graph::Node>> nodes;
};

// The node the sender has finished; traversal continues from it
struct NodeIdPackage {
    ElementId node_id;
};

// Request (edge set, no result) or reply (result set) for an executable condition
struct ConditionPackage {
    ElementId edge_id;
    std::shared_ptr<const graph::Edge> edge;
    std::optional<bool> result;
};

using MailPayload = std::variant<StartSignal, EndSignal, NodePackage, NodeListPackage,
                                 NodeIdPackage, ConditionPackage>;

MailCategory category_of(const MailPayload& payload);

// Exhaustive std::visit over lambdas
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// One addressed message; immutable once created
class Mail : public Element {
public:
    Mail(ElementId sender, ElementId recipient, MailPayload payload);

    const ElementId& sender() const { return sender_; }
    const ElementId& recipient() const { return recipient_; }
    const MailPayload& payload() const { return payload_; }
    MailCategory category() const { return category_of(payload_); }

    template <typename P>
    const P* get_if() const { return std::get_if<P>(&payload_); }

    nlohmann::json to_json() const override;

private:
    const ElementId sender_;
    const ElementId recipient_;
    const MailPayload payload_;
};

} // namespace agentflow::mail
