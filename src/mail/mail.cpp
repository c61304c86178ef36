#include "mail/mail.hpp"
#include "core/errors.hpp"

namespace agentflow::mail {

const char* mail_category_to_string(MailCategory category) {
    switch (category) {
        case MailCategory::START: return "start";
        case MailCategory::END: return "end";
        case MailCategory::NODE: return "node";
        case MailCategory::NODE_LIST: return "node_list";
        case MailCategory::NODE_ID: return "node_id";
        case MailCategory::CONDITION: return "condition";
    }
    return "unknown";
}

MailCategory category_of(const MailPayload& payload) {
    return std::visit(Overloaded{
        [](const StartSignal&) { return MailCategory::START; },
        [](const EndSignal&) { return MailCategory::END; },
        [](const NodePackage&) { return MailCategory::NODE; },
        [](const NodeListPackage&) { return MailCategory::NODE_LIST; },
        [](const NodeIdPackage&) { return MailCategory::NODE_ID; },
        [](const ConditionPackage&) { return MailCategory::CONDITION; },
    }, payload);
}

Mail::Mail(ElementId sender, ElementId recipient, MailPayload payload)
    : sender_(std::move(sender))
    , recipient_(std::move(recipient))
    , payload_(std::move(payload)) {
    if (sender_.empty() || recipient_.empty()) {
        throw InvalidValueError("mail requires a sender and a recipient");
    }
}

nlohmann::json Mail::to_json() const {
    auto j = Element::to_json();
    j["sender"] = sender_;
    j["recipient"] = recipient_;
    j["category"] = mail_category_to_string(category());

    std::visit(Overloaded{
        [&j](const StartSignal& p) { j["package"] = p.context; },
        [&j](const EndSignal&) { j["package"] = "end"; },
        [&j](const NodePackage& p) { j["package"] = p.node ? p.node->to_json() : nlohmann::json(); },
        [&j](const NodeListPackage& p) {
            j["package"] = nlohmann::json::array();
            for (const auto& node : p.nodes) {
                j["package"].push_back(node->to_json());
            }
        },
        [&j](const NodeIdPackage& p) { j["package"] = p.node_id; },
        [&j](const ConditionPackage& p) {
            j["package"]["edge_id"] = p.edge_id;
            if (p.result) {
                j["package"]["check_result"] = *p.result;
            }
        },
    }, payload_);
    return j;
}

} // namespace agentflow::mail
