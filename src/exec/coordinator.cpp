#include "exec/coordinator.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace agentflow::exec {

Coordinator::Coordinator(mail::MailManager& mail_manager, ElementId executor_id, NodeHandler handler)
    : mail_manager_(mail_manager)
    , executor_id_(std::move(executor_id))
    , handler_(std::move(handler)) {
    if (executor_id_.empty()) {
        throw InvalidValueError("coordinator requires an executor id");
    }
}

std::shared_ptr<Branch> Coordinator::start(nlohmann::json context) {
    if (!branches_.empty()) {
        throw InvalidStateError("coordinator " + id() + " has already started");
    }
    auto root = register_branch(std::make_shared<Branch>(executor_id_, id(), handler_, std::move(context)));
    root->begin();
    spdlog::info("Coordinator {} started root branch {}", id(), root->id());
    return root;
}

std::shared_ptr<Branch> Coordinator::register_branch(std::shared_ptr<Branch> branch) {
    branches_.include(branch);
    mail_manager_.add_source(branch);
    return branch;
}

void Coordinator::forward() {
    for (const auto& sender : mailbox().pending_senders()) {
        while (auto mail = mailbox().pop_in(sender)) {
            std::visit(mail::Overloaded{
                [&](const mail::NodeListPackage& package) {
                    fan_out(mail->sender(), package);
                },
                [&](const mail::EndSignal&) {
                    ++ended_;
                    spdlog::debug("Coordinator {}: branch {} ended ({}/{})", id(), mail->sender(),
                        ended_, branches_.size());
                },
                [&](const auto&) {
                    throw TraversalError(std::string("coordinator cannot handle ") +
                        mail::mail_category_to_string(mail->category()) + " mail",
                        mail->id(), mail::mail_category_to_string(mail->category()));
                },
            }, mail->payload());
        }
    }

    if (!complete_ && !branches_.empty() && ended_ >= branches_.size()) {
        complete_ = true;
        send(executor_id_, mail::EndSignal{});
        spdlog::info("Coordinator {}: all {} branches ended", id(), branches_.size());
        return;
    }

    for (const auto& branch : branches_.values()) {
        if (branch->finished() || !branch->mailbox().has_pending_ins()) {
            continue;
        }
        try {
            branch->forward();
        } catch (const Error& e) {
            spdlog::error("Coordinator {}: branch {} failed: {}", id(), branch->id(), e.what());
            throw;
        }
    }
}

void Coordinator::fan_out(const ElementId& source_id, const mail::NodeListPackage& package) {
    auto source = branches_.get(source_id, nullptr);
    if (!source) {
        throw TraversalError("node list from unknown branch " + source_id, {}, "node_list");
    }
    if (package.nodes.empty()) {
        throw TraversalError("empty node list from branch " + source_id, {}, "node_list");
    }

    // Clones first so each copies the source's pre-fork history
    std::vector<std::shared_ptr<Branch>> forks;
    for (size_t i = 1; i < package.nodes.size(); ++i) {
        forks.push_back(register_branch(source->clone()));
    }

    send(source->id(), mail::NodePackage{package.nodes.front()});
    for (size_t i = 0; i < forks.size(); ++i) {
        send(forks[i]->id(), mail::NodePackage{package.nodes[i + 1]});
    }
    spdlog::info("Coordinator {}: branch {} forked into {} branches", id(), source_id, package.nodes.size());
}

} // namespace agentflow::exec
