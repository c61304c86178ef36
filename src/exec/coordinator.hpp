#pragma once
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/pile.hpp"
#include "exec/branch.hpp"
#include "mail/actor.hpp"
#include "mail/mail_manager.hpp"

namespace agentflow::exec {

// Owns the branches of one run.
//
// Forks a branch per extra node when a node list comes back, counts branch
// ends, and sends end to the executor once every branch has finished.
class Coordinator : public mail::Actor {
public:
    Coordinator(mail::MailManager& mail_manager, ElementId executor_id, NodeHandler handler);

    // Create and register the root branch; its start mail is queued
    std::shared_ptr<Branch> start(nlohmann::json context = nlohmann::json::object());

    // Handles node_list/end mail, then forwards every branch with pending mail
    void forward() override;

    bool complete() const { return complete_; }
    size_t branch_count() const { return branches_.size(); }
    size_t ended_count() const { return ended_; }
    std::vector<std::shared_ptr<Branch>> branches() const { return branches_.values(); }

private:
    mail::MailManager& mail_manager_;
    ElementId executor_id_;
    NodeHandler handler_;
    Pile<Branch> branches_;
    size_t ended_ = 0;
    bool complete_ = false;

    std::shared_ptr<Branch> register_branch(std::shared_ptr<Branch> branch);
    void fan_out(const ElementId& source_id, const mail::NodeListPackage& package);
};

} // namespace agentflow::exec
