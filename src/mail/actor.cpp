#include "mail/actor.hpp"
#include <spdlog/spdlog.h>

namespace agentflow::mail {

void Actor::execute(std::chrono::milliseconds refresh_interval) {
    spdlog::debug("Actor {} starting loop (refresh={}ms)", id(), refresh_interval.count());

    while (!stopped()) {
        auto seen = mailbox_.delivery_count();
        forward();
        if (stopped()) {
            break;
        }
        mailbox_.wait_for_delivery(seen, refresh_interval);
    }

    spdlog::debug("Actor {} loop stopped", id());
}

void Actor::stop() {
    execute_stop_ = true;
    mailbox_.notify();
}

std::shared_ptr<Mail> Actor::send(const ElementId& recipient, MailPayload payload) {
    auto mail = std::make_shared<Mail>(id(), recipient, std::move(payload));
    mailbox_.include(mail, MailDirection::OUT);
    spdlog::trace("Actor {} queued {} mail for {}", id(),
        mail_category_to_string(mail->category()), recipient);
    return mail;
}

} // namespace agentflow::mail
