#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include "core/element.hpp"
#include "mail/mail.hpp"
#include "mail/mailbox.hpp"

namespace agentflow::mail {

// Anything a MailManager can route mail to and from
class Actor : public Element {
public:
    Actor() = default;
    virtual ~Actor() = default;

    // Non-copyable
    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    Mailbox& mailbox() { return mailbox_; }
    const Mailbox& mailbox() const { return mailbox_; }

    // Process whatever is in the inbox right now
    virtual void forward() = 0;

    // Run forward() until stopped, sleeping on the mailbox between steps
    virtual void execute(std::chrono::milliseconds refresh_interval);

    // Checked once per loop iteration; an in-flight forward() is not interrupted
    void stop();
    bool stopped() const { return execute_stop_; }

    // Queue a mail in the outbox
    std::shared_ptr<Mail> send(const ElementId& recipient, MailPayload payload);

private:
    Mailbox mailbox_;
    std::atomic<bool> execute_stop_{false};
};

} // namespace agentflow::mail
