#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "core/pile.hpp"
#include "core/progression.hpp"
#include "mail/mail.hpp"

namespace agentflow::mail {

enum class MailDirection {
    IN,
    OUT
};

// Per-actor inbox/outbox.
//
// Holds the mail itself in a Pile; pending_ins files mail ids per sender
// (FIFO within a sender), pending_outs keeps outgoing ids in send order.
// A sender's queue is dropped once drained.
class Mailbox {
public:
    Mailbox() = default;

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    void include(std::shared_ptr<Mail> mail, MailDirection direction);

    // Drop a held mail from whichever queue has it; false if absent
    bool exclude(const ElementId& mail_id);

    // Outgoing side
    std::vector<std::shared_ptr<Mail>> drain_outs();
    size_t pending_out_count() const;
    bool has_pending_outs() const { return pending_out_count() > 0; }

    // Incoming side
    std::vector<ElementId> pending_senders() const;
    size_t pending_in_count() const;
    size_t pending_in_count(const ElementId& sender) const;
    bool has_pending_ins() const { return pending_in_count() > 0; }

    // Oldest mail from sender, or nullptr when there is none
    std::shared_ptr<Mail> pop_in(const ElementId& sender);

    // Oldest incoming mail (scanning senders in turn) matching predicate;
    // the rest keep their positions
    std::shared_ptr<Mail> take_in_if(const std::function<bool(const Mail&)>& predicate);

    // Number of mails held (in + out)
    size_t size() const { return pile_.size(); }

    // Count of incoming deliveries so far
    uint64_t delivery_count() const;

    // Block until the delivery count moves past seen, notify() is called, or
    // the timeout passes. Returns true if new mail arrived.
    bool wait_for_delivery(uint64_t seen, std::chrono::milliseconds timeout);

    void notify();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Pile<Mail> pile_;
    std::map<ElementId, Progression> pending_ins_;
    Progression pending_outs_;
    uint64_t deliveries_ = 0;
    bool woken_ = false;
};

} // namespace agentflow::mail
