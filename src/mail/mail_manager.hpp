#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "core/pile.hpp"
#include "core/progression.hpp"
#include "mail/actor.hpp"
#include "mail/mail.hpp"

namespace agentflow::mail {

// Routes mail between registered actors.
//
// collect() moves a source's outbox into per-recipient, per-sender queues;
// send() drains a recipient's queues into its inbox. Delivery is at most once
// per call and FIFO within one (sender, recipient) pair only.
class MailManager {
public:
    MailManager() = default;
    explicit MailManager(const std::vector<std::shared_ptr<Actor>>& sources);

    // Non-copyable
    MailManager(const MailManager&) = delete;
    MailManager& operator=(const MailManager&) = delete;

    void add_sources(const std::vector<std::shared_ptr<Actor>>& sources);
    void add_source(std::shared_ptr<Actor> source);

    // Unregister and drop the mail queued for it; false if unknown
    bool delete_source(const ElementId& source_id);

    bool has_source(const ElementId& source_id) const { return sources_.contains(source_id); }
    size_t source_count() const { return sources_.size(); }

    static std::shared_ptr<Mail> create_mail(const ElementId& sender, const ElementId& recipient,
                                             MailPayload payload);

    // Throws ItemNotFoundError for an unknown sender, or after filing when a
    // mail names an unregistered recipient (that mail is dropped)
    void collect(const ElementId& sender_id);

    // Throws ItemNotFoundError for an unknown recipient
    void send(const ElementId& recipient_id);

    void collect_all();
    void send_all();

    // collect_all -> send_all -> sleep until stop()
    void execute(std::chrono::milliseconds refresh_interval);
    void stop() { execute_stop_ = true; }
    bool stopped() const { return execute_stop_; }

    // Mail waiting to be sent to recipient, across all senders
    size_t pending_count(const ElementId& recipient_id) const;
    size_t pending_count(const ElementId& recipient_id, const ElementId& sender_id) const;

private:
    Pile<Actor> sources_;
    Pile<Mail> in_transit_;
    // recipient -> sender -> mail ids
    std::unordered_map<ElementId, std::unordered_map<ElementId, Progression>> mails_;
    mutable std::mutex mutex_;
    std::atomic<bool> execute_stop_{false};
};

} // namespace agentflow::mail
