#include "mail/mailbox.hpp"
#include "core/errors.hpp"

namespace agentflow::mail {

void Mailbox::include(std::shared_ptr<Mail> mail, MailDirection direction) {
    if (!mail) {
        throw InvalidValueError("cannot queue a null mail");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pile_.include(mail);
        if (direction == MailDirection::OUT) {
            pending_outs_.append(mail->id());
            return;
        }
        pending_ins_[mail->sender()].append(mail->id());
        deliveries_++;
    }
    cv_.notify_all();
}

bool Mailbox::exclude(const ElementId& mail_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pile_.exclude(mail_id)) {
        return false;
    }
    pending_outs_.exclude(mail_id);
    for (auto it = pending_ins_.begin(); it != pending_ins_.end();) {
        it->second.exclude(mail_id);
        if (it->second.empty()) {
            it = pending_ins_.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

std::vector<std::shared_ptr<Mail>> Mailbox::drain_outs() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Mail>> result;
    result.reserve(pending_outs_.size());
    while (!pending_outs_.empty()) {
        result.push_back(pile_.pop(pending_outs_.popleft()));
    }
    return result;
}

size_t Mailbox::pending_out_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_outs_.size();
}

std::vector<ElementId> Mailbox::pending_senders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ElementId> senders;
    senders.reserve(pending_ins_.size());
    for (const auto& [sender, queue] : pending_ins_) {
        senders.push_back(sender);
    }
    return senders;
}

size_t Mailbox::pending_in_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [sender, queue] : pending_ins_) {
        count += queue.size();
    }
    return count;
}

size_t Mailbox::pending_in_count(const ElementId& sender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_ins_.find(sender);
    return it == pending_ins_.end() ? 0 : it->second.size();
}

std::shared_ptr<Mail> Mailbox::pop_in(const ElementId& sender) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_ins_.find(sender);
    if (it == pending_ins_.end()) {
        return nullptr;
    }
    auto mail = pile_.pop(it->second.popleft());
    if (it->second.empty()) {
        pending_ins_.erase(it);
    }
    return mail;
}

std::shared_ptr<Mail> Mailbox::take_in_if(const std::function<bool(const Mail&)>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pending_ins_.begin(); it != pending_ins_.end(); ++it) {
        // ids are copied: the queue is modified before returning
        for (ElementId mail_id : it->second) {
            auto mail = pile_.get(mail_id);
            if (!predicate(*mail)) {
                continue;
            }
            it->second.remove(mail_id);
            pile_.pop(mail_id);
            if (it->second.empty()) {
                pending_ins_.erase(it);
            }
            return mail;
        }
    }
    return nullptr;
}

uint64_t Mailbox::delivery_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveries_;
}

bool Mailbox::wait_for_delivery(uint64_t seen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this, seen]() { return deliveries_ != seen || woken_; });
    woken_ = false;
    return deliveries_ != seen;
}

void Mailbox::notify() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        woken_ = true;
    }
    cv_.notify_all();
}

} // namespace agentflow::mail
