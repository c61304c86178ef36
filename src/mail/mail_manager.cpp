#include "mail/mail_manager.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace agentflow::mail {

MailManager::MailManager(const std::vector<std::shared_ptr<Actor>>& sources) {
    add_sources(sources);
}

void MailManager::add_sources(const std::vector<std::shared_ptr<Actor>>& sources) {
    for (const auto& source : sources) {
        add_source(source);
    }
}

void MailManager::add_source(std::shared_ptr<Actor> source) {
    if (!source) {
        throw InvalidValueError("cannot register a null source");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sources_.include(source);
    mails_.try_emplace(source->id());
    spdlog::debug("MailManager: registered source {}", source->id());
}

bool MailManager::delete_source(const ElementId& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sources_.exclude(source_id)) {
        return false;
    }
    auto it = mails_.find(source_id);
    if (it != mails_.end()) {
        for (const auto& [sender, queue] : it->second) {
            for (const auto& mail_id : queue) {
                in_transit_.exclude(mail_id);
            }
        }
        mails_.erase(it);
    }
    spdlog::debug("MailManager: removed source {}", source_id);
    return true;
}

std::shared_ptr<Mail> MailManager::create_mail(const ElementId& sender, const ElementId& recipient,
                                               MailPayload payload) {
    return std::make_shared<Mail>(sender, recipient, std::move(payload));
}

void MailManager::collect(const ElementId& sender_id) {
    auto source = sources_.get(sender_id, nullptr);
    if (!source) {
        throw ItemNotFoundError("sender source " + sender_id + " does not exist");
    }

    std::vector<ElementId> unknown;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& mail : source->mailbox().drain_outs()) {
            auto bucket = mails_.find(mail->recipient());
            if (bucket == mails_.end()) {
                spdlog::error("MailManager: dropping {} mail from {}: recipient {} is not registered",
                    mail_category_to_string(mail->category()), sender_id, mail->recipient());
                unknown.push_back(mail->recipient());
                continue;
            }
            in_transit_.include(mail);
            bucket->second[sender_id].append(mail->id());
        }
    }

    if (!unknown.empty()) {
        throw ItemNotFoundError("recipient source " + unknown.front() + " does not exist");
    }
}

void MailManager::send(const ElementId& recipient_id) {
    auto recipient = sources_.get(recipient_id, nullptr);
    if (!recipient) {
        throw ItemNotFoundError("recipient source " + recipient_id + " does not exist");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = mails_.find(recipient_id);
    if (bucket == mails_.end() || bucket->second.empty()) {
        return;
    }

    size_t delivered = 0;
    for (auto& [sender, queue] : bucket->second) {
        while (!queue.empty()) {
            recipient->mailbox().include(in_transit_.pop(queue.popleft()), MailDirection::IN);
            delivered++;
        }
    }
    // drained sender queues are removed
    bucket->second.clear();

    spdlog::trace("MailManager: delivered {} mail(s) to {}", delivered, recipient_id);
}

void MailManager::collect_all() {
    for (const auto& source_id : sources_.keys()) {
        collect(source_id);
    }
}

void MailManager::send_all() {
    for (const auto& source_id : sources_.keys()) {
        send(source_id);
    }
}

void MailManager::execute(std::chrono::milliseconds refresh_interval) {
    spdlog::info("MailManager starting (sources={}, refresh={}ms)",
        sources_.size(), refresh_interval.count());

    while (!stopped()) {
        collect_all();
        send_all();
        std::this_thread::sleep_for(refresh_interval);
    }

    spdlog::info("MailManager stopped");
}

size_t MailManager::pending_count(const ElementId& recipient_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = mails_.find(recipient_id);
    if (bucket == mails_.end()) {
        return 0;
    }
    size_t count = 0;
    for (const auto& [sender, queue] : bucket->second) {
        count += queue.size();
    }
    return count;
}

size_t MailManager::pending_count(const ElementId& recipient_id, const ElementId& sender_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = mails_.find(recipient_id);
    if (bucket == mails_.end()) {
        return 0;
    }
    auto queue = bucket->second.find(sender_id);
    return queue == bucket->second.end() ? 0 : queue->second.size();
}

} // namespace agentflow::mail
