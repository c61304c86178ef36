#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "mail/mailbox.hpp"

#include <thread>

using namespace agentflow;
using namespace agentflow::mail;

namespace {

std::shared_ptr<Mail> make_mail(const ElementId& sender, const ElementId& recipient, const ElementId& node_id = "n")
{
    return std::make_shared<Mail>(sender, recipient, NodeIdPackage{node_id});
}

} // namespace

TEST(MailTests, Smoke_CategoryFollowsPayload)
{
    Mail start("a", "b", StartSignal{});
    Mail cond("a", "b", ConditionPackage{"edge", nullptr, true});
    EXPECT_EQ(start.category(), MailCategory::START);
    EXPECT_EQ(cond.category(), MailCategory::CONDITION);
    ASSERT_NE(cond.get_if<ConditionPackage>(), nullptr);
    EXPECT_TRUE(*cond.get_if<ConditionPackage>()->result);
    EXPECT_EQ(cond.get_if<NodePackage>(), nullptr);
    EXPECT_STREQ(mail_category_to_string(MailCategory::NODE_LIST), "node_list");
}

TEST(MailTests, Validation_SenderAndRecipientRequired)
{
    EXPECT_THROW(Mail("", "b", EndSignal{}), InvalidValueError);
    EXPECT_THROW(Mail("a", "", EndSignal{}), InvalidValueError);
}

TEST(MailboxTests, Smoke_InAndOutQueuesAreSeparate)
{
    Mailbox box;
    box.include(make_mail("me", "x"), MailDirection::OUT);
    box.include(make_mail("x", "me"), MailDirection::IN);

    EXPECT_EQ(box.size(), 2u);
    EXPECT_EQ(box.pending_out_count(), 1u);
    EXPECT_EQ(box.pending_in_count(), 1u);
    EXPECT_EQ(box.delivery_count(), 1u);
}

TEST(MailboxTests, Ordering_FifoPerSender)
{
    Mailbox box;
    box.include(make_mail("a", "me", "1"), MailDirection::IN);
    box.include(make_mail("b", "me", "x"), MailDirection::IN);
    box.include(make_mail("a", "me", "2"), MailDirection::IN);

    EXPECT_EQ(box.pending_in_count("a"), 2u);
    EXPECT_EQ(box.pop_in("a")->get_if<NodeIdPackage>()->node_id, "1");
    EXPECT_EQ(box.pop_in("a")->get_if<NodeIdPackage>()->node_id, "2");
    EXPECT_EQ(box.pop_in("a"), nullptr);
    EXPECT_EQ(box.pending_senders(), (std::vector<ElementId>{"b"}));
}

TEST(MailboxTests, Ordering_DrainedSenderQueueIsRemoved)
{
    Mailbox box;
    box.include(make_mail("a", "me"), MailDirection::IN);
    box.pop_in("a");
    EXPECT_TRUE(box.pending_senders().empty());
    EXPECT_FALSE(box.has_pending_ins());
    EXPECT_EQ(box.size(), 0u);
}

TEST(MailboxTests, Drain_OutsInSendOrder)
{
    Mailbox box;
    auto first = make_mail("me", "x");
    auto second = make_mail("me", "y");
    box.include(first, MailDirection::OUT);
    box.include(second, MailDirection::OUT);

    auto drained = box.drain_outs();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0], first);
    EXPECT_EQ(drained[1], second);
    EXPECT_FALSE(box.has_pending_outs());
    EXPECT_EQ(box.size(), 0u);
}

TEST(MailboxTests, TakeIf_LeavesOtherMailQueued)
{
    Mailbox box;
    box.include(make_mail("a", "me", "1"), MailDirection::IN);
    box.include(std::make_shared<Mail>("a", "me", ConditionPackage{"edge", nullptr, false}), MailDirection::IN);
    box.include(make_mail("a", "me", "2"), MailDirection::IN);

    auto reply = box.take_in_if([](const Mail& mail) { return mail.category() == MailCategory::CONDITION; });
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->get_if<ConditionPackage>()->edge_id, "edge");
    EXPECT_EQ(box.pending_in_count(), 2u);
    EXPECT_EQ(box.pop_in("a")->get_if<NodeIdPackage>()->node_id, "1");
    EXPECT_EQ(box.take_in_if([](const Mail&) { return false; }), nullptr);
}

TEST(MailboxTests, Exclude_DropsFromQueues)
{
    Mailbox box;
    auto mail = make_mail("a", "me");
    box.include(mail, MailDirection::IN);
    EXPECT_TRUE(box.exclude(mail->id()));
    EXPECT_FALSE(box.exclude(mail->id()));
    EXPECT_FALSE(box.has_pending_ins());
}

TEST(MailboxTests, Wait_WakesOnDelivery)
{
    Mailbox box;
    auto seen = box.delivery_count();
    std::thread producer([&box]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        box.include(make_mail("a", "me"), MailDirection::IN);
    });
    EXPECT_TRUE(box.wait_for_delivery(seen, std::chrono::seconds(5)));
    producer.join();

    EXPECT_FALSE(box.wait_for_delivery(box.delivery_count(), std::chrono::milliseconds(5)));
}
