#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "exec/graph_executor.hpp"
#include "mail/mail_manager.hpp"

#include <algorithm>
#include <thread>

using namespace agentflow;
using namespace agentflow::exec;
using namespace agentflow::mail;
using json = nlohmann::json;

namespace {

// Stands in for a branch: keeps whatever the executor sends back
class Requester : public Actor {
public:
    void forward() override
    {
        for (const auto& sender : mailbox().pending_senders()) {
            while (auto mail = mailbox().pop_in(sender)) {
                received.push_back(mail);
            }
        }
    }

    std::shared_ptr<Mail> last() const { return received.empty() ? nullptr : received.back(); }

    std::vector<std::shared_ptr<Mail>> received;
};

std::shared_ptr<graph::Node> add_node(graph::Graph& g, const std::string& name)
{
    auto node = std::make_shared<graph::Node>(json{{"name", name}});
    g.add_node(node);
    return node;
}

struct Harness {
    explicit Harness(graph::Graph g, std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
        : executor(std::make_shared<GraphExecutor>(std::move(g), ExecutorOptions{timeout}))
        , requester(std::make_shared<Requester>())
    {
        manager.add_sources({executor, requester});
    }

    // requester -> executor -> requester
    void round()
    {
        manager.collect_all();
        manager.send_all();
        executor->forward();
        manager.collect_all();
        manager.send_all();
        requester->forward();
    }

    MailManager manager;
    std::shared_ptr<GraphExecutor> executor;
    std::shared_ptr<Requester> requester;
};

} // namespace

TEST(GraphExecutorTests, Start_SendsHeadNode)
{
    graph::Graph g;
    auto head = add_node(g, "head");
    Harness h(g);

    h.requester->send(h.executor->id(), StartSignal{});
    h.round();

    ASSERT_EQ(h.requester->received.size(), 1u);
    auto package = h.requester->last()->get_if<NodePackage>();
    ASSERT_NE(package, nullptr);
    EXPECT_EQ(package->node->id(), head->id());
    EXPECT_NE(package->node.get(), head.get());
    EXPECT_EQ(h.executor->state(), ExecutorState::RUNNING);
}

TEST(GraphExecutorTests, Start_EmptyGraphEndsImmediately)
{
    Harness h(graph::Graph{});
    h.requester->send(h.executor->id(), StartSignal{});
    h.round();

    ASSERT_EQ(h.requester->received.size(), 1u);
    EXPECT_EQ(h.requester->last()->category(), MailCategory::END);
    EXPECT_TRUE(h.executor->traversal_ended(h.requester->id()));
}

TEST(GraphExecutorTests, Start_SeveralHeadsGiveNodeList)
{
    graph::Graph g;
    add_node(g, "a");
    add_node(g, "b");
    Harness h(g);

    h.requester->send(h.executor->id(), StartSignal{});
    h.round();

    auto package = h.requester->last()->get_if<NodeListPackage>();
    ASSERT_NE(package, nullptr);
    EXPECT_EQ(package->nodes.size(), 2u);
}

TEST(GraphExecutorTests, Termination_NodeWithoutSuccessorsGivesExactlyOneEnd)
{
    graph::Graph g;
    auto head = add_node(g, "head");
    Harness h(g);

    h.requester->send(h.executor->id(), NodeIdPackage{head->id()});
    h.round();

    ASSERT_EQ(h.requester->received.size(), 1u);
    EXPECT_EQ(h.requester->last()->category(), MailCategory::END);

    // nothing more is produced after end
    h.round();
    EXPECT_EQ(h.requester->received.size(), 1u);

    h.requester->send(h.executor->id(), NodeIdPackage{head->id()});
    h.manager.collect_all();
    h.manager.send_all();
    EXPECT_THROW(h.executor->forward(), TraversalError);
}

TEST(GraphExecutorTests, Termination_StartedHeadWithoutSuccessorsGivesExactlyOneEnd)
{
    graph::Graph g;
    auto head = add_node(g, "head");
    Harness h(g);

    h.requester->send(h.executor->id(), StartSignal{});
    h.round();

    ASSERT_EQ(h.requester->received.size(), 1u);
    auto package = h.requester->last()->get_if<NodePackage>();
    ASSERT_NE(package, nullptr);
    EXPECT_EQ(package->node->id(), head->id());
    EXPECT_FALSE(h.executor->traversal_ended(h.requester->id()));

    h.requester->send(h.executor->id(), NodeIdPackage{head->id()});
    h.round();

    ASSERT_EQ(h.requester->received.size(), 2u);
    EXPECT_EQ(h.requester->last()->category(), MailCategory::END);
    EXPECT_TRUE(h.executor->traversal_ended(h.requester->id()));

    h.round();
    EXPECT_EQ(h.requester->received.size(), 2u);
    auto ends = std::count_if(h.requester->received.begin(), h.requester->received.end(),
        [](const std::shared_ptr<Mail>& mail) { return mail->category() == MailCategory::END; });
    EXPECT_EQ(ends, 1);
}

TEST(GraphExecutorTests, Traversal_FollowsChain)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto b = add_node(g, "b");
    g.add_edge(a->id(), b->id());
    Harness h(g);

    h.requester->send(h.executor->id(), NodePackage{a});
    h.round();
    auto package = h.requester->last()->get_if<NodePackage>();
    ASSERT_NE(package, nullptr);
    EXPECT_EQ(package->node->id(), b->id());
}

TEST(GraphExecutorTests, Bundle_MergedIntoActionNode)
{
    graph::Graph g;
    auto step = add_node(g, "step");
    auto next = add_node(g, "next");
    auto tool = std::make_shared<graph::ToolNode>("search");
    auto directive = std::make_shared<graph::DirectiveNode>("chat", json{{"temperature", 0}});
    g.add_node(tool);
    g.add_node(directive);
    g.add_edge(step->id(), tool->id(), nullptr, true);
    g.add_edge(step->id(), directive->id(), nullptr, true);
    g.add_edge(step->id(), next->id());
    Harness h(g);

    h.requester->send(h.executor->id(), StartSignal{});
    h.round();

    auto package = h.requester->last()->get_if<NodePackage>();
    ASSERT_NE(package, nullptr);
    auto action = std::dynamic_pointer_cast<const graph::ActionNode>(package->node);
    ASSERT_NE(action, nullptr);
    EXPECT_EQ(action->instruction()->id(), step->id());
    ASSERT_EQ(action->tools().size(), 1u);
    EXPECT_EQ(action->tools()[0]->name(), "search");
    EXPECT_EQ(action->directive(), "chat");

    // bundle edges are not steps of their own
    h.requester->send(h.executor->id(), NodeIdPackage{step->id()});
    h.round();
    package = h.requester->last()->get_if<NodePackage>();
    ASSERT_NE(package, nullptr);
    EXPECT_EQ(package->node->id(), next->id());
}

TEST(GraphExecutorTests, Bundle_OtherNodeKindIsTraversalError)
{
    graph::Graph g;
    auto step = add_node(g, "step");
    auto plain = add_node(g, "plain");
    g.add_edge(step->id(), plain->id(), nullptr, true);
    Harness h(g);

    h.requester->send(h.executor->id(), StartSignal{});
    h.manager.collect_all();
    h.manager.send_all();
    EXPECT_THROW(h.executor->forward(), TraversalError);
}

TEST(GraphExecutorTests, Bundle_ParseBundledToAction)
{
    auto instruction = std::make_shared<graph::Node>(json{{"task", "write"}});
    std::vector<std::shared_ptr<const graph::Node>> bundled{
        std::make_shared<graph::ToolNode>("a"),
        std::make_shared<graph::ToolNode>("b"),
    };
    auto action = GraphExecutor::parse_bundled_to_action(instruction, bundled);
    EXPECT_EQ(action->tools().size(), 2u);
    EXPECT_EQ(action->instruction(), instruction);

    bundled.push_back(std::make_shared<graph::Node>(json{}));
    EXPECT_THROW(GraphExecutor::parse_bundled_to_action(instruction, bundled), TraversalError);
}

TEST(GraphExecutorTests, Conditions_StructureEvaluatedLocally)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto yes = add_node(g, "yes");
    auto no = add_node(g, "no");
    g.add_edge(a->id(), yes->id(),
        graph::make_structure_condition([](const graph::Graph&, const graph::Edge&) { return true; }));
    g.add_edge(a->id(), no->id(),
        graph::make_structure_condition([](const graph::Graph&, const graph::Edge&) { return false; }));
    Harness h(g);

    h.requester->send(h.executor->id(), NodeIdPackage{a->id()});
    h.round();

    auto package = h.requester->last()->get_if<NodePackage>();
    ASSERT_NE(package, nullptr);
    EXPECT_EQ(package->node->id(), yes->id());
}

TEST(GraphExecutorTests, Conditions_ExecutableWaitsForReply)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto b = add_node(g, "b");
    auto edge = g.add_edge(a->id(), b->id(), graph::make_executable_condition([](const json&) { return true; }));
    Harness h(g);

    h.requester->send(h.executor->id(), NodeIdPackage{a->id()});
    h.round();

    auto request = h.requester->last()->get_if<ConditionPackage>();
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(request->edge_id, edge->id());
    EXPECT_FALSE(request->result.has_value());
    EXPECT_TRUE(h.executor->awaiting_condition());

    // other mail waits while the executor is blocked on the condition
    h.requester->send(h.executor->id(), NodeIdPackage{b->id()});
    h.round();
    EXPECT_EQ(h.requester->received.size(), 1u);
    EXPECT_EQ(h.executor->mailbox().pending_in_count(), 1u);

    h.requester->send(h.executor->id(), ConditionPackage{edge->id(), nullptr, true});
    h.round();

    EXPECT_FALSE(h.executor->awaiting_condition());
    ASSERT_EQ(h.requester->received.size(), 3u);
    auto next = h.requester->received[1]->get_if<NodePackage>();
    ASSERT_NE(next, nullptr);
    EXPECT_EQ(next->node->id(), b->id());
    EXPECT_EQ(h.requester->received[2]->category(), MailCategory::END);
}

TEST(GraphExecutorTests, Conditions_FalseReplySkipsEdge)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto b = add_node(g, "b");
    auto edge = g.add_edge(a->id(), b->id(), graph::make_executable_condition([](const json&) { return false; }));
    Harness h(g);

    h.requester->send(h.executor->id(), NodeIdPackage{a->id()});
    h.round();
    h.requester->send(h.executor->id(), ConditionPackage{edge->id(), nullptr, false});
    h.round();

    EXPECT_EQ(h.requester->last()->category(), MailCategory::END);
}

TEST(GraphExecutorTests, Conditions_RoutedToExplicitEvaluator)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto b = add_node(g, "b");
    auto evaluator = std::make_shared<Requester>();
    g.add_edge(a->id(), b->id(),
        graph::make_executable_condition([](const json&) { return true; }, evaluator->id()));
    Harness h(g);
    h.manager.add_source(evaluator);

    h.requester->send(h.executor->id(), NodeIdPackage{a->id()});
    h.round();
    evaluator->forward();

    EXPECT_TRUE(h.requester->received.empty());
    ASSERT_EQ(evaluator->received.size(), 1u);
    EXPECT_EQ(evaluator->last()->category(), MailCategory::CONDITION);
}

TEST(GraphExecutorTests, Conditions_TimeoutRaises)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto b = add_node(g, "b");
    auto edge = g.add_edge(a->id(), b->id(), graph::make_executable_condition([](const json&) { return true; }));
    Harness h(g, std::chrono::milliseconds(20));

    h.requester->send(h.executor->id(), NodeIdPackage{a->id()});
    h.round();
    ASSERT_TRUE(h.executor->awaiting_condition());

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    try {
        h.executor->forward();
        FAIL() << "expected ConditionTimeoutError";
    } catch (const ConditionTimeoutError& e) {
        EXPECT_EQ(e.edge_id(), edge->id());
        EXPECT_EQ(e.code(), ErrorCode::CONDITION_TIMEOUT);
    }
}

TEST(GraphExecutorTests, Errors_WrappedWithMailContext)
{
    graph::Graph g;
    add_node(g, "a");
    Harness h(g);

    auto mail = h.requester->send(h.executor->id(), NodeIdPackage{"unknown-node"});
    h.manager.collect_all();
    h.manager.send_all();
    try {
        h.executor->forward();
        FAIL() << "expected TraversalError";
    } catch (const TraversalError& e) {
        EXPECT_EQ(e.mail_id(), mail->id());
        EXPECT_EQ(e.category(), "node_id");
        EXPECT_EQ(e.node_id(), "unknown-node");
    }
}

TEST(GraphExecutorTests, Errors_NonStandardThrowWrappedWithMailContext)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto b = add_node(g, "b");
    g.add_edge(a->id(), b->id(),
        graph::make_structure_condition([](const graph::Graph&, const graph::Edge&) -> bool { throw 1; }));
    Harness h(g);

    auto mail = h.requester->send(h.executor->id(), NodeIdPackage{a->id()});
    h.manager.collect_all();
    h.manager.send_all();
    try {
        h.executor->forward();
        FAIL() << "expected TraversalError";
    } catch (const TraversalError& e) {
        EXPECT_EQ(e.mail_id(), mail->id());
        EXPECT_EQ(e.category(), "node_id");
        EXPECT_EQ(e.node_id(), a->id());
        EXPECT_NE(std::string(e.what()).find("unknown exception"), std::string::npos);
    }
}

TEST(GraphExecutorTests, Errors_NodeListIsNotInterpretable)
{
    Harness h(graph::Graph{});
    h.requester->send(h.executor->id(), NodeListPackage{});
    h.manager.collect_all();
    h.manager.send_all();
    EXPECT_THROW(h.executor->forward(), TraversalError);
}

TEST(GraphExecutorTests, State_EndMailTerminates)
{
    Harness h(graph::Graph{});
    h.requester->send(h.executor->id(), EndSignal{});
    h.round();
    EXPECT_EQ(h.executor->state(), ExecutorState::TERMINAL);
    EXPECT_TRUE(h.executor->stopped());
    EXPECT_STREQ(executor_state_to_string(h.executor->state()), "terminal");
}

TEST(GraphExecutorTests, State_CyclicGraphRefusesToExecute)
{
    graph::Graph g;
    auto a = add_node(g, "a");
    auto b = add_node(g, "b");
    g.add_edge(a->id(), b->id());
    g.add_edge(b->id(), a->id());
    GraphExecutor executor(g);
    EXPECT_THROW(executor.execute(std::chrono::milliseconds(1)), RelationError);
}

TEST(GraphExecutorTests, State_ExecuteLoopStopsOnEnd)
{
    Harness h(graph::Graph{});
    std::thread loop([&h]() { h.executor->execute(std::chrono::milliseconds(5)); });

    h.requester->send(h.executor->id(), EndSignal{});
    h.manager.collect_all();
    h.manager.send_all();
    loop.join();
    EXPECT_EQ(h.executor->state(), ExecutorState::TERMINAL);
}
