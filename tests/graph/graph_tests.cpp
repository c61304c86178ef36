#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "graph/graph.hpp"

using namespace agentflow;
using namespace agentflow::graph;
using json = nlohmann::json;

namespace {

std::shared_ptr<Node> make_node(const std::string& name)
{
    return std::make_shared<Node>(json{{"name", name}});
}

} // namespace

TEST(GraphTests, Smoke_AddNodesAndEdges)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    g.add_node(a);
    g.add_node(b);
    auto edge = g.add_edge(a->id(), b->id());

    EXPECT_EQ(g.node_count(), 2u);
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_TRUE(g.contains(a->id()));
    EXPECT_TRUE(g.contains(edge->id()));
    EXPECT_EQ(g.edge(edge->id())->head(), a->id());
    EXPECT_EQ(g.node(b->id()), b);
}

TEST(GraphTests, Relations_EdgeEndpointsMustBeMembers)
{
    Graph g;
    auto a = make_node("a");
    auto outsider = make_node("outsider");
    g.add_node(a);
    EXPECT_THROW(g.add_edge(a->id(), outsider->id()), RelationError);
    EXPECT_THROW(g.add_node(a), RelationError);
    EXPECT_EQ(g.edge_count(), 0u);
}

TEST(GraphTests, Relations_DuplicateEdgeRejected)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    g.add_node(a);
    g.add_node(b);
    auto edge = g.add_edge(a->id(), b->id());
    EXPECT_THROW(g.add_edge(edge), RelationError);
}

TEST(GraphTests, Relations_FindNodeEdgesByDirection)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    auto c = make_node("c");
    g.add_node(a);
    g.add_node(b);
    g.add_node(c);
    auto ab = g.add_edge(a->id(), b->id());
    auto bc = g.add_edge(b->id(), c->id());

    auto in = g.find_node_edges(b->id(), EdgeDirection::IN);
    auto out = g.find_node_edges(b->id(), EdgeDirection::OUT);
    auto both = g.find_node_edges(b->id(), EdgeDirection::BOTH);
    ASSERT_EQ(in.size(), 1u);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(in[0], ab);
    EXPECT_EQ(out[0], bc);
    EXPECT_EQ(both.size(), 2u);
    EXPECT_THROW(g.find_node_edges("missing"), RelationError);
}

TEST(GraphTests, Relations_RemoveNodeCascadesToEdges)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    auto c = make_node("c");
    g.add_node(a);
    g.add_node(b);
    g.add_node(c);
    auto ab = g.add_edge(a->id(), b->id());
    auto bc = g.add_edge(b->id(), c->id());
    auto ac = g.add_edge(a->id(), c->id());

    g.remove_node(b->id());
    EXPECT_FALSE(g.has_edge(ab->id()));
    EXPECT_FALSE(g.has_edge(bc->id()));
    EXPECT_TRUE(g.has_edge(ac->id()));
    EXPECT_EQ(g.find_node_edges(a->id(), EdgeDirection::OUT).size(), 1u);
    EXPECT_EQ(g.find_node_edges(c->id(), EdgeDirection::IN).size(), 1u);
    EXPECT_THROW(g.remove_node(b->id()), RelationError);
}

TEST(GraphTests, Relations_RemoveEdgeUpdatesIndex)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    g.add_node(a);
    g.add_node(b);
    auto ab = g.add_edge(a->id(), b->id());
    g.remove_edge(ab->id());
    EXPECT_TRUE(g.find_node_edges(a->id()).empty());
    EXPECT_THROW(g.remove_edge(ab->id()), RelationError);
    EXPECT_THROW(g.edge(ab->id()), ItemNotFoundError);
}

TEST(GraphTests, Traversal_HeadsPredecessorsSuccessors)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    auto c = make_node("c");
    auto d = make_node("d");
    for (const auto& n : {a, b, c, d}) {
        g.add_node(n);
    }
    g.add_edge(a->id(), c->id());
    g.add_edge(b->id(), c->id());
    g.add_edge(c->id(), d->id());

    auto heads = g.get_heads();
    EXPECT_EQ(heads.keys(), (std::vector<ElementId>{a->id(), b->id()}));
    EXPECT_EQ(g.get_predecessors(c->id()).size(), 2u);
    ASSERT_EQ(g.get_successors(c->id()).size(), 1u);
    EXPECT_EQ(g.get_successors(c->id()).front(), d);
}

TEST(GraphTests, Acyclic_ChainThenCycle)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    auto c = make_node("c");
    g.add_node(a);
    g.add_node(b);
    g.add_node(c);
    g.add_edge(a->id(), b->id());
    g.add_edge(b->id(), c->id());
    EXPECT_TRUE(g.is_acyclic());

    g.add_edge(c->id(), a->id());
    EXPECT_FALSE(g.is_acyclic());
}

TEST(GraphTests, Acyclic_SelfLoopAndDiamond)
{
    Graph diamond;
    auto a = make_node("a");
    auto b = make_node("b");
    auto c = make_node("c");
    auto d = make_node("d");
    for (const auto& n : {a, b, c, d}) {
        diamond.add_node(n);
    }
    diamond.add_edge(a->id(), b->id());
    diamond.add_edge(a->id(), c->id());
    diamond.add_edge(b->id(), d->id());
    diamond.add_edge(c->id(), d->id());
    EXPECT_TRUE(diamond.is_acyclic());

    diamond.add_edge(d->id(), d->id());
    EXPECT_FALSE(diamond.is_acyclic());
}

TEST(GraphTests, Conditions_FactoriesRejectEmptyPredicates)
{
    EXPECT_THROW(make_structure_condition(nullptr), InvalidValueError);
    EXPECT_THROW(make_executable_condition(nullptr), InvalidValueError);

    auto cond = make_executable_condition([](const json& state) { return state.value("ok", false); }, "evaluator");
    EXPECT_EQ(cond->source_type(), ConditionSource::EXECUTABLE);
    EXPECT_EQ(cond->evaluator_id(), "evaluator");
    EXPECT_TRUE(cond->check(json{{"ok", true}}));
}

TEST(GraphTests, Nodes_CloneKeepsIdAndKind)
{
    auto tool = std::make_shared<ToolNode>("search", json{{"q", "string"}});
    auto copy = tool->clone();
    EXPECT_EQ(copy->id(), tool->id());
    EXPECT_STREQ(copy->type_name(), "tool");
    EXPECT_NE(copy.get(), tool.get());
    EXPECT_THROW(ToolNode(""), InvalidValueError);
}

TEST(GraphTests, Export_ToJsonListsNodesAndEdges)
{
    Graph g;
    auto a = make_node("a");
    auto b = make_node("b");
    g.add_node(a);
    g.add_node(b);
    g.add_edge(a->id(), b->id(), nullptr, false, "next");
    auto j = g.to_json();
    EXPECT_EQ(j.at("nodes").size(), 2u);
    ASSERT_EQ(j.at("edges").size(), 1u);
    EXPECT_EQ(j.at("edges")[0].at("label"), "next");
}
