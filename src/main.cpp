#include <spdlog/spdlog.h>
#include "config/runtime_config.hpp"
#include "core/errors.hpp"
#include "exec/session.hpp"
#include "graph/graph.hpp"
#include "util/logger.hpp"
#include "work/worker.hpp"

using json = nlohmann::json;
using namespace agentflow;

namespace {

// draft -> (review | publish), review bundled with a lint tool and a
// directive; publish only taken when the draft looks long enough
graph::Graph build_workflow() {
    graph::Graph workflow;

    auto draft = std::make_shared<graph::Node>(json{{"step", "draft"}, {"words", 420}});
    auto review = std::make_shared<graph::Node>(json{{"step", "review"}});
    auto publish = std::make_shared<graph::Node>(json{{"step", "publish"}});
    auto archive = std::make_shared<graph::Node>(json{{"step", "archive"}});
    auto lint = std::make_shared<graph::ToolNode>("lint", json{{"strict", true}});
    auto directive = std::make_shared<graph::DirectiveNode>("chat", json{{"temperature", 0.2}});

    for (const auto& node : std::vector<std::shared_ptr<graph::Node>>{draft, review, publish, archive, lint, directive}) {
        workflow.add_node(node);
    }

    workflow.add_edge(draft->id(), review->id(),
        graph::make_structure_condition([](const graph::Graph& g, const graph::Edge& edge) {
            return g.node(edge.head())->content().value("words", 0) > 0;
        }), false, "needs_review");
    workflow.add_edge(draft->id(), publish->id(),
        graph::make_executable_condition([](const json& state) {
            const auto& history = state.at("history");
            return !history.empty() && history.back().value("words", 0) >= 300;
        }), false, "long_enough");
    workflow.add_edge(review->id(), lint->id(), nullptr, true);
    workflow.add_edge(review->id(), directive->id(), nullptr, true);
    workflow.add_edge(publish->id(), archive->id());

    return workflow;
}

json perform_node(exec::Branch& branch, const graph::Node& node) {
    json result = node.content();
    if (auto action = dynamic_cast<const graph::ActionNode*>(&node)) {
        result = action->instruction()->content();
        json tools = json::array();
        for (const auto& tool : action->tools()) {
            tools.push_back(tool->name());
        }
        result["tools"] = tools;
        result["directive"] = action->directive();
    }
    spdlog::info("Branch {} performed {}", branch.id(), result.dump());
    return result;
}

void run_work_batch(const config::RuntimeConfig& config) {
    work::Worker worker("demo");
    worker.add_function("square", [](const json& args) {
        auto value = args.at("value").get<int>();
        if (value < 0) {
            throw InvalidValueError("negative input");
        }
        return json{{"square", value * value}};
    }, config.work_capacity, config.work_refresh_interval);

    for (int value : {3, -1, 7, 12}) {
        worker.submit("square", {{"value", value}});
    }
    while (worker.is_progressable()) {
        worker.forward();
    }

    auto& log = worker.log("square");
    for (const auto& item : log.completed_work()) {
        spdlog::info("Work {} completed: {}", item->id(), item->result().dump());
    }
    for (const auto& item : log.failed_work()) {
        spdlog::warn("Work {} failed: {}", item->id(), item->error());
    }
}

} // namespace

int main(int argc, char** argv) {
    util::init_logger();

    spdlog::info("=================================");
    spdlog::info("  agentflow demo v0.1.0");
    spdlog::info("=================================");

    try {
        config::RuntimeConfig config;
        if (argc > 1) {
            config = config::load_config(argv[1]);
        }
        config::apply_env_overrides(config);
        util::set_log_level(util::parse_log_level(config.log_level));
        spdlog::info("Config: {}", config::to_json(config).dump());

        exec::Session session(build_workflow(), perform_node, config);
        auto result = session.run({{"topic", "release notes"}});
        spdlog::info("Session result: {}", result.to_json().dump());

        run_work_batch(config);
    } catch (const Error& e) {
        spdlog::error("agentflow error ({}): {}", error_code_to_string(e.code()), e.what());
        return 1;
    }

    return 0;
}
