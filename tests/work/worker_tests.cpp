#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "work/worker.hpp"

using namespace agentflow;
using namespace agentflow::work;
using json = nlohmann::json;

TEST(WorkerTests, Smoke_SubmitAndForward)
{
    Worker worker("math");
    worker.add_function("double", [](const json& args) {
        return json{{"result", args.at("x").get<int>() * 2}};
    });

    auto item = worker.submit("double", {{"x", 21}});
    EXPECT_TRUE(worker.is_progressable());
    worker.forward();

    EXPECT_EQ(item->status(), WorkStatus::COMPLETED);
    EXPECT_EQ(item->result().at("result"), 42);
    EXPECT_EQ(item->name(), "double");
    EXPECT_FALSE(worker.is_progressable());
}

TEST(WorkerTests, Functions_EachHasItsOwnLog)
{
    Worker worker;
    worker.add_function("a", [](const json&) { return json{}; }, 1);
    worker.add_function("b", [](const json&) { return json{}; }, 1);
    EXPECT_THROW(worker.add_function("a", [](const json&) { return json{}; }), ItemExistsError);
    EXPECT_EQ(worker.function_names(), (std::vector<std::string>{"a", "b"}));

    worker.submit("a");
    worker.submit("a");
    worker.submit("b");
    EXPECT_EQ(worker.log("a").size(), 2u);
    EXPECT_EQ(worker.log("b").size(), 1u);

    worker.forward();
    EXPECT_EQ(worker.log("a").completed_work().size(), 1u);
    EXPECT_TRUE(worker.is_progressable());
    worker.forward();
    EXPECT_FALSE(worker.is_progressable());
}

TEST(WorkerTests, Errors_UnknownFunctionAndStopped)
{
    Worker worker;
    worker.add_function("noop", [](const json&) { return json{}; });
    EXPECT_THROW(worker.submit("missing"), ItemNotFoundError);
    EXPECT_THROW(worker.log("missing"), ItemNotFoundError);

    worker.submit("noop");
    worker.stop();
    EXPECT_TRUE(worker.stopped());
    EXPECT_FALSE(worker.is_progressable());
    EXPECT_THROW(worker.submit("noop"), InvalidStateError);
}

TEST(WorkerTests, Failure_RecordedOnItem)
{
    Worker worker;
    worker.add_function("fragile", [](const json& args) -> json {
        if (args.value("fail", false)) {
            throw InvalidValueError("asked to fail");
        }
        return json{{"ok", true}};
    });
    auto bad = worker.submit("fragile", {{"fail", true}});
    auto good = worker.submit("fragile");
    worker.forward();

    EXPECT_EQ(bad->status(), WorkStatus::FAILED);
    EXPECT_EQ(bad->error(), "asked to fail");
    EXPECT_EQ(good->status(), WorkStatus::COMPLETED);
}
