#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "skills/builtin_skills.hpp"
#include "skills/intent_router.hpp"
#include "test_util.hpp"

using namespace voxgate;
using nlohmann::json;

namespace {

// Accepts text starting with its name; fails with a chosen error when asked.
class EchoSkill : public skills::Skill {
public:
    explicit EchoSkill(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }
    bool can_handle(const std::string& text) const override { return text.rfind(name_, 0) == 0; }

    json handle(const std::string& text, const json& /*context*/) override {
        calls++;
        return {{"echo", text}, {"by", name_}};
    }

    json invoke(const json& args, const json& context) override {
        if (args.value("fail", false)) {
            throw core::SandboxExecutionError(9, "boom");
        }
        if (args.value("crash", false)) {
            throw std::runtime_error("unexpected");
        }
        if (args.value("throw_int", false)) {
            throw 7;
        }
        return handle(args.value("text", ""), context);
    }

    int calls = 0;

private:
    std::string name_;
};

class IntentRouterTest : public ::testing::Test {
protected:
    IntentRouterTest() : router_(events_) {
        router_.add_skill(std::make_shared<skills::NoteSkill>(dir_ / "notes.md"));
        router_.add_skill(std::make_shared<skills::TimeSkill>(clock_.now_fn()));
        router_.add_skill(std::make_shared<skills::CalcSkill>());
        router_.add_skill(std::make_shared<skills::OpenUrlSkill>());
    }

    testutil::TempDir dir_;
    testutil::ManualClock clock_;
    audit::SecurityEventLog events_;
    skills::IntentRouter router_;
};

} // namespace

TEST_F(IntentRouterTest, RoutesToBuiltins) {
    EXPECT_EQ(router_.route("what time is it").skill, "time");
    EXPECT_EQ(router_.route("2 + 2 * 3").skill, "calc");
    EXPECT_EQ(router_.route("2 + 2 * 3").result["result"], 8);
    EXPECT_EQ(router_.route("open https://example.com/docs").result["url"], "https://example.com/docs");
}

TEST_F(IntentRouterTest, FirstMatchWinsInPriorityOrder) {
    // Both note and time accept this; note is registered first.
    auto routed = router_.route("remember the time of the meeting");
    EXPECT_EQ(routed.skill, "note");
    EXPECT_EQ(routed.result["text"], "the time of the meeting");
}

TEST_F(IntentRouterTest, UnmatchedTextFallsBack) {
    auto routed = router_.route("sing me a song");
    EXPECT_EQ(routed.skill, "fallback");
    EXPECT_EQ(routed.result["message"], "no matching skill");
}

TEST_F(IntentRouterTest, TimeSkillReportsUtc) {
    auto result = router_.route("clock").result;
    EXPECT_EQ(result["time_iso"], "2023-11-14T22:13:20Z");
    EXPECT_EQ(result["time_human"], "22:13 UTC, Tuesday 14 November 2023");
}

TEST_F(IntentRouterTest, NotesAppendLines) {
    EXPECT_EQ(router_.route("note: buy milk").result["line"], 1);
    EXPECT_EQ(router_.route("Remember call home").result["line"], 2);
    EXPECT_EQ(testutil::read_file(dir_ / "notes.md"), "buy milk\ncall home\n");
}

TEST_F(IntentRouterTest, PlanResultsMatchStepsAndIsolateFailures) {
    auto echo = std::make_shared<EchoSkill>("echo");
    router_.add_skill(echo);

    std::vector<skills::PlanStep> steps = {
        {"echo", {{"text", "one"}}},
        {"missing", json::object()},
        {"echo", {{"fail", true}}},
        {"calc", {{"expression", "1/0"}}},
        {"echo", {{"crash", true}}},
        {"calc", {{"expression", "6 * 7"}}},
        {"echo", {{"throw_int", true}}},
    };
    auto results = router_.execute_plan(steps);

    ASSERT_EQ(results.size(), steps.size());
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(std::get<json>(results[0].outcome)["echo"], "one");

    ASSERT_FALSE(results[1].ok());
    EXPECT_EQ(std::get<skills::StepError>(results[1].outcome).code, "SKILL_NOT_FOUND");
    EXPECT_EQ(events_.entries(audit::events::SKILL_NOT_FOUND).size(), 1u);

    EXPECT_EQ(std::get<skills::StepError>(results[2].outcome).code, "SANDBOX_EXECUTION_ERROR");
    EXPECT_EQ(std::get<skills::StepError>(results[3].outcome).code, "INVALID_REQUEST");
    EXPECT_EQ(std::get<skills::StepError>(results[4].outcome).code, "INTERNAL");

    ASSERT_TRUE(results[5].ok());
    EXPECT_EQ(results[5].to_json()["result"]["result"], 42);
    EXPECT_EQ(results[5].to_json()["skill"], "calc");

    ASSERT_FALSE(results[6].ok());
    EXPECT_EQ(std::get<skills::StepError>(results[6].outcome).code, "INTERNAL");
}

TEST_F(IntentRouterTest, EmptyPlanYieldsEmptyResults) {
    EXPECT_TRUE(router_.execute_plan({}).empty());
}

TEST_F(IntentRouterTest, ParsePlanValidatesShape) {
    auto plan = skills::IntentRouter::parse_plan(
        json::parse(R"([{"skill": "time"}, {"skill": "calc", "args": {"expression": "1+1"}}])"));
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_TRUE(plan[0].args.is_object());
    EXPECT_EQ(plan[1].args["expression"], "1+1");

    EXPECT_THROW(skills::IntentRouter::parse_plan(json::object()), core::InvalidRequest);
    EXPECT_THROW(skills::IntentRouter::parse_plan(json::parse(R"([{"args": {}}])")), core::InvalidRequest);
    EXPECT_THROW(skills::IntentRouter::parse_plan(json::parse(R"([{"skill": "x", "args": 3}])")),
                 core::InvalidRequest);
}

TEST_F(IntentRouterTest, DuplicateNamesIgnored) {
    router_.add_skill(std::make_shared<skills::CalcSkill>());
    EXPECT_EQ(router_.skill_names(), (std::vector<std::string>{"note", "time", "calc", "open_url"}));
}
