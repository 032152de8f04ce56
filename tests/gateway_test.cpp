#include <gtest/gtest.h>
#include "gateway/gateway.hpp"
#include "test_util.hpp"

using namespace voxgate;
using nlohmann::json;

namespace {

const std::filesystem::path STUB_PATH = VOXGATE_SKILL_STUB_PATH;

const std::string ADMIN_KEY = "vg_aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
const std::string USER_KEY  = "vg_bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
const std::string DEMO_KEY  = "vg_cccccccccccccccccccccccccccccccccccccccc";

class GatewayTest : public ::testing::Test {
protected:
    GatewayTest() {
        std::filesystem::create_directories(skills_dir_ / "stub");
        testutil::write_file(skills_dir_ / "stub" / "skill.json",
            json{{"command", json::array({STUB_PATH.string()})},
                 {"triggers", json::array({"stub"})},
                 {"description", "test plugin"}}.dump());
        std::filesystem::create_directories(skills_dir_ / "sleepy");
        testutil::write_file(skills_dir_ / "sleepy" / "skill.json",
            json{{"command", json::array({STUB_PATH.string()})}, {"timeout_s", 0.3}}.dump());

        gateway::GatewayConfig config;
        config.state_dir = state_dir_.path();
        config.skills_dir = skills_dir_.path();
        config.token_secret = "gateway-test-secret";
        config.sandbox_allow = {STUB_PATH.filename().string()};
        config.sandbox_bin_dirs = {STUB_PATH.parent_path().string()};

        auth::CredentialTable credentials;
        credentials.set("voxgate_admin", ADMIN_KEY, "admin");
        credentials.set("voxgate_user", USER_KEY, "user");
        credentials.set("voxgate_demo", DEMO_KEY, "demo");

        context_ = std::make_unique<gateway::GatewayContext>(config, credentials, clock_.now_fn());
        gateway_ = std::make_unique<gateway::Gateway>(*context_);
    }

    json call(const std::string& op, const std::string& credential, json body = json::object(),
              const std::string& ip = "192.168.1.20") {
        gateway::Request request;
        request.op = op;
        request.credential = credential;
        request.source_ip = ip;
        request.body = std::move(body);
        return gateway_->handle(request);
    }

    static std::string error_code(const json& response) {
        return response["error"]["code"].get<std::string>();
    }

    testutil::ManualClock clock_;
    testutil::TempDir state_dir_;
    testutil::TempDir skills_dir_;
    std::unique_ptr<gateway::GatewayContext> context_;
    std::unique_ptr<gateway::Gateway> gateway_;
};

} // namespace

TEST_F(GatewayTest, ValidKeyCompletesWithRateLimitFeedback) {
    auto response = call("skills.list", USER_KEY);
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    EXPECT_EQ(response["stage"], "completed");
    EXPECT_EQ(response["rate_limit"]["limit"], 100);
    EXPECT_EQ(response["rate_limit"]["remaining"], 99);

    std::vector<std::string> names;
    for (const auto& s : response["skills"]) names.push_back(s["name"].get<std::string>());
    EXPECT_EQ(names, (std::vector<std::string>{"note", "time", "calc", "open_url", "sleepy", "stub"}));
    EXPECT_EQ(response["skills"][5]["kind"], "sandboxed");
    EXPECT_EQ(response["skills"][5]["granted"], false);
}

TEST_F(GatewayTest, InvalidKeyFailsAndRepeatedFailuresBlockTheAddress) {
    auto response = call("skills.list", "vg_not_a_real_key_000000");
    EXPECT_FALSE(response["success"].get<bool>());
    EXPECT_EQ(response["stage"], "failed");
    EXPECT_EQ(error_code(response), "AUTH_INVALID");
    EXPECT_FALSE(response.contains("rate_limit"));

    for (int i = 0; i < 4; i++) {
        call("skills.list", "short", json::object(), "10.9.9.9");
    }
    call("skills.list", "vg_not_a_real_key_000000", json::object(), "10.9.9.9");

    // A valid key from the blocked address is rejected before validation.
    auto blocked = call("skills.list", USER_KEY, json::object(), "10.9.9.9");
    EXPECT_EQ(error_code(blocked), "IP_BLOCKED");
    EXPECT_GT(blocked["error"]["block_until"].get<double>(), 0.0);

    // Other addresses are unaffected.
    EXPECT_TRUE(call("skills.list", USER_KEY)["success"].get<bool>());

    clock_.advance(std::chrono::minutes(16));
    EXPECT_TRUE(call("skills.list", USER_KEY, json::object(), "10.9.9.9")["success"].get<bool>());
}

TEST_F(GatewayTest, MissingCredentialIsAuthFailure) {
    EXPECT_EQ(error_code(call("skills.list", "")), "AUTH_INVALID");
}

TEST_F(GatewayTest, TierPermissionEnforced) {
    auto response = call("permission.grant", DEMO_KEY, {{"permission", "skill.stub"}});
    EXPECT_EQ(error_code(response), "PERMISSION_DENIED");
    EXPECT_EQ(response["error"]["permission"], "admin");
    EXPECT_EQ(response["stage"], "failed");
    EXPECT_EQ(context_->events.entries(audit::events::PERMISSION_DENIED).size(), 1u);

    // Admin tier has no voice permission.
    EXPECT_EQ(error_code(call("intent.route", ADMIN_KEY, {{"text", "2+2"}})), "PERMISSION_DENIED");
}

TEST_F(GatewayTest, RateLimitRejectsWithRetryAfter) {
    for (int i = 0; i < 50; i++) {
        ASSERT_TRUE(call("skills.list", DEMO_KEY)["success"].get<bool>()) << i;
    }
    clock_.advance(std::chrono::seconds(100));

    auto response = call("skills.list", DEMO_KEY);
    EXPECT_EQ(error_code(response), "RATE_LIMIT");
    EXPECT_DOUBLE_EQ(response["error"]["retry_after"].get<double>(), 3500.0);
    EXPECT_EQ(response["rate_limit"]["remaining"], 0);
}

TEST_F(GatewayTest, SessionTokenFlow) {
    auto issued = call("auth.token", USER_KEY);
    ASSERT_TRUE(issued["success"].get<bool>()) << issued.dump();
    std::string token = issued["token"];
    EXPECT_EQ(issued["expires_in"], 24 * 3600);

    auto routed = call("intent.route", token, {{"text", "3 * 7"}});
    ASSERT_TRUE(routed["success"].get<bool>()) << routed.dump();
    EXPECT_EQ(routed["skill"], "calc");
    EXPECT_EQ(routed["result"]["result"], 21);

    auto verified = call("auth.verify", "", {{"token", token}});
    EXPECT_TRUE(verified["valid"].get<bool>());
    EXPECT_EQ(verified["claims"]["sub"], "voxgate_user");

    std::string tampered = token;
    tampered[tampered.size() / 2] = tampered[tampered.size() / 2] == 'A' ? 'B' : 'A';
    EXPECT_EQ(error_code(call("intent.route", tampered, {{"text", "1+1"}})), "AUTH_INVALID");

    clock_.advance(std::chrono::hours(24));
    auto expired = call("intent.route", token, {{"text", "1+1"}});
    EXPECT_EQ(error_code(expired), "AUTH_INVALID");
    EXPECT_EQ(expired["error"]["message"], "session token expired");
    EXPECT_EQ(call("auth.verify", "", {{"token", token}})["status"], "ExpiredSignature");
}

TEST_F(GatewayTest, SandboxedSkillNeedsGrant) {
    auto denied = call("skill.run", USER_KEY, {{"skill", "stub"}, {"payload", {{"mode", "echo"}}}});
    EXPECT_EQ(error_code(denied), "PERMISSION_DENIED");
    EXPECT_EQ(denied["stage"], "failed");

    auto granted = call("permission.grant", ADMIN_KEY, {{"permission", "skill.stub"}});
    EXPECT_EQ(granted["granted"], true);
    EXPECT_EQ(call("permission.request", USER_KEY, {{"permission", "skill.stub"}})["granted"], true);

    auto ran = call("skill.run", USER_KEY, {{"skill", "stub"}, {"payload", {{"mode", "echo"}}}});
    ASSERT_TRUE(ran["success"].get<bool>()) << ran.dump();
    EXPECT_EQ(ran["result"]["payload"]["context"]["client"], "voxgate_user");
    EXPECT_EQ(ran["result"]["payload"]["context"]["source"], "192.168.1.20");

    call("permission.revoke", ADMIN_KEY, {{"permission", "skill.stub"}});
    EXPECT_EQ(error_code(call("skill.run", USER_KEY, {{"skill", "stub"}})), "PERMISSION_DENIED");
}

TEST_F(GatewayTest, SandboxTimeoutEndsInTimeoutStage) {
    call("permission.grant", ADMIN_KEY, {{"permission", "skill.sleepy"}});
    auto response = call("skill.run", USER_KEY,
                         {{"skill", "sleepy"}, {"payload", {{"mode", "sleep"}, {"ms", 10000}}}});
    EXPECT_EQ(response["stage"], "timeout");
    EXPECT_EQ(error_code(response), "SANDBOX_TIMEOUT");
}

TEST_F(GatewayTest, PlanExecutionKeepsStepOrder) {
    json steps = json::array({
        {{"skill", "calc"}, {"args", {{"expression", "2 ** 8"}}}},
        {{"skill", "nope"}},
        {{"skill", "stub"}, {"args", {{"mode", "echo"}}}},
    });
    auto response = call("plan.execute", USER_KEY, {{"steps", steps}});
    ASSERT_TRUE(response["success"].get<bool>()) << response.dump();
    ASSERT_EQ(response["results"].size(), 3u);
    EXPECT_EQ(response["results"][0]["result"]["result"], 256);
    EXPECT_EQ(response["results"][1]["error"]["code"], "SKILL_NOT_FOUND");
    EXPECT_EQ(response["results"][2]["error"]["code"], "PERMISSION_DENIED");
    EXPECT_EQ(response["failed"], 2);
}

TEST_F(GatewayTest, UnknownSkillAndOp) {
    EXPECT_EQ(error_code(call("skill.run", USER_KEY, {{"skill", "ghost"}})), "SKILL_NOT_FOUND");
    EXPECT_EQ(error_code(call("skills.delete", USER_KEY)), "INVALID_REQUEST");
    EXPECT_EQ(error_code(call("intent.route", USER_KEY, {{"text", 5}})), "INVALID_REQUEST");
}

TEST_F(GatewayTest, AuditStatsForAdmin) {
    call("skills.list", "vg_wrong_key_0000000000", json::object(), "10.0.0.5");
    call("skills.list", USER_KEY);

    auto stats = call("audit.stats", ADMIN_KEY);
    ASSERT_TRUE(stats["success"].get<bool>()) << stats.dump();
    EXPECT_EQ(stats["blocked_ips"], 0);
    EXPECT_EQ(stats["failed_attempts"]["10.0.0.5"], 1);
    EXPECT_EQ(stats["active_rate_limit_buckets"], 2);
    EXPECT_GE(stats["event_types"]["invalid_api_key"].get<int>(), 1);

    auto events = call("audit.events", ADMIN_KEY, {{"type", "invalid_api_key"}, {"limit", 10}});
    ASSERT_EQ(events["count"], 1);
    EXPECT_EQ(events["events"][0]["ip_address"], "10.0.0.5");

    EXPECT_EQ(error_code(call("audit.stats", USER_KEY)), "PERMISSION_DENIED");
}

TEST_F(GatewayTest, RawRequestParsing) {
    auto response = gateway_->handle_json(json::array({1, 2}));
    EXPECT_EQ(error_code(response), "INVALID_REQUEST");

    response = gateway_->handle_json({{"op", "skills.list"}, {"credential", USER_KEY},
                                      {"source_ip", "127.0.0.1"}});
    EXPECT_TRUE(response["success"].get<bool>());

    response = gateway_->handle_json({{"op", "skills.list"}, {"credential", USER_KEY}, {"body", "x"}});
    EXPECT_EQ(error_code(response), "INVALID_REQUEST");
}
