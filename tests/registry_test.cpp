#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "skills/registry.hpp"
#include "test_util.hpp"

using namespace voxgate;
using nlohmann::json;

namespace {

const std::filesystem::path STUB_PATH = VOXGATE_SKILL_STUB_PATH;

void write_manifest(const std::filesystem::path& skills_dir, const std::string& name,
                    const std::string& content) {
    std::filesystem::create_directories(skills_dir / name);
    testutil::write_file(skills_dir / name / "skill.json", content);
}

} // namespace

TEST(SkillManifestTest, DefaultsAndLowercaseTriggers) {
    auto m = skills::SkillManifest::from_json("weather",
        json::parse(R"({"command": ["espeak"], "triggers": ["Weather", "FORECAST"]})"));
    EXPECT_EQ(m.permission, "skill.weather");
    EXPECT_EQ(m.timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(m.triggers, (std::vector<std::string>{"weather", "forecast"}));
}

TEST(SkillManifestTest, RejectsBadFields) {
    EXPECT_THROW(skills::SkillManifest::from_json("x", json::parse(R"({})")), core::InvalidRequest);
    EXPECT_THROW(skills::SkillManifest::from_json("x", json::parse(R"({"command": []})")),
                 core::InvalidRequest);
    EXPECT_THROW(skills::SkillManifest::from_json("x", json::parse(R"({"command": "ping"})")),
                 core::InvalidRequest);
    EXPECT_THROW(skills::SkillManifest::from_json("x", json::parse(R"({"command": ["ping"], "timeout_s": 0})")),
                 core::InvalidRequest);
}

TEST(LoadManifestsTest, SortedAndInvalidSkipped) {
    testutil::TempDir dir;
    write_manifest(dir.path(), "zeta", R"({"command": ["ping"], "timeout_s": 1.5})");
    write_manifest(dir.path(), "alpha", R"({"command": ["ps"], "permission": "system.ps"})");
    write_manifest(dir.path(), "broken", R"({"command": )");
    std::filesystem::create_directories(dir / "no_manifest");

    auto manifests = skills::load_manifests(dir.path());
    ASSERT_EQ(manifests.size(), 2u);
    EXPECT_EQ(manifests[0].name, "alpha");
    EXPECT_EQ(manifests[0].permission, "system.ps");
    EXPECT_EQ(manifests[1].name, "zeta");
    EXPECT_EQ(manifests[1].timeout, std::chrono::milliseconds(1500));
}

TEST(LoadManifestsTest, MissingDirectoryIsEmpty) {
    EXPECT_TRUE(skills::load_manifests("/nonexistent/voxgate/skills").empty());
}

namespace {

class SandboxedSkillTest : public ::testing::Test {
protected:
    SandboxedSkillTest()
        : validator_({STUB_PATH.filename().string()}, {STUB_PATH.parent_path().string()}),
          executor_(validator_, events_, sandbox_options()),
          permissions_(state_dir_ / "permissions.json", events_),
          skill_(manifest(), executor_, permissions_, events_) {}

    sandbox::SandboxOptions sandbox_options() {
        sandbox::SandboxOptions opts;
        opts.payload_dir = state_dir_.path();
        return opts;
    }

    static skills::SkillManifest manifest() {
        skills::SkillManifest m;
        m.name = "stub";
        m.command = {STUB_PATH.string()};
        m.permission = "skill.stub";
        m.timeout = std::chrono::milliseconds(5000);
        m.triggers = {"stub"};
        return m;
    }

    testutil::TempDir state_dir_;
    audit::SecurityEventLog events_;
    sandbox::CommandValidator validator_;
    sandbox::SkillSandboxExecutor executor_;
    skills::PermissionStore permissions_;
    skills::SandboxedSkill skill_;
};

} // namespace

TEST_F(SandboxedSkillTest, DeniedWithoutGrant) {
    EXPECT_THROW(skill_.invoke({{"mode", "echo"}}, {{"source", "10.1.1.1"}}), core::PermissionDenied);
    auto denied = events_.entries(audit::events::PERMISSION_DENIED);
    ASSERT_EQ(denied.size(), 1u);
    EXPECT_EQ(denied[0].source, "10.1.1.1");
    EXPECT_TRUE(events_.entries(audit::events::SKILL_EXECUTED).empty());
}

TEST_F(SandboxedSkillTest, GrantedInvocationReturnsParsedJson) {
    permissions_.grant("skill.stub");
    auto result = skill_.invoke({{"mode", "echo"}, {"city", "Tabriz"}}, {{"client", "voxgate_user"}});

    EXPECT_EQ(result["payload"]["skill"], "stub");
    EXPECT_EQ(result["payload"]["args"]["city"], "Tabriz");
    EXPECT_EQ(result["payload"]["context"]["client"], "voxgate_user");
}

TEST_F(SandboxedSkillTest, PlainOutputIsWrapped) {
    permissions_.grant("skill.stub");
    EXPECT_EQ(skill_.invoke({{"mode", "text"}}, json::object()),
              (json{{"output", "plain text reply"}}));
}

TEST_F(SandboxedSkillTest, RevokeAppliesToNextCall) {
    permissions_.grant("skill.stub");
    EXPECT_NO_THROW(skill_.invoke({{"mode", "text"}}, json::object()));
    permissions_.revoke("skill.stub");
    EXPECT_THROW(skill_.invoke({{"mode", "text"}}, json::object()), core::PermissionDenied);
}

TEST_F(SandboxedSkillTest, TriggersMatchPrefixCaseInsensitively) {
    EXPECT_TRUE(skill_.can_handle("  STUB please"));
    EXPECT_FALSE(skill_.can_handle("please stub"));
}
