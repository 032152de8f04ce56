#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "audit/security_events.hpp"
#include "skills/skill.hpp"

namespace voxgate::skills {

struct RouteResult {
    std::string skill;
    nlohmann::json result;

    nlohmann::json to_json() const {
        return {{"skill", skill}, {"result", result}};
    }
};

struct PlanStep {
    std::string skill;
    nlohmann::json args = nlohmann::json::object();
};

struct StepError {
    std::string code;     // core::error_code_to_string value
    std::string message;
};

struct PlanStepResult {
    std::string skill;
    nlohmann::json args;
    std::variant<nlohmann::json, StepError> outcome;

    bool ok() const { return std::holds_alternative<nlohmann::json>(outcome); }

    // {"skill", "args", "result"} or {"skill", "args", "error": {"code", "message"}}
    nlohmann::json to_json() const;
};

// First-match dispatch of free text over skills in registration order, and
// sequential execution of explicit plans.
class IntentRouter {
public:
    explicit IntentRouter(audit::SecurityEventLog& events);

    void add_skill(std::shared_ptr<Skill> skill);
    std::shared_ptr<Skill> find(const std::string& name) const;
    std::vector<std::string> skill_names() const;
    const std::vector<std::shared_ptr<Skill>>& skills() const { return skills_; }

    // Errors raised by the matched skill propagate to the caller.
    RouteResult route(const std::string& text, const nlohmann::json& context = nlohmann::json::object());

    // One result per step, in order. Step failures are captured, never thrown.
    std::vector<PlanStepResult> execute_plan(const std::vector<PlanStep>& steps,
                                             const nlohmann::json& context = nlohmann::json::object());

    // [{"skill": name, "args": {...}}, ...]. Throws core::InvalidRequest.
    static std::vector<PlanStep> parse_plan(const nlohmann::json& steps);

private:
    audit::SecurityEventLog& events_;
    std::vector<std::shared_ptr<Skill>> skills_;
};

} // namespace voxgate::skills
