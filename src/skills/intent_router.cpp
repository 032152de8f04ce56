#include "skills/intent_router.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace voxgate::skills {

nlohmann::json PlanStepResult::to_json() const {
    nlohmann::json j = {{"skill", skill}, {"args", args}};
    if (const auto* result = std::get_if<nlohmann::json>(&outcome)) {
        j["result"] = *result;
    } else {
        const auto& err = std::get<StepError>(outcome);
        j["error"] = {{"code", err.code}, {"message", err.message}};
    }
    return j;
}

IntentRouter::IntentRouter(audit::SecurityEventLog& events)
    : events_(events) {}

void IntentRouter::add_skill(std::shared_ptr<Skill> skill) {
    if (!skill) return;
    if (find(skill->name())) {
        spdlog::warn("Skill '{}' already registered, ignoring duplicate", skill->name());
        return;
    }
    skills_.push_back(std::move(skill));
}

std::shared_ptr<Skill> IntentRouter::find(const std::string& name) const {
    for (const auto& skill : skills_) {
        if (skill->name() == name) return skill;
    }
    return nullptr;
}

std::vector<std::string> IntentRouter::skill_names() const {
    std::vector<std::string> names;
    names.reserve(skills_.size());
    for (const auto& skill : skills_) {
        names.push_back(skill->name());
    }
    return names;
}

RouteResult IntentRouter::route(const std::string& text, const nlohmann::json& context) {
    for (const auto& skill : skills_) {
        if (skill->can_handle(text)) {
            spdlog::debug("Routing '{}' to skill {}", text, skill->name());
            return {skill->name(), skill->handle(text, context)};
        }
    }
    return {"fallback", {{"message", "no matching skill"}}};
}

std::vector<PlanStepResult> IntentRouter::execute_plan(const std::vector<PlanStep>& steps,
                                                       const nlohmann::json& context) {
    std::vector<PlanStepResult> results;
    results.reserve(steps.size());

    std::string source = context.is_object() ? context.value("source", "") : "";

    for (const auto& step : steps) {
        PlanStepResult entry{step.skill, step.args, nlohmann::json()};
        try {
            auto skill = find(step.skill);
            if (!skill) {
                events_.record(audit::events::SKILL_NOT_FOUND, source, {{"skill", step.skill}});
                throw core::SkillNotFound(step.skill);
            }
            entry.outcome = skill->invoke(step.args, context);
        } catch (const core::GatewayError& e) {
            entry.outcome = StepError{core::error_code_to_string(e.code()), e.what()};
        } catch (const std::exception& e) {
            spdlog::warn("Plan step '{}' failed: {}", step.skill, e.what());
            entry.outcome = StepError{core::error_code_to_string(core::ErrorCode::INTERNAL), e.what()};
        } catch (...) {
            spdlog::warn("Plan step '{}' failed with a non-standard exception", step.skill);
            entry.outcome = StepError{core::error_code_to_string(core::ErrorCode::INTERNAL),
                                      "unknown error"};
        }
        results.push_back(std::move(entry));
    }
    return results;
}

std::vector<PlanStep> IntentRouter::parse_plan(const nlohmann::json& steps) {
    if (!steps.is_array()) {
        throw core::InvalidRequest("plan steps must be an array");
    }

    std::vector<PlanStep> plan;
    plan.reserve(steps.size());
    for (const auto& item : steps) {
        if (!item.is_object() || !item.contains("skill") || !item["skill"].is_string()) {
            throw core::InvalidRequest("each plan step needs a string 'skill'");
        }
        PlanStep step;
        step.skill = item["skill"].get<std::string>();
        if (item.contains("args")) {
            if (!item["args"].is_object()) {
                throw core::InvalidRequest("plan step 'args' must be an object");
            }
            step.args = item["args"];
        }
        plan.push_back(std::move(step));
    }
    return plan;
}

} // namespace voxgate::skills
