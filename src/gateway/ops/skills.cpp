#include "gateway/op_handlers.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace voxgate::gateway {

void SkillOps::register_ops(OpRouter& router) {
    router.register_op("intent.route", {true, "voice"},
        [this](const OpCall& call) { return handle_route(call); });
    router.register_op("plan.execute", {true, "write"},
        [this](const OpCall& call) { return handle_plan(call); });
    router.register_op("skill.run", {true, "write"},
        [this](const OpCall& call) { return handle_run(call); });
    router.register_op("skills.list", {true, "read"},
        [this](const OpCall& call) { return handle_list(call); });
}

json SkillOps::handle_route(const OpCall& call) {
    std::string text = require_string(call.request.body, "text");
    auto routed = context_.router.route(text, call.caller.skill_context());
    return routed.to_json();
}

json SkillOps::handle_plan(const OpCall& call) {
    const auto& body = call.request.body;
    if (!body.contains("steps")) {
        throw core::InvalidRequest("body field 'steps' is required");
    }
    auto steps = skills::IntentRouter::parse_plan(body["steps"]);
    auto results = context_.router.execute_plan(steps, call.caller.skill_context());

    size_t failed = 0;
    json response;
    response["results"] = json::array();
    for (const auto& result : results) {
        if (!result.ok()) ++failed;
        response["results"].push_back(result.to_json());
    }
    response["count"] = results.size();
    response["failed"] = failed;
    return response;
}

json SkillOps::handle_run(const OpCall& call) {
    const auto& body = call.request.body;
    std::string name = require_string(body, "skill");

    json payload = json::object();
    if (body.contains("payload") && !body["payload"].is_null()) {
        if (!body["payload"].is_object()) {
            throw core::InvalidRequest("body field 'payload' must be an object");
        }
        payload = body["payload"];
    }

    auto skill = context_.router.find(name);
    if (!skill) {
        context_.events.record(audit::events::SKILL_NOT_FOUND, call.caller.source_ip, {{"skill", name}});
        throw core::SkillNotFound(name);
    }

    json response;
    response["skill"] = name;
    response["result"] = skill->invoke(payload, call.caller.skill_context());
    return response;
}

json SkillOps::handle_list(const OpCall& /*call*/) {
    json response;
    response["skills"] = json::array();

    for (const auto& skill : context_.router.skills()) {
        json entry;
        entry["name"] = skill->name();
        entry["description"] = skill->description();
        if (auto sandboxed = std::dynamic_pointer_cast<skills::SandboxedSkill>(skill)) {
            entry["kind"] = "sandboxed";
            entry["manifest"] = sandboxed->manifest().to_json();
            entry["granted"] = context_.permissions.is_granted(sandboxed->manifest().permission);
        } else {
            entry["kind"] = "builtin";
        }
        response["skills"].push_back(entry);
    }
    response["count"] = response["skills"].size();
    return response;
}

} // namespace voxgate::gateway
