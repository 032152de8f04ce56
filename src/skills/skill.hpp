#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace voxgate::skills {

// A routable unit of assistant functionality. Built-in skills run in
// process; manifest skills run through the sandbox.
class Skill {
public:
    virtual ~Skill() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const { return ""; }

    // Free-text routing predicate. Must not have side effects.
    virtual bool can_handle(const std::string& text) const = 0;

    // Handle free text that this skill accepted.
    virtual nlohmann::json handle(const std::string& text, const nlohmann::json& context) = 0;

    // Structured invocation, used by plan steps. The default forwards
    // args["text"] to handle().
    virtual nlohmann::json invoke(const nlohmann::json& args, const nlohmann::json& context);
};

} // namespace voxgate::skills
