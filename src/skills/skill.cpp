#include "skills/skill.hpp"
#include "core/errors.hpp"

namespace voxgate::skills {

nlohmann::json Skill::invoke(const nlohmann::json& args, const nlohmann::json& context) {
    if (!args.is_object() || !args.contains("text") || !args["text"].is_string()) {
        throw core::InvalidRequest("skill " + name() + " expects a string 'text' argument");
    }
    return handle(args["text"].get<std::string>(), context);
}

} // namespace voxgate::skills
