#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include "core/clock.hpp"
#include "skills/skill.hpp"

namespace voxgate::skills {

// "note: buy milk" / "remember to call home". Appends the body to a notes file.
class NoteSkill : public Skill {
public:
    explicit NoteSkill(std::filesystem::path notes_path);

    std::string name() const override { return "note"; }
    std::string description() const override { return "Append a line to the notes file"; }
    bool can_handle(const std::string& text) const override;
    nlohmann::json handle(const std::string& text, const nlohmann::json& context) override;
    nlohmann::json invoke(const nlohmann::json& args, const nlohmann::json& context) override;

    const std::filesystem::path& notes_path() const { return notes_path_; }

private:
    nlohmann::json append(const std::string& body);

    std::filesystem::path notes_path_;
    std::mutex mutex_;
};

class TimeSkill : public Skill {
public:
    explicit TimeSkill(core::NowFn now = core::system_now());

    std::string name() const override { return "time"; }
    std::string description() const override { return "Current UTC time"; }
    bool can_handle(const std::string& text) const override;
    nlohmann::json handle(const std::string& text, const nlohmann::json& context) override;
    nlohmann::json invoke(const nlohmann::json& args, const nlohmann::json& context) override;

private:
    core::NowFn now_;
};

class CalcSkill : public Skill {
public:
    std::string name() const override { return "calc"; }
    std::string description() const override { return "Evaluate an arithmetic expression"; }
    bool can_handle(const std::string& text) const override;
    nlohmann::json handle(const std::string& text, const nlohmann::json& context) override;
    nlohmann::json invoke(const nlohmann::json& args, const nlohmann::json& context) override;

private:
    nlohmann::json evaluate(const std::string& expression) const;
};

// Validates an "open <url>" request. Opening is left to the desktop client.
class OpenUrlSkill : public Skill {
public:
    std::string name() const override { return "open_url"; }
    std::string description() const override { return "Accept a request to open an http(s) URL"; }
    bool can_handle(const std::string& text) const override;
    nlohmann::json handle(const std::string& text, const nlohmann::json& context) override;
    nlohmann::json invoke(const nlohmann::json& args, const nlohmann::json& context) override;
};

} // namespace voxgate::skills
