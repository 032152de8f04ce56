#include "skills/builtin_skills.hpp"
#include "core/errors.hpp"
#include "skills/calc.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <fstream>
#include <regex>

namespace voxgate::skills {

namespace {

const std::regex& note_pattern() {
    static const std::regex re(R"(^\s*(note|remember)[: ]+(.*)$)", std::regex::icase);
    return re;
}

const std::regex& url_pattern() {
    static const std::regex re(R"(https?://[^\s]+)", std::regex::icase);
    return re;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// args[field] as a string, or empty when absent.
std::string string_arg(const nlohmann::json& args, const char* field) {
    if (!args.is_object() || !args.contains(field)) return "";
    if (!args[field].is_string()) {
        throw core::InvalidRequest(std::string("argument '") + field + "' must be a string");
    }
    return args[field].get<std::string>();
}

std::string format_utc(std::time_t t, const char* fmt) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

} // namespace

// =============================================================================
// NoteSkill
// =============================================================================

NoteSkill::NoteSkill(std::filesystem::path notes_path)
    : notes_path_(std::move(notes_path)) {}

bool NoteSkill::can_handle(const std::string& text) const {
    return std::regex_match(text, note_pattern());
}

nlohmann::json NoteSkill::handle(const std::string& text, const nlohmann::json& /*context*/) {
    std::smatch match;
    if (!std::regex_match(text, match, note_pattern())) {
        throw core::InvalidRequest("note text must start with 'note:' or 'remember'");
    }
    return append(match[2].str());
}

// Plan steps pass the note body itself.
nlohmann::json NoteSkill::invoke(const nlohmann::json& args, const nlohmann::json& /*context*/) {
    return append(string_arg(args, "text"));
}

nlohmann::json NoteSkill::append(const std::string& text) {
    std::string body = trim(text);
    if (body.empty()) {
        throw core::InvalidRequest("note text is empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (notes_path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(notes_path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("cannot create notes directory: " + ec.message());
        }
    }

    size_t line = 1;
    {
        std::ifstream in(notes_path_);
        std::string existing;
        while (std::getline(in, existing)) ++line;
    }

    std::ofstream out(notes_path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("cannot open notes file " + notes_path_.string());
    }
    out << body << "\n";
    if (!out) {
        throw std::runtime_error("failed writing notes file " + notes_path_.string());
    }

    spdlog::debug("Note saved to {} (line {})", notes_path_.string(), line);
    return {{"saved", true}, {"text", body}, {"line", line}};
}

// =============================================================================
// TimeSkill
// =============================================================================

TimeSkill::TimeSkill(core::NowFn now) : now_(std::move(now)) {}

bool TimeSkill::can_handle(const std::string& text) const {
    std::string lower = to_lower(text);
    return lower.find("time") != std::string::npos ||
           lower.find("clock") != std::string::npos ||
           text.find("\xD8\xB3\xD8\xA7\xD8\xB9\xD8\xAA") != std::string::npos ||  // saat
           text.find("\xD8\xB2\xD9\x85\xD8\xA7\xD9\x86") != std::string::npos;    // zaman
}

nlohmann::json TimeSkill::handle(const std::string& /*text*/, const nlohmann::json& /*context*/) {
    std::time_t t = std::chrono::system_clock::to_time_t(now_());
    return {
        {"time_iso", format_utc(t, "%Y-%m-%dT%H:%M:%SZ")},
        {"time_human", format_utc(t, "%H:%M UTC, %A %d %B %Y")}
    };
}

nlohmann::json TimeSkill::invoke(const nlohmann::json& /*args*/, const nlohmann::json& context) {
    return handle("", context);
}

// =============================================================================
// CalcSkill
// =============================================================================

bool CalcSkill::can_handle(const std::string& text) const {
    return is_arithmetic_text(text);
}

nlohmann::json CalcSkill::handle(const std::string& text, const nlohmann::json& /*context*/) {
    return evaluate(text);
}

// Accepts {"expression": "..."} or {"text": "..."}.
nlohmann::json CalcSkill::invoke(const nlohmann::json& args, const nlohmann::json& /*context*/) {
    std::string expression = string_arg(args, "expression");
    if (expression.empty()) expression = string_arg(args, "text");
    if (trim(expression).empty()) {
        throw core::InvalidRequest("calc expects an 'expression' argument");
    }
    return evaluate(expression);
}

nlohmann::json CalcSkill::evaluate(const std::string& text) const {
    std::string expression = trim(text);
    double value = evaluate_expression(expression);

    nlohmann::json result = {{"expression", expression}};
    if (std::floor(value) == value && std::fabs(value) < 9.0e15) {
        result["result"] = static_cast<long long>(value);
    } else {
        result["result"] = value;
    }
    return result;
}

// =============================================================================
// OpenUrlSkill
// =============================================================================

bool OpenUrlSkill::can_handle(const std::string& text) const {
    std::string lower = to_lower(trim(text));
    return lower.rfind("open ", 0) == 0 && std::regex_search(text, url_pattern());
}

nlohmann::json OpenUrlSkill::handle(const std::string& text, const nlohmann::json& /*context*/) {
    std::smatch match;
    if (!std::regex_search(text, match, url_pattern())) {
        throw core::InvalidRequest("no http(s) URL in request");
    }
    return {{"accepted", true}, {"action", "open_url"}, {"url", match.str()}};
}

nlohmann::json OpenUrlSkill::invoke(const nlohmann::json& args, const nlohmann::json& context) {
    std::string url = string_arg(args, "url");
    if (url.empty()) url = string_arg(args, "text");
    std::smatch match;
    if (!std::regex_match(url, match, url_pattern())) {
        throw core::InvalidRequest("open_url expects an http(s) 'url' argument");
    }
    return handle(url, context);
}

} // namespace voxgate::skills
