#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include "gateway/config.hpp"
#include "gateway/context.hpp"
#include "gateway/gateway.hpp"

using json = nlohmann::json;

namespace {

constexpr const char* VERSION = "0.3.0";

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "\n"
              << "Reads one JSON request per line on stdin and writes one JSON\n"
              << "response per line on stdout. Logs go to stderr.\n"
              << "\n"
              << "Request: {\"op\": \"...\", \"credential\": \"...\", \"source_ip\": \"...\", \"body\": {...}}\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help       Show this help\n"
              << "  -v, --version    Show version\n"
              << "\n"
              << "Environment (also read from .env):\n"
              << "  VOXGATE_STATE_DIR, VOXGATE_SKILLS_DIR, VOXGATE_CREDENTIALS_FILE,\n"
              << "  VOXGATE_TOKEN_SECRET, VOXGATE_TOKEN_TTL_HOURS, VOXGATE_SANDBOX_TIMEOUT_S,\n"
              << "  VOXGATE_SANDBOX_ALLOW, VOXGATE_SANDBOX_BIN_DIRS, VOXGATE_AUDIT_MAX_EVENTS,\n"
              << "  VOXGATE_LOG_LEVEL\n";
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << "voxgate " << VERSION << "\n";
            return 0;
        }
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 2;
    }

    voxgate::core::init_logger();
    voxgate::core::config::load_dotenv();

    auto config = voxgate::gateway::GatewayConfig::from_env();
    voxgate::core::set_log_level(voxgate::core::log_level_from_string(config.log_level));

    if (!voxgate::core::paths::ensure_dir(config.state_dir)) {
        spdlog::error("Cannot create state directory {}", config.state_dir.string());
        return 1;
    }

    std::unique_ptr<voxgate::gateway::GatewayContext> context;
    try {
        auto credentials = voxgate::auth::CredentialTable::load_or_generate(config.credentials_file);
        context = std::make_unique<voxgate::gateway::GatewayContext>(config, std::move(credentials));
    } catch (const std::exception& e) {
        spdlog::error("Failed to start gateway: {}", e.what());
        return 1;
    }

    voxgate::gateway::Gateway gateway(*context);
    spdlog::info("voxgate {} ready (state: {}, skills: {})", VERSION,
                 config.state_dir.string(), config.skills_dir.string());

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        json response;
        json request = json::parse(line, nullptr, false);
        if (request.is_discarded()) {
            response["success"] = false;
            response["stage"] = "failed";
            response["error"] = voxgate::core::InvalidRequest("request is not valid JSON").to_json();
        } else {
            response = gateway.handle_json(request);
        }
        std::cout << response.dump(-1, ' ', false, json::error_handler_t::replace) << std::endl;
    }

    spdlog::info("stdin closed, shutting down");
    return 0;
}
