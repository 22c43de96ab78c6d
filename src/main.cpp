#include <iostream>
#include <chrono>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "engine/log.hpp"
#include "engine/redactor.hpp"
#include "engine/sync_client.hpp"
#include "engine/vcs.hpp"

namespace {

    constexpr const char* FERRY_VERSION = "0.1.0";

    void print_usage() {
        std::cerr << "Usage:\n"
                  << "  ferry sync <external_id> <transcript_path> [cwd]\n"
                  << "  ferry end  <external_id> <transcript_path> [reason]\n";
    }

}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage();
        return 2;
    }

    const std::string command = argv[1];
    if (command != "sync" && command != "end") {
        print_usage();
        return 2;
    }

    ferry::engine::Config config;
    try {
        auto config_path = ferry::engine::Config::config_path();
        config = ferry::engine::Config::load(config_path);
        config.validate();
        ferry::log::set_level(ferry::engine::parse_log_level(config.log_level));
        ferry::log::debug("Ferry") << "Config path: " << config_path;
    } catch (const ferry::ConfigError& e) {
        std::cerr << "[Ferry] " << e.what() << "\n";
        return 1;
    }

    if (config.backend_url.empty() || config.api_key.empty()) {
        std::cerr << "[Ferry] Not configured: backend_url and api_key are required.\n";
        return 1;
    }

    std::optional<ferry::engine::Redactor> redactor;
    if (config.redaction.enabled) {
        try {
            redactor = ferry::engine::Redactor::from_config(config.redaction);
        } catch (const ferry::ConfigError& e) {
            std::cerr << "[Ferry] Redaction config: " << e.what() << "\n";
            return 1;
        }
        if (redactor) {
            ferry::log::info("Ferry") << "Redaction enabled with " << redactor->pattern_count() << " patterns";
        }
    }

    ferry::engine::EngineOptions options;
    options.external_id = argv[2];
    options.transcript_path = std::filesystem::absolute(argv[3]);
    options.cwd = (command == "sync" && argc > 4) ? std::filesystem::path(argv[4]) : std::filesystem::current_path();

    auto client_config = config.client_config(ferry::engine::build_user_agent(FERRY_VERSION));
    std::shared_ptr<ferry::engine::SyncClient> client = ferry::engine::create_http_sync_client(client_config);

    ferry::engine::SyncEngine engine(client, std::move(redactor), options, ferry::engine::create_git_detector());

    try {
        engine.init();
    } catch (const ferry::SyncError& e) {
        std::cerr << "[Ferry] Failed to initialize sync session: " << e.what() << "\n";
        return 1;
    }

    ferry::engine::SyncResult result;
    if (command == "end") {
        nlohmann::json payload = {{"reason", argc > 4 ? argv[4] : "other"}};
        result = engine.end_session(payload, std::chrono::system_clock::now());
    } else {
        result = engine.sync_all();
    }
    std::cout << "[Ferry] Uploaded " << result.chunks << " chunks\n";
    for (const auto& [name, line] : engine.sync_stats()) {
        std::cout << "  " << name << ": " << line << " lines\n";
    }

    if (result.error) {
        std::cerr << "[Ferry] Sync error: " << result.error->what() << "\n";
        if (result.error->kind() == ferry::SyncError::Kind::Unauthorized) {
            engine.reset();
            std::cerr << "[Ferry] Authentication failed. Check api_key.\n";
        }
        return 1;
    }

    return 0;
}
