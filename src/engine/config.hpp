#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <re2/re2.h>
#include "ferry/errors.hpp"
#include "log.hpp"
#include "redactor.hpp"
#include "sync_client.hpp"
#include "../platform.hpp"

namespace ferry::engine {

    constexpr const char* API_KEY_PREFIX = "fry_";
    constexpr size_t MIN_API_KEY_LENGTH = 20;

    /**
     * @brief Parses a log level name (debug, info, warn/warning, error; any case). Empty means info.
     * @throws ConfigError on an unknown name.
     */
    inline log::Level parse_log_level(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
        if (name.empty() || name == "info") return log::Level::Info;
        if (name == "debug") return log::Level::Debug;
        if (name == "warn" || name == "warning") return log::Level::Warn;
        if (name == "error") return log::Level::Error;
        throw ConfigError("invalid log level: " + name);
    }

    struct Config {
        std::string backend_url;
        std::string api_key;
        std::string log_level = "info";
        RedactionConfig redaction;

        /**
         * @brief $FERRY_CONFIG_PATH if set, else config.json in the platform config directory.
         */
        static std::filesystem::path config_path() {
            const char* env = std::getenv("FERRY_CONFIG_PATH");
            if (env && *env) return env;
            return platform::system::get_config_dir() / "config.json";
        }

        /**
         * @brief Reads the config file. A missing file yields defaults.
         * @throws ConfigError if the file is not valid JSON or a field has the wrong type.
         */
        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (!std::filesystem::exists(path)) return cfg;

            std::ifstream f(path);
            if (!f.is_open()) throw ConfigError("failed to open config file: " + path.string());

            try {
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("backend_url")) cfg.backend_url = j["backend_url"].get<std::string>();
                if (j.contains("api_key")) cfg.api_key = j["api_key"].get<std::string>();
                if (j.contains("log_level")) cfg.log_level = j["log_level"].get<std::string>();

                if (j.contains("redaction")) {
                    const auto& r = j["redaction"];
                    if (r.contains("enabled")) cfg.redaction.enabled = r["enabled"].get<bool>();
                    if (r.contains("use_default_patterns")) cfg.redaction.use_default_patterns = r["use_default_patterns"].get<bool>();
                    if (r.contains("patterns")) {
                        for (const auto& p : r["patterns"]) {
                            RedactionPattern pattern;
                            pattern.name = p.value("name", "");
                            pattern.pattern = p.value("pattern", "");
                            pattern.field_pattern = p.value("field_pattern", "");
                            pattern.type = p.value("type", "");
                            pattern.capture_group = p.value("capture_group", 0);
                            cfg.redaction.patterns.push_back(std::move(pattern));
                        }
                    }
                }
            } catch (const nlohmann::json::exception& e) {
                throw ConfigError("invalid config file " + path.string() + ": " + e.what());
            }
            return cfg;
        }

        /**
         * @brief Checks backend URL and API key format. Empty values mean "not configured" and pass.
         * @throws ConfigError describing the first problem found.
         */
        void validate() const {
            if (!backend_url.empty()) {
                static const re2::RE2 url_re(R"((?i)https?://[^/?#\s]+(?:[/?#].*)?)");
                if (!re2::RE2::FullMatch(backend_url, url_re)) {
                    throw ConfigError("invalid backend URL (need http:// or https:// with a host): " + backend_url);
                }
            }

            if (!api_key.empty()) {
                if (api_key.size() < MIN_API_KEY_LENGTH) {
                    throw ConfigError("API key too short");
                }
                if (api_key.rfind(API_KEY_PREFIX, 0) != 0) {
                    throw ConfigError(std::string("API key must start with '") + API_KEY_PREFIX + "'");
                }
                if (std::any_of(api_key.begin(), api_key.end(), [](unsigned char c) { return std::isspace(c); })) {
                    throw ConfigError("API key must not contain whitespace");
                }
            }

            parse_log_level(log_level);
        }

        ClientConfig client_config(const std::string& user_agent) const {
            ClientConfig client;
            client.backend_url = backend_url;
            while (!client.backend_url.empty() && client.backend_url.back() == '/') client.backend_url.pop_back();
            client.api_key = api_key;
            client.user_agent = user_agent;
            return client;
        }
    };

}
