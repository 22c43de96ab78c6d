#include "sync_client.hpp"
#include "ferry/errors.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

using json = nlohmann::json;

namespace ferry::engine {

    class HttpSyncClient : public SyncClient {
    public:
        explicit HttpSyncClient(const ClientConfig& config) : m_config(config) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
            if (is_localhost(m_config.backend_url)) {
                log::debug("HttpSyncClient") << "Using localhost backend URL - TLS not enforced";
            }
        }

        ~HttpSyncClient() override {
            curl_global_cleanup();
        }

        InitResponse init(const std::string& external_id,
                          const std::string& transcript_path,
                          const std::optional<InitMetadata>& metadata) override {
            json body = {
                {"external_id", external_id},
                {"transcript_path", transcript_path}
            };
            if (metadata) body["metadata"] = *metadata;

            json resp = request("POST", "/api/v1/sync/init", body, "sync init failed");
            try {
                return resp.get<InitResponse>();
            } catch (const json::exception& e) {
                throw SyncError(SyncError::Kind::Protocol, std::string("sync init failed: failed to parse response: ") + e.what());
            }
        }

        int upload_chunk(const ChunkRequest& chunk) override {
            json resp = request("POST", "/api/v1/sync/chunk", chunk, "chunk upload failed");
            try {
                return resp.at("last_synced_line").get<int>();
            } catch (const json::exception& e) {
                throw SyncError(SyncError::Kind::Protocol, std::string("chunk upload failed: failed to parse response: ") + e.what());
            }
        }

        void send_event(const std::string& session_id,
                        const std::string& event_type,
                        std::chrono::system_clock::time_point timestamp,
                        const json& payload) override {
            json body = {
                {"session_id", session_id},
                {"event_type", event_type},
                {"timestamp", format_timestamp(timestamp)},
                {"payload", payload}
            };
            request("POST", "/api/v1/sync/event", body, "send event failed");
        }

        void update_session_summary(const std::string& session_id, const std::string& summary) override {
            json body = {{"summary", summary}};
            request("PATCH", "/api/v1/sessions/" + escape_path_segment(session_id) + "/summary", body, "update summary failed");
        }

    private:
        static constexpr int MAX_RETRIES = 5;
        static constexpr std::chrono::seconds INITIAL_BACKOFF{1};
        static constexpr std::chrono::seconds MAX_BACKOFF{60};

        ClientConfig m_config;

        struct Response {
            long status = 0;
            std::string body;
            std::string retry_after;
        };

        static bool is_localhost(const std::string& url) {
            return url.rfind("http://localhost", 0) == 0 ||
                   url.rfind("http://127.0.0.1", 0) == 0 ||
                   url.rfind("http://[::1]", 0) == 0;
        }

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }

        static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userp) {
            std::string header(buffer, size * nitems);
            const std::string name = "retry-after:";
            std::string lower = header.substr(0, std::min(header.size(), name.size()));
            std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
            if (lower == name) {
                std::string value = header.substr(name.size());
                value.erase(0, value.find_first_not_of(" \t"));
                value.erase(value.find_last_not_of(" \t\r\n") + 1);
                *((std::string*)userp) = value;
            }
            return size * nitems;
        }

        Response perform(const std::string& method, const std::string& url, const std::string& payload, const char* context) {
            CURL* curl = curl_easy_init();
            if (!curl) {
                throw SyncError(SyncError::Kind::Transport, std::string(context) + ": failed to create request");
            }

            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");
            std::string auth_header = "Authorization: Bearer " + m_config.api_key;
            headers = curl_slist_append(headers, auth_header.c_str());
            std::string agent_header = "User-Agent: " + m_config.user_agent;
            if (!m_config.user_agent.empty()) headers = curl_slist_append(headers, agent_header.c_str());

            Response response;
            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)payload.size());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)m_config.timeout.count());
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
            curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.retry_after);
            if (!is_localhost(url)) {
                curl_easy_setopt(curl, CURLOPT_SSLVERSION, (long)CURL_SSLVERSION_TLSv1_2);
            }

            CURLcode res = curl_easy_perform(curl);
            if (res == CURLE_OK) {
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
            }

            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);

            if (res != CURLE_OK) {
                throw SyncError(SyncError::Kind::Transport,
                                std::string(context) + ": failed to send request: " + curl_easy_strerror(res));
            }
            return response;
        }

        json request(const std::string& method, const std::string& path, const json& body, const char* context) {
            std::string payload = body.dump(-1, ' ', false, json::error_handler_t::replace);
            log::debug("HttpSyncClient") << method << " " << path << " payload: " << payload;

            const std::string url = m_config.backend_url + path;
            std::chrono::seconds backoff = INITIAL_BACKOFF;

            for (int attempt = 0;; ++attempt) {
                Response resp = perform(method, url, payload, context);

                if (resp.status == 429) {
                    if (attempt == MAX_RETRIES) {
                        throw SyncError(SyncError::Kind::RateLimited,
                                        std::string(context) + ": rate limited: exceeded " + std::to_string(MAX_RETRIES) + " retries");
                    }
                    std::chrono::seconds wait = retry_delay(resp.retry_after, backoff, MAX_BACKOFF);
                    log::warn("HttpSyncClient") << "Rate limited on " << path << ", retrying in " << wait.count() << "s";
                    std::this_thread::sleep_for(wait);
                    backoff = std::min(backoff * 2, MAX_BACKOFF);
                    continue;
                }

                std::string detail = std::string(context) + ": status " + std::to_string(resp.status) + ": " + resp.body;
                if (resp.status == 401 || resp.status == 403) {
                    throw SyncError(SyncError::Kind::Unauthorized, detail);
                }
                if (resp.status == 404) {
                    throw SyncError(SyncError::Kind::NotFound, detail);
                }
                if (resp.status == 409) {
                    throw SyncError(SyncError::Kind::Conflict, detail);
                }
                if (resp.status < 200 || resp.status >= 300) {
                    throw SyncError(SyncError::Kind::Transport, detail);
                }

                if (resp.body.empty()) return json::object();
                json parsed = json::parse(resp.body, nullptr, false);
                if (parsed.is_discarded()) {
                    throw SyncError(SyncError::Kind::Protocol, std::string(context) + ": failed to parse response");
                }
                return parsed;
            }
        }
    };

    std::string escape_path_segment(const std::string& value) {
        CURL* curl = curl_easy_init();
        char* escaped = curl_easy_escape(curl, value.data(), static_cast<int>(value.size()));
        if (curl) curl_easy_cleanup(curl);
        if (!escaped) {
            throw SyncError(SyncError::Kind::Transport, "failed to escape URL segment");
        }
        std::string result(escaped);
        curl_free(escaped);
        return result;
    }

    std::unique_ptr<SyncClient> create_http_sync_client(const ClientConfig& config) {
        return std::make_unique<HttpSyncClient>(config);
    }

}
