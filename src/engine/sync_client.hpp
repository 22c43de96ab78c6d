#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ferry/types.hpp"

namespace ferry::engine {

    /**
     * @brief Connection settings shared by every request of a client.
     * Built once at startup and passed in, never mutated afterwards.
     */
    struct ClientConfig {
        std::string backend_url;
        std::string api_key;
        std::string user_agent;
        std::chrono::seconds timeout{30};
    };

    /**
     * @brief "ferry/<version> (<os>; <arch>)"
     */
    std::string build_user_agent(const std::string& version);

    struct InitMetadata {
        std::string cwd;
        std::optional<GitInfo> git_info;
        std::string hostname;
        std::string username;
    };

    struct InitResponse {
        std::string session_id;
        std::map<std::string, FileState> files;
    };

    struct ChunkRequest {
        std::string session_id;
        std::string file_name;
        std::string file_type;
        int first_line = 1;
        std::vector<std::string> lines;
        std::optional<ChunkMetadata> metadata;
    };

    void to_json(nlohmann::json& j, const GitInfo& info);
    void to_json(nlohmann::json& j, const InitMetadata& metadata);
    void to_json(nlohmann::json& j, const ChunkMetadata& metadata);
    void to_json(nlohmann::json& j, const ChunkRequest& request);
    void from_json(const nlohmann::json& j, InitResponse& response);

    /**
     * @brief Wait before retrying a rate-limited request.
     * Uses Retry-After when it is a whole number of seconds, else backoff; never more than max_delay.
     */
    std::chrono::seconds retry_delay(const std::string& retry_after, std::chrono::seconds backoff, std::chrono::seconds max_delay);

    /**
     * @brief Percent-encodes value for use as a single URL path segment.
     */
    std::string escape_path_segment(const std::string& value);

    /**
     * @brief RFC 3339 UTC timestamp with millisecond precision.
     */
    std::string format_timestamp(std::chrono::system_clock::time_point tp);

    /**
     * @brief Remote operations of the sync backend.
     * Every call blocks until the backend answers or the transport gives up,
     * and reports failures as ferry::SyncError with a classified kind.
     */
    class SyncClient {
    public:
        virtual ~SyncClient() = default;

        /**
         * @brief Creates or resumes the session for external_id.
         * @return Backend session id and the authoritative per-file cursors.
         */
        virtual InitResponse init(const std::string& external_id,
                                  const std::string& transcript_path,
                                  const std::optional<InitMetadata>& metadata) = 0;

        /**
         * @brief Appends lines to a file. The backend rejects non-contiguous first_line values.
         * @return The backend's last synced line for the file.
         */
        virtual int upload_chunk(const ChunkRequest& request) = 0;

        virtual void send_event(const std::string& session_id,
                                const std::string& event_type,
                                std::chrono::system_clock::time_point timestamp,
                                const nlohmann::json& payload) = 0;

        /**
         * @brief Replaces the summary of a session addressed by id or external id.
         */
        virtual void update_session_summary(const std::string& session_id, const std::string& summary) = 0;
    };

    std::unique_ptr<SyncClient> create_http_sync_client(const ClientConfig& config);

}
