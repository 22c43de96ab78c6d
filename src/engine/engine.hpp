#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ferry/errors.hpp"
#include "extract.hpp"
#include "redactor.hpp"
#include "sync_client.hpp"
#include "tracker.hpp"
#include "vcs.hpp"

namespace ferry::engine {

    // Upper bound on discovery rounds per sync_all(); reference chains are rarely deeper than 3-4.
    constexpr int MAX_SYNC_ITERATIONS = 10;

    struct EngineOptions {
        std::string external_id;              // Caller's session id, stable across restarts
        std::filesystem::path transcript_path; // Root file
        std::filesystem::path cwd;
        size_t max_chunk_bytes = DEFAULT_MAX_CHUNK_BYTES;
    };

    struct SyncResult {
        int chunks = 0;                 // Successful uploads, even when an error occurred
        std::optional<SyncError> error; // First error of the pass

        bool ok() const { return !error; }
    };

    /**
     * @brief Ships one session's transcript and its sub-session files to the backend.
     *
     * Single-threaded: every call blocks on the client. Several engines may run side
     * by side; the backend's cursor is the only shared truth.
     */
    class SyncEngine {
    public:
        SyncEngine(std::shared_ptr<SyncClient> client,
                   std::optional<Redactor> redactor,
                   EngineOptions options,
                   std::shared_ptr<VcsDetector> vcs = nullptr);

        /**
         * @brief Creates or resumes the backend session and replaces local cursors with the backend's.
         * @throws SyncError if the backend call fails; the engine stays uninitialized.
         */
        void init();

        /**
         * @brief Uploads everything new in tracked files, following sub-session references breadth-first.
         *
         * A failure on one file does not stop the others. After an upload failure whose
         * outcome is unknown, cursors are re-seeded from the backend before anything else
         * is uploaded.
         */
        SyncResult sync_all();

        /**
         * @brief Sends a session_end event carrying payload. No-op before init().
         * @throws SyncError if the backend call fails.
         */
        void send_session_end(const nlohmann::json& payload, std::chrono::system_clock::time_point timestamp);

        /**
         * @brief Final sync pass followed by session_end.
         *
         * session_end is sent even when the pass reported an error, unless the backend
         * rejected the credentials. The returned error is the sync error if there was
         * one, else the session_end failure.
         */
        SyncResult end_session(const nlohmann::json& payload, std::chrono::system_clock::time_point timestamp);

        /**
         * @brief Last synced line per tracked file name.
         */
        std::map<std::string, int> sync_stats();

        /**
         * @brief Forgets the backend session (e.g. after an auth failure). Cursors are kept.
         */
        void reset();

        bool is_initialized() const { return m_initialized; }
        const std::string& session_id() const { return m_session_id; }
        FileTracker& tracker() { return m_tracker; }

    private:
        std::shared_ptr<SyncClient> m_client;
        std::optional<Redactor> m_redactor;
        EngineOptions m_options;
        std::shared_ptr<VcsDetector> m_vcs;
        FileTracker m_tracker;
        std::string m_session_id;
        bool m_initialized = false;

        void drain_file(const std::string& name, SyncResult& result, std::vector<std::string>& new_ids);
        void refresh_state_from_backend();
        void link_summary_to_previous_session(const SummaryLink& link);
        std::optional<GitInfo> detect_git_info();
    };

}
