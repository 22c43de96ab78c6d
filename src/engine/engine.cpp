#include "engine.hpp"
#include "log.hpp"
#include "summary_link.hpp"
#include "../platform.hpp"
#include <fstream>

using json = nlohmann::json;

namespace ferry::engine {

    namespace {

        // Lines scanned at the head of a transcript for a recorded branch.
        constexpr int MAX_LINES_FOR_GIT_HINT = 50;

        void remember(SyncResult& result, const SyncError& error) {
            if (!result.error) result.error = error;
        }

    }

    SyncEngine::SyncEngine(std::shared_ptr<SyncClient> client,
                           std::optional<Redactor> redactor,
                           EngineOptions options,
                           std::shared_ptr<VcsDetector> vcs)
        : m_client(std::move(client)),
          m_redactor(std::move(redactor)),
          m_options(std::move(options)),
          m_vcs(std::move(vcs)),
          m_tracker(m_options.transcript_path, m_vcs) {}

    std::optional<GitInfo> SyncEngine::detect_git_info() {
        std::ifstream in(m_options.transcript_path);
        std::string line;
        for (int i = 0; i < MAX_LINES_FOR_GIT_HINT && std::getline(in, line); ++i) {
            json msg = json::parse(line, nullptr, false);
            if (msg.is_discarded() || !msg.is_object()) continue;
            if (auto hint = extract_branch_hint(msg)) {
                GitInfo info;
                info.branch = hint->branch;
                if (m_vcs && !hint->cwd.empty()) info.repo_url = m_vcs->repo_url(hint->cwd);
                return info;
            }
        }

        if (m_vcs) return m_vcs->detect(m_options.cwd);
        return std::nullopt;
    }

    void SyncEngine::init() {
        InitMetadata metadata;
        metadata.cwd = m_options.cwd.string();
        metadata.git_info = detect_git_info();
        metadata.hostname = platform::system::hostname();
        metadata.username = platform::system::username();

        InitResponse resp = m_client->init(m_options.external_id, m_options.transcript_path.string(), metadata);

        m_session_id = resp.session_id;
        m_initialized = true;
        m_tracker.init_from_backend_state(resp.files);

        log::info("SyncEngine") << "Sync session initialized: session_id=" << m_session_id
                                << " existing_files=" << resp.files.size();
    }

    SyncResult SyncEngine::sync_all() {
        SyncResult result;
        if (!m_initialized) {
            result.error = SyncError(SyncError::Kind::NotInitialized, "engine not initialized: call init() first");
            return result;
        }

        std::vector<std::string> frontier;
        for (auto* file : m_tracker.tracked_files()) {
            frontier.push_back(file->name);
        }

        for (int iteration = 0; iteration < MAX_SYNC_ITERATIONS && !frontier.empty(); ++iteration) {
            std::vector<std::string> new_ids;
            for (const auto& name : frontier) {
                drain_file(name, result, new_ids);
            }

            // Only files that were not tracked before become the next frontier, so cycles end here
            frontier.clear();
            for (auto* file : m_tracker.discover_new_files(new_ids)) {
                log::info("SyncEngine") << "Discovered new file: path=" << file->path << " type=" << to_string(file->kind);
                frontier.push_back(file->name);
            }
        }

        return result;
    }

    void SyncEngine::drain_file(const std::string& name, SyncResult& result, std::vector<std::string>& new_ids) {
        // Looked up by name: reconciliation may have changed the cursor since the frontier was built
        TrackedFile* file = m_tracker.find(name);
        if (!file || !m_tracker.has_file_changed(*file)) return;

        const Redactor* redactor = m_redactor ? &*m_redactor : nullptr;

        while (true) {
            std::optional<Chunk> chunk;
            try {
                chunk = m_tracker.read_chunk(*file, redactor, m_options.max_chunk_bytes);
            } catch (const SyncError& e) {
                log::error("SyncEngine") << "Failed to read chunk: file=" << file->path << " error=" << e.what();
                remember(result, e);
                return;
            }
            if (!chunk) return;

            new_ids.insert(new_ids.end(), chunk->reference_ids.begin(), chunk->reference_ids.end());

            if (file->kind == FileKind::Root) {
                ExtractionResult extracted = extract_metadata_from_lines(chunk->lines);
                if (!chunk->metadata) chunk->metadata = ChunkMetadata{};
                chunk->metadata->summary = extracted.summary;
                chunk->metadata->first_user_message = extracted.first_user_message;

                for (const auto& link : extracted.summary_links) {
                    link_summary_to_previous_session(link);
                }
            }

            ChunkRequest request;
            request.session_id = m_session_id;
            request.file_name = chunk->file_name;
            request.file_type = to_string(chunk->kind);
            request.first_line = chunk->first_line;
            request.lines = chunk->lines;
            request.metadata = chunk->metadata;

            int last_line = 0;
            try {
                last_line = m_client->upload_chunk(request);
            } catch (const SyncError& e) {
                log::error("SyncEngine") << "Failed to upload chunk: file=" << chunk->file_name
                                         << " first_line=" << chunk->first_line
                                         << " lines=" << chunk->lines.size() << " error=" << e.what();
                remember(result, e);

                // The backend may have stored the chunk anyway; resume from its cursor, not ours
                if (e.is_ambiguous()) {
                    try {
                        refresh_state_from_backend();
                    } catch (const SyncError& refresh_error) {
                        log::error("SyncEngine") << "Failed to refresh state from backend: " << refresh_error.what();
                        if (refresh_error.kind() == SyncError::Kind::Unauthorized) {
                            result.error = refresh_error;
                        }
                    }
                }
                return;
            }

            m_tracker.update_after_sync(*file, last_line, chunk->new_offset);
            ++result.chunks;

            log::debug("SyncEngine") << "Synced file: file=" << chunk->file_name << " first_line=" << chunk->first_line
                                     << " last_line=" << last_line << " lines=" << chunk->lines.size();
        }
    }

    void SyncEngine::refresh_state_from_backend() {
        InitResponse resp = m_client->init(m_options.external_id, m_options.transcript_path.string(), std::nullopt);
        m_tracker.init_from_backend_state(resp.files);
        log::info("SyncEngine") << "Refreshed sync state from backend: files=" << resp.files.size();
    }

    void SyncEngine::link_summary_to_previous_session(const SummaryLink& link) {
        log::debug("SyncEngine") << "Found summary with leafUuid: " << link.leaf_uuid;

        const auto dir = m_options.transcript_path.parent_path();
        const auto current = m_options.transcript_path.filename().string();
        std::string previous = find_session_by_leaf_uuid(dir, link.leaf_uuid, current);
        if (previous.empty()) {
            log::debug("SyncEngine") << "No matching session found for leafUuid: " << link.leaf_uuid;
            return;
        }

        log::info("SyncEngine") << "Linking summary to previous session: " << previous;
        try {
            m_client->update_session_summary(previous, link.summary);
        } catch (const SyncError& e) {
            log::error("SyncEngine") << "Failed to update summary for session " << previous << ": " << e.what();
            return;
        }
        log::info("SyncEngine") << "Updated summary for session " << previous;
    }

    void SyncEngine::send_session_end(const json& payload, std::chrono::system_clock::time_point timestamp) {
        if (!m_initialized || m_session_id.empty()) return;

        m_client->send_event(m_session_id, "session_end", timestamp, payload);
        log::info("SyncEngine") << "Sent session_end event: session_id=" << m_session_id;
    }

    SyncResult SyncEngine::end_session(const json& payload, std::chrono::system_clock::time_point timestamp) {
        SyncResult result = sync_all();
        if (result.error) {
            log::error("SyncEngine") << "Sync before session_end failed: " << result.error->what();
            if (result.error->kind() == SyncError::Kind::Unauthorized) return result;
        }

        try {
            send_session_end(payload, timestamp);
        } catch (const SyncError& e) {
            log::error("SyncEngine") << "Failed to send session_end: " << e.what();
            if (!result.error) result.error = e;
        }
        return result;
    }

    std::map<std::string, int> SyncEngine::sync_stats() {
        std::map<std::string, int> stats;
        for (auto* file : m_tracker.tracked_files()) {
            stats[file->name] = file->last_synced_line;
        }
        return stats;
    }

    void SyncEngine::reset() {
        m_initialized = false;
        m_session_id.clear();
    }

}
