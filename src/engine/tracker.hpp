#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "ferry/types.hpp"
#include "redactor.hpp"
#include "vcs.hpp"

namespace ferry::engine {

    // Backend rejects chunks over 16MB; leave room for JSON encoding overhead.
    constexpr size_t DEFAULT_MAX_CHUNK_BYTES = 14 * 1024 * 1024;

    /**
     * @brief Owns the per-file sync cursors of one session and reads new content from disk.
     *
     * Files live in a node-based map, so TrackedFile references stay valid for the
     * tracker's lifetime. Files are never removed.
     */
    class FileTracker {
    public:
        FileTracker(const std::filesystem::path& root_path, std::shared_ptr<VcsDetector> vcs = nullptr);

        /**
         * @brief Makes the cursor table match the backend's view.
         *
         * Every tracked file takes the backend's last_synced_line (0 if the backend does not
         * list it), with its byte offset and stat snapshot cleared. Backend files that are
         * not tracked yet are registered. The root file is always present.
         */
        void init_from_backend_state(const std::map<std::string, FileState>& backend_files);

        /**
         * @brief Root file first, then the others ordered by name.
         */
        std::vector<TrackedFile*> tracked_files();

        TrackedFile* find(const std::string& name);
        bool is_tracked(const std::string& name) const;
        TrackedFile* root_file();

        const std::filesystem::path& root_path() const { return m_root_path; }

        /**
         * @brief True when the file may hold unsynced data. Does not modify any state.
         * A file that cannot be stat'ed counts as changed.
         */
        bool has_file_changed(const TrackedFile& file) const;

        /**
         * @brief Reads the next run of whole lines after the file's cursor, within max_bytes.
         *
         * Lines are redacted (if a redactor is given) after reference ids and VCS hints
         * have been extracted from the raw text.
         *
         * @return std::nullopt if there are no new lines.
         * @throws SyncError (LocalIo) if the file cannot be opened or the first pending line alone exceeds max_bytes.
         */
        std::optional<Chunk> read_chunk(const TrackedFile& file, const Redactor* redactor, size_t max_bytes = DEFAULT_MAX_CHUNK_BYTES);

        /**
         * @brief Advances the cursor and refreshes the stat snapshot.
         */
        void update_after_sync(TrackedFile& file, int last_line, std::uintmax_t new_offset);

        /**
         * @brief Adds ids to the known set, then registers every known id whose file now exists.
         * @return The newly registered files.
         */
        std::vector<TrackedFile*> discover_new_files(const std::vector<std::string>& new_ids);

        const std::set<std::string>& known_reference_ids() const { return m_known_ids; }

    private:
        std::filesystem::path m_root_path;
        std::filesystem::path m_root_dir;
        std::string m_root_name;
        std::shared_ptr<VcsDetector> m_vcs;
        std::map<std::string, TrackedFile> m_files;
        std::set<std::string> m_known_ids;

        TrackedFile& register_file(const std::string& name, FileKind kind);
    };

}
