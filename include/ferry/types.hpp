#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace ferry::engine {

    enum class FileKind {
        Root,       // Primary session transcript
        Transitive  // Sub-session file discovered through a reference id
    };

    /**
     * @brief Wire name of a file kind ("transcript" / "agent").
     */
    inline const char* to_string(FileKind kind) {
        return kind == FileKind::Root ? "transcript" : "agent";
    }

    struct TrackedFile {
        std::filesystem::path path;
        std::string name;
        FileKind kind = FileKind::Root;
        int last_synced_line = 0;      // 1-based, 0 = nothing synced
        std::uintmax_t byte_offset = 0; // End of synced content

        // Stat snapshot, used only for change detection
        bool has_snapshot = false;
        std::filesystem::file_time_type last_write_time{};
        std::uintmax_t last_size = 0;
    };

    struct GitInfo {
        std::string repo_url;
        std::string branch;
        std::string commit_sha;
        std::string commit_message;
        std::string author;
        bool is_dirty = false;
    };

    struct ChunkMetadata {
        std::optional<GitInfo> git_info;
        std::string summary;
        std::string first_user_message;
    };

    struct Chunk {
        std::string file_name;
        FileKind kind = FileKind::Root;
        int first_line = 1;
        std::vector<std::string> lines;   // Post-redaction
        std::uintmax_t new_offset = 0;
        std::optional<ChunkMetadata> metadata;
        std::vector<std::string> reference_ids; // Local use only, never uploaded
    };

    /**
     * @brief Per-file cursor as reported by the backend.
     */
    struct FileState {
        int last_synced_line = 0;
    };

}
