#include "tracker.hpp"
#include "extract.hpp"
#include "log.hpp"
#include "ferry/errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ferry::engine {

    namespace {

        // JSON array encoding overhead per line: quotes, comma, escaping slack
        constexpr size_t LINE_OVERHEAD_BYTES = 4;

    }

    FileTracker::FileTracker(const fs::path& root_path, std::shared_ptr<VcsDetector> vcs)
        : m_root_path(root_path),
          m_root_dir(root_path.parent_path()),
          m_root_name(root_path.filename().string()),
          m_vcs(std::move(vcs)) {
        register_file(m_root_name, FileKind::Root);
    }

    TrackedFile& FileTracker::register_file(const std::string& name, FileKind kind) {
        TrackedFile file;
        file.path = name == m_root_name ? m_root_path : m_root_dir / name;
        file.name = name;
        file.kind = kind;
        return m_files.insert_or_assign(name, std::move(file)).first->second;
    }

    void FileTracker::init_from_backend_state(const std::map<std::string, FileState>& backend_files) {
        for (auto& [name, file] : m_files) {
            auto it = backend_files.find(name);
            file.last_synced_line = it != backend_files.end() ? it->second.last_synced_line : 0;
            file.byte_offset = 0; // Set again by the first read
            file.has_snapshot = false;
        }

        for (const auto& [name, state] : backend_files) {
            if (is_tracked(name)) continue;
            if (fs::path(name).filename().string() != name) {
                log::warn("FileTracker") << "Ignoring backend file with a path component: " << name;
                continue;
            }
            TrackedFile& file = register_file(name, name == m_root_name ? FileKind::Root : FileKind::Transitive);
            file.last_synced_line = state.last_synced_line;
        }

        if (!is_tracked(m_root_name)) register_file(m_root_name, FileKind::Root);
    }

    std::vector<TrackedFile*> FileTracker::tracked_files() {
        std::vector<TrackedFile*> result;
        result.reserve(m_files.size());
        if (auto* root = root_file()) result.push_back(root);
        for (auto& [name, file] : m_files) {
            if (name != m_root_name) result.push_back(&file);
        }
        return result;
    }

    TrackedFile* FileTracker::find(const std::string& name) {
        auto it = m_files.find(name);
        return it == m_files.end() ? nullptr : &it->second;
    }

    bool FileTracker::is_tracked(const std::string& name) const {
        return m_files.count(name) > 0;
    }

    TrackedFile* FileTracker::root_file() {
        return find(m_root_name);
    }

    bool FileTracker::has_file_changed(const TrackedFile& file) const {
        std::error_code ec;
        auto size = fs::file_size(file.path, ec);
        if (ec) return true;
        auto mtime = fs::last_write_time(file.path, ec);
        if (ec) return true;

        // Steady state: more bytes on disk than we have shipped
        if (file.byte_offset > 0 && file.byte_offset < size) return true;

        // Fresh files have no offset history, only the snapshot
        return !file.has_snapshot || mtime != file.last_write_time || size != file.last_size;
    }

    std::optional<Chunk> FileTracker::read_chunk(const TrackedFile& file, const Redactor* redactor, size_t max_bytes) {
        std::ifstream in(file.path, std::ios::binary);
        if (!in.is_open()) {
            throw SyncError(SyncError::Kind::LocalIo, "failed to open file: " + file.path.string());
        }

        bool reading_from_start = true;
        std::uintmax_t current_offset = 0;

        if (file.byte_offset > 0 && file.last_synced_line > 0) {
            in.seekg(static_cast<std::streamoff>(file.byte_offset));
            if (in.fail()) {
                log::debug("FileTracker") << "Seek to offset " << file.byte_offset << " failed in " << file.path
                                          << ", falling back to start";
                in.clear();
                in.seekg(0);
            } else {
                reading_from_start = false;
                current_offset = file.byte_offset;
            }
        }

        int line_num = reading_from_start ? 0 : file.last_synced_line;
        size_t total_bytes = 0;
        std::optional<std::uintmax_t> stop_offset;

        std::set<std::string> seen_ids = m_known_ids;
        std::vector<std::string> new_ids;
        std::optional<GitInfo> git_info;
        std::vector<std::string> lines;

        std::string line;
        while (std::getline(in, line)) {
            ++line_num;
            const std::uintmax_t line_with_newline = line.size() + 1;

            if (reading_from_start && line_num <= file.last_synced_line) {
                current_offset += line_with_newline;
                continue;
            }

            const size_t line_bytes = line.size() + LINE_OVERHEAD_BYTES;
            if (total_bytes + line_bytes > max_bytes) {
                if (total_bytes == 0) {
                    throw SyncError(SyncError::Kind::LocalIo,
                                    "line " + std::to_string(line_num) + " exceeds max chunk size (" +
                                    std::to_string(line_bytes) + " bytes > " + std::to_string(max_bytes) + " bytes)");
                }
                // This line is read again on the next call
                stop_offset = current_offset;
                break;
            }
            total_bytes += line_bytes;
            current_offset += line_with_newline;

            // Extraction sees the raw line; redaction could hide ids and branch names
            json msg = json::parse(line, nullptr, false);
            if (!msg.is_discarded() && msg.is_object()) {
                for (auto& id : extract_reference_ids(msg)) {
                    if (seen_ids.insert(id).second) new_ids.push_back(id);
                }

                if (file.kind == FileKind::Root && !git_info) {
                    if (auto hint = extract_branch_hint(msg)) {
                        GitInfo info;
                        info.branch = hint->branch;
                        if (m_vcs && !hint->cwd.empty()) info.repo_url = m_vcs->repo_url(hint->cwd);
                        git_info = info;
                    }
                }
            }

            lines.push_back(redactor ? redactor->redact_json_line(line) : line);
        }

        if (in.bad()) {
            throw SyncError(SyncError::Kind::LocalIo, "failed to scan file: " + file.path.string());
        }

        if (lines.empty()) return std::nullopt;

        std::uintmax_t new_offset = current_offset;
        if (stop_offset) {
            new_offset = *stop_offset;
        } else {
            in.clear();
            const std::streamoff pos = in.tellg();
            if (pos >= 0 && static_cast<std::uintmax_t>(pos) != current_offset) {
                log::debug("FileTracker") << "Offset discrepancy in " << file.path << ": tracked=" << current_offset
                                          << ", stream=" << pos << " (possible missing trailing newline)";
            }
        }

        Chunk chunk;
        chunk.file_name = file.name;
        chunk.kind = file.kind;
        chunk.first_line = file.last_synced_line + 1;
        chunk.lines = std::move(lines);
        chunk.new_offset = new_offset;
        chunk.reference_ids = std::move(new_ids);
        if (git_info) {
            chunk.metadata = ChunkMetadata{};
            chunk.metadata->git_info = std::move(git_info);
        }
        return chunk;
    }

    void FileTracker::update_after_sync(TrackedFile& file, int last_line, std::uintmax_t new_offset) {
        file.last_synced_line = last_line;
        file.byte_offset = new_offset;

        std::error_code size_ec, time_ec;
        auto size = fs::file_size(file.path, size_ec);
        auto mtime = fs::last_write_time(file.path, time_ec);
        if (!size_ec && !time_ec) {
            file.last_size = size;
            file.last_write_time = mtime;
            file.has_snapshot = true;
        }
    }

    std::vector<TrackedFile*> FileTracker::discover_new_files(const std::vector<std::string>& new_ids) {
        m_known_ids.insert(new_ids.begin(), new_ids.end());

        // Every known id, not just the new ones: a file may appear after its id was first seen
        std::vector<TrackedFile*> discovered;
        for (const auto& id : m_known_ids) {
            const std::string name = reference_file_name(id);
            if (is_tracked(name)) continue;

            std::error_code ec;
            if (!fs::exists(m_root_dir / name, ec)) continue;

            discovered.push_back(&register_file(name, FileKind::Transitive));
        }
        return discovered;
    }

}
