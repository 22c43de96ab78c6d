#include "summary_link.hpp"
#include "log.hpp"
#include <algorithm>
#include <fstream>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ferry::engine {

    namespace {

        constexpr std::streamoff TAIL_BLOCK_SIZE = 64 * 1024;

        // Reads backwards block by block until enough complete lines are buffered.
        std::vector<std::string> read_last_lines(std::ifstream& in, std::streamoff size, int count) {
            std::string tail;
            std::streamoff start = size;
            while (start > 0) {
                std::streamoff block = std::min(TAIL_BLOCK_SIZE, start);
                start -= block;
                std::string buffer(static_cast<size_t>(block), '\0');
                in.seekg(start);
                if (!in.read(buffer.data(), block)) return {};
                tail.insert(0, buffer);
                if (std::count(tail.begin(), tail.end(), '\n') > count) break;
            }

            if (!tail.empty() && tail.back() == '\n') tail.pop_back();

            std::vector<std::string> lines;
            size_t end = tail.size();
            while (static_cast<int>(lines.size()) < count) {
                size_t newline = end == 0 ? std::string::npos : tail.rfind('\n', end - 1);
                size_t begin = newline == std::string::npos ? 0 : newline + 1;
                lines.push_back(tail.substr(begin, end - begin));
                if (newline == std::string::npos) break;
                end = newline;
            }
            return lines;
        }

    }

    bool has_uuid_in_last_lines(const fs::path& path, const std::string& target_uuid) {
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        if (!in.is_open()) return false;

        std::streamoff size = in.tellg();
        if (size <= 0) return false;

        for (const auto& line : read_last_lines(in, size, LEAF_SEARCH_LINES)) {
            json msg = json::parse(line, nullptr, false);
            if (msg.is_discarded() || !msg.is_object()) continue;

            auto uuid = msg.find("uuid");
            if (uuid != msg.end() && uuid->is_string() && uuid->get<std::string>() == target_uuid) {
                return true;
            }
        }
        return false;
    }

    std::string find_session_by_leaf_uuid(const fs::path& dir, const std::string& leaf_uuid, const std::string& exclude_file) {
        std::error_code ec;
        std::vector<fs::path> candidates;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_regular_file(type_ec)) continue;

            const std::string name = it->path().filename().string();
            if (it->path().extension() != ".jsonl") continue;
            if (name.rfind("agent-", 0) == 0) continue;
            if (name == exclude_file) continue;
            candidates.push_back(it->path());
        }
        if (ec) {
            log::debug("SummaryLink") << "Failed to read transcript directory " << dir << ": " << ec.message();
            return "";
        }

        std::sort(candidates.begin(), candidates.end());
        for (const auto& path : candidates) {
            if (has_uuid_in_last_lines(path, leaf_uuid)) return path.stem().string();
        }
        return "";
    }

}
