#include "sync_client.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <sys/utsname.h>

using json = nlohmann::json;

namespace ferry::engine {

    std::string build_user_agent(const std::string& version) {
        std::string os = "unknown";
        std::string arch = "unknown";
        struct utsname uts;
        if (uname(&uts) == 0) {
            os = uts.sysname;
            arch = uts.machine;
            for (auto& c : os) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return "ferry/" + (version.empty() ? std::string("dev") : version) + " (" + os + "; " + arch + ")";
    }

    void to_json(json& j, const GitInfo& info) {
        j = json::object();
        if (!info.repo_url.empty()) j["repo_url"] = info.repo_url;
        if (!info.branch.empty()) j["branch"] = info.branch;
        if (!info.commit_sha.empty()) j["commit_sha"] = info.commit_sha;
        if (!info.commit_message.empty()) j["commit_message"] = info.commit_message;
        if (!info.author.empty()) j["author"] = info.author;
        if (info.is_dirty) j["is_dirty"] = true;
    }

    void to_json(json& j, const InitMetadata& metadata) {
        j = json::object();
        if (!metadata.cwd.empty()) j["cwd"] = metadata.cwd;
        if (metadata.git_info) j["git_info"] = *metadata.git_info;
        if (!metadata.hostname.empty()) j["hostname"] = metadata.hostname;
        if (!metadata.username.empty()) j["username"] = metadata.username;
    }

    void to_json(json& j, const ChunkMetadata& metadata) {
        j = json::object();
        if (metadata.git_info) j["git_info"] = *metadata.git_info;
        if (!metadata.summary.empty()) j["summary"] = metadata.summary;
        if (!metadata.first_user_message.empty()) j["first_user_message"] = metadata.first_user_message;
    }

    void to_json(json& j, const ChunkRequest& request) {
        j = json{
            {"session_id", request.session_id},
            {"file_name", request.file_name},
            {"file_type", request.file_type},
            {"first_line", request.first_line},
            {"lines", request.lines}
        };
        if (request.metadata) j["metadata"] = *request.metadata;
    }

    void from_json(const json& j, InitResponse& response) {
        response.session_id = j.at("session_id").get<std::string>();
        response.files.clear();
        auto files = j.find("files");
        if (files == j.end() || files->is_null()) return;
        for (auto it = files->begin(); it != files->end(); ++it) {
            FileState state;
            state.last_synced_line = it.value().value("last_synced_line", 0);
            response.files[it.key()] = state;
        }
    }

    std::chrono::seconds retry_delay(const std::string& retry_after, std::chrono::seconds backoff, std::chrono::seconds max_delay) {
        std::chrono::seconds wait = backoff;
        if (!retry_after.empty()) {
            long long value = 0;
            const char* begin = retry_after.data();
            const char* end = begin + retry_after.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec == std::errc::result_out_of_range) {
                wait = max_delay;
            } else if (ec == std::errc() && ptr == end && value >= 0) {
                wait = std::chrono::seconds(std::min<long long>(value, max_delay.count()));
            }
        }
        return std::min(wait, max_delay);
    }

    std::string format_timestamp(std::chrono::system_clock::time_point tp) {
        auto seconds = std::chrono::system_clock::to_time_t(tp);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
        if (millis < 0) millis += 1000;

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream out;
        out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return out.str();
    }

}
