#include "vcs.hpp"
#include "log.hpp"
#include <array>
#include <cstdio>
#include <sys/wait.h>

namespace ferry::engine {

    class GitCliDetector : public VcsDetector {
    public:
        std::optional<GitInfo> detect(const std::filesystem::path& dir) override {
            if (dir.empty()) return std::nullopt;

            auto inside = run(dir, "rev-parse --is-inside-work-tree");
            if (!inside || *inside != "true") return std::nullopt;

            GitInfo info;
            info.repo_url = run(dir, "remote get-url origin").value_or("");
            info.branch = run(dir, "rev-parse --abbrev-ref HEAD").value_or("");
            info.commit_sha = run(dir, "rev-parse HEAD").value_or("");
            info.commit_message = run(dir, "log -1 --format=%s").value_or("");
            info.author = run(dir, "log -1 \"--format=%an <%ae>\"").value_or("");
            info.is_dirty = !run(dir, "status --porcelain").value_or("").empty();
            return info;
        }

        std::string repo_url(const std::filesystem::path& dir) override {
            if (dir.empty()) return "";
            return run(dir, "remote get-url origin").value_or("");
        }

    private:
        static std::string quote(const std::string& arg) {
            std::string out = "'";
            for (char c : arg) {
                if (c == '\'') out += "'\\''";
                else out += c;
            }
            return out + "'";
        }

        // Runs a git subcommand in dir. Returns trimmed stdout, or std::nullopt on non-zero exit.
        static std::optional<std::string> run(const std::filesystem::path& dir, const std::string& args) {
            std::string command = "git -C " + quote(dir.string()) + " " + args + " 2>/dev/null";
            FILE* pipe = popen(command.c_str(), "r");
            if (!pipe) {
                log::debug("GitCliDetector") << "popen failed for: " << command;
                return std::nullopt;
            }

            std::string output;
            std::array<char, 512> buffer;
            size_t n;
            while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
                output.append(buffer.data(), n);
            }

            int status = pclose(pipe);
            if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) return std::nullopt;

            while (!output.empty() && (output.back() == '\n' || output.back() == '\r' || output.back() == ' ')) {
                output.pop_back();
            }
            return output;
        }
    };

    std::unique_ptr<VcsDetector> create_git_detector() {
        return std::make_unique<GitCliDetector>();
    }

}
