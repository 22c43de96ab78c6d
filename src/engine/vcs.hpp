#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "ferry/types.hpp"

namespace ferry::engine {

    /**
     * @brief Best-effort version-control metadata provider.
     * Implementations never throw; absence of information is reported as empty results.
     */
    class VcsDetector {
    public:
        virtual ~VcsDetector() = default;

        /**
         * @brief Describes the repository containing dir, or std::nullopt if there is none.
         */
        virtual std::optional<GitInfo> detect(const std::filesystem::path& dir) = 0;

        /**
         * @brief Remote URL of the repository containing dir, empty if unknown.
         */
        virtual std::string repo_url(const std::filesystem::path& dir) = 0;
    };

    std::unique_ptr<VcsDetector> create_git_detector();

}
