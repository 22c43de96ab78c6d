#pragma once

#include <filesystem>
#include <string>

namespace ferry::engine {

    // How many lines from the end of a transcript are searched for a leaf uuid.
    constexpr int LEAF_SEARCH_LINES = 10;

    /**
     * @brief Finds the session transcript in dir whose last lines contain a message with uuid == leaf_uuid.
     * Agent files and exclude_file are skipped.
     * @return The session id (file stem), or an empty string.
     */
    std::string find_session_by_leaf_uuid(const std::filesystem::path& dir,
                                          const std::string& leaf_uuid,
                                          const std::string& exclude_file);

    /**
     * @brief True if one of the last LEAF_SEARCH_LINES lines of path carries uuid == target_uuid.
     */
    bool has_uuid_in_last_lines(const std::filesystem::path& path, const std::string& target_uuid);

}
