#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ferry::engine {

    // Backend limit for metadata fields; first user messages are cut to half of it.
    constexpr size_t MAX_METADATA_FIELD_SIZE = 8 * 1024;

    constexpr size_t REFERENCE_ID_LENGTH = 8;

    struct SummaryLink {
        std::string summary;
        std::string leaf_uuid;
    };

    struct ExtractionResult {
        std::string summary;                    // Local summary (no leafUuid), last one wins
        std::string first_user_message;
        std::vector<SummaryLink> summary_links; // Summaries pointing at an earlier session
    };

    /**
     * @brief Branch and working directory recorded on a transcript message.
     */
    struct BranchHint {
        std::string branch;
        std::string cwd;
    };

    /**
     * @brief Sub-session reference ids carried by a user message's tool results.
     */
    std::vector<std::string> extract_reference_ids(const nlohmann::json& message);

    bool is_valid_reference_id(const std::string& id);

    /**
     * @brief Transitive file name for a reference id.
     */
    std::string reference_file_name(const std::string& id);

    /**
     * @brief Returns the gitBranch/cwd pair of a message, if it has a non-empty branch.
     */
    std::optional<BranchHint> extract_branch_hint(const nlohmann::json& message);

    /**
     * @brief Scans transcript lines for the session summary and first user message.
     */
    ExtractionResult extract_metadata_from_lines(const std::vector<std::string>& lines);

    /**
     * @brief Strips HTML tags, decodes entities and collapses whitespace.
     */
    std::string sanitize_text(const std::string& input);

    /**
     * @brief Truncates to max_bytes on a UTF-8 boundary, appending "..." when cut.
     */
    std::string truncate_utf8(const std::string& input, size_t max_bytes);

}
