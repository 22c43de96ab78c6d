#include "extract.hpp"
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace ferry::engine {

    namespace {

        std::string string_field(const json& obj, const char* key) {
            if (!obj.is_object()) return "";
            auto it = obj.find(key);
            if (it == obj.end() || !it->is_string()) return "";
            return it->get<std::string>();
        }

        void append_valid_id(const json& tool_use_result, std::vector<std::string>& out) {
            std::string id = string_field(tool_use_result, "agentId");
            if (is_valid_reference_id(id)) out.push_back(id);
        }

        // Text of a message: string content, or the first non-empty text block.
        std::string message_text(const json& entry) {
            auto message = entry.find("message");
            if (message == entry.end() || !message->is_object()) return "";

            auto content = message->find("content");
            if (content == message->end()) return "";
            if (content->is_string()) return content->get<std::string>();

            if (content->is_array()) {
                for (const auto& block : *content) {
                    if (string_field(block, "type") != "text") continue;
                    std::string text = string_field(block, "text");
                    if (!text.empty()) return text;
                }
            }
            return "";
        }

        void append_utf8(std::string& out, unsigned long cp) {
            if (cp < 0x80) {
                out += static_cast<char>(cp);
            } else if (cp < 0x800) {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp < 0x10000) {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            } else if (cp <= 0x10FFFF) {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        // Removes every "<...>" run. A '<' with no closing '>' after it is kept as text.
        std::string strip_tags(const std::string& input) {
            std::string out;
            out.reserve(input.size());
            size_t i = 0;
            while (i < input.size()) {
                size_t open = input.find('<', i);
                if (open == std::string::npos) break;
                size_t close = input.find('>', open + 1);
                if (close == std::string::npos) break;
                out.append(input, i, open - i);
                i = close + 1;
            }
            out.append(input, i, std::string::npos);
            return out;
        }

        std::string decode_entities(const std::string& input) {
            static const std::pair<const char*, const char*> named[] = {
                {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""},
                {"apos", "'"}, {"nbsp", "\xC2\xA0"},
            };

            std::string out;
            out.reserve(input.size());
            size_t i = 0;
            while (i < input.size()) {
                size_t semi = input[i] == '&' ? input.find(';', i + 1) : std::string::npos;
                if (semi == std::string::npos || semi - i > 10) {
                    out += input[i++];
                    continue;
                }

                std::string name = input.substr(i + 1, semi - i - 1);
                bool decoded = false;

                if (name.size() > 1 && name[0] == '#') {
                    bool hex = name[1] == 'x' || name[1] == 'X';
                    std::string digits = name.substr(hex ? 2 : 1);
                    if (!digits.empty() && digits.find_first_not_of(hex ? "0123456789abcdefABCDEF" : "0123456789") == std::string::npos) {
                        append_utf8(out, std::stoul(digits, nullptr, hex ? 16 : 10));
                        decoded = true;
                    }
                } else {
                    for (const auto& [entity, text] : named) {
                        if (name == entity) {
                            out += text;
                            decoded = true;
                            break;
                        }
                    }
                }

                if (decoded) {
                    i = semi + 1;
                } else {
                    out += input[i++];
                }
            }
            return out;
        }

    }

    bool is_valid_reference_id(const std::string& id) {
        if (id.size() != REFERENCE_ID_LENGTH) return false;
        for (unsigned char c : id) {
            if (!std::isxdigit(c)) return false;
        }
        return true;
    }

    std::string reference_file_name(const std::string& id) {
        return "agent-" + id + ".jsonl";
    }

    std::vector<std::string> extract_reference_ids(const json& message) {
        std::vector<std::string> ids;
        if (string_field(message, "type") != "user") return ids;

        auto root_result = message.find("toolUseResult");
        if (root_result != message.end()) append_valid_id(*root_result, ids);

        auto nested = message.find("message");
        if (nested == message.end() || !nested->is_object()) return ids;
        auto content = nested->find("content");
        if (content == nested->end() || !content->is_array()) return ids;

        for (const auto& block : *content) {
            if (string_field(block, "type") != "tool_result") continue;
            auto result_content = block.find("content");
            if (result_content == block.end() || !result_content->is_object()) continue;
            auto tool_use_result = result_content->find("toolUseResult");
            if (tool_use_result != result_content->end()) append_valid_id(*tool_use_result, ids);
        }
        return ids;
    }

    std::optional<BranchHint> extract_branch_hint(const json& message) {
        std::string branch = string_field(message, "gitBranch");
        if (branch.empty()) return std::nullopt;
        return BranchHint{branch, string_field(message, "cwd")};
    }

    ExtractionResult extract_metadata_from_lines(const std::vector<std::string>& lines) {
        ExtractionResult result;

        for (const auto& line : lines) {
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

            json entry = json::parse(line, nullptr, false);
            if (entry.is_discarded() || !entry.is_object()) continue;

            std::string type = string_field(entry, "type");

            if (result.first_user_message.empty() && type == "user") {
                std::string text = message_text(entry);
                if (!text.empty()) {
                    result.first_user_message = truncate_utf8(sanitize_text(text), MAX_METADATA_FIELD_SIZE / 2);
                }
            }

            if (type == "summary") {
                std::string summary = string_field(entry, "summary");
                std::string leaf_uuid = string_field(entry, "leafUuid");
                if (summary.empty()) continue;

                if (!leaf_uuid.empty()) {
                    result.summary_links.push_back({sanitize_text(summary), leaf_uuid});
                } else {
                    result.summary = sanitize_text(summary);
                }
            }
        }

        return result;
    }

    std::string sanitize_text(const std::string& input) {
        std::string decoded = decode_entities(strip_tags(input));

        std::istringstream words(decoded);
        std::string word;
        std::string out;
        while (words >> word) {
            if (!out.empty()) out += ' ';
            out += word;
        }
        return out;
    }

    std::string truncate_utf8(const std::string& input, size_t max_bytes) {
        if (input.size() <= max_bytes) return input;
        if (max_bytes <= 3) return "...";

        size_t cut = max_bytes - 3;
        // Back off to the start of the code point that straddles the cut
        while (cut > 0 && (static_cast<unsigned char>(input[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        return input.substr(0, cut) + "...";
    }

}
