#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace re2 {
    class RE2;
}

namespace ferry::engine {

    /**
     * @brief Declarative redaction pattern as written in the config file.
     * At least one of `pattern` (value regex) or `field_pattern` must be set.
     */
    struct RedactionPattern {
        std::string name;
        std::string pattern;
        std::string field_pattern;
        std::string type;
        int capture_group = 0; // 0 = replace the whole match
    };

    struct RedactionConfig {
        bool enabled = false;
        bool use_default_patterns = true;
        std::vector<RedactionPattern> patterns;
    };

    /**
     * @brief Built-in high-precision secret patterns, ordered from most to least specific.
     */
    std::vector<RedactionPattern> default_redaction_patterns();

    /**
     * @brief Compiled redaction pipeline. Immutable after compile(), safe to share between threads.
     */
    class Redactor {
    public:
        /**
         * @brief Compiles patterns in the given order.
         * @throws ConfigError if a pattern has neither regex or a regex does not compile.
         */
        static Redactor compile(const std::vector<RedactionPattern>& patterns);

        /**
         * @brief Builds a redactor from config: built-in patterns first (unless disabled), then user patterns.
         * Does not look at `enabled`.
         * @return std::nullopt when there is nothing to apply.
         */
        static std::optional<Redactor> from_config(const RedactionConfig& config);

        /**
         * @brief Applies value patterns only. Patterns that need a field name are skipped.
         */
        std::string redact_text(const std::string& input) const;

        /**
         * @brief Redacts JSON Lines content, one JSON value per line.
         * Blank lines keep their position, unparseable lines get redact_text().
         */
        std::string redact_lines(const std::string& input) const;

        /**
         * @brief Redacts a single JSON line, falling back to redact_text() when it does not parse.
         */
        std::string redact_json_line(const std::string& line) const;

        size_t pattern_count() const { return m_patterns.size(); }

    private:
        struct CompiledPattern {
            std::string name;
            std::shared_ptr<const re2::RE2> value;
            std::shared_ptr<const re2::RE2> field;
            std::string marker;
            int capture_group = 0;
        };

        explicit Redactor(std::vector<CompiledPattern> patterns) : m_patterns(std::move(patterns)) {}

        void redact_value(nlohmann::json& value, const std::string& field_name) const;
        std::string redact_string(const std::string& value, const std::string& field_name) const;
        static std::string apply(const std::string& input, const CompiledPattern& p);

        std::vector<CompiledPattern> m_patterns;
    };

}
