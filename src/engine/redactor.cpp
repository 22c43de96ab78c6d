#include "redactor.hpp"
#include "ferry/errors.hpp"
#include <re2/re2.h>
#include <algorithm>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace ferry::engine {

    namespace {

        std::string make_marker(const std::string& type) {
            std::string upper = type;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return "[REDACTED:" + upper + "]";
        }

        // Patterns use RE2 (Go regexp) syntax, inline flags such as (?i) and (?s) included.
        std::shared_ptr<const re2::RE2> compile_regex(const std::string& source, const std::string& pattern_name, const char* what) {
            re2::RE2::Options options;
            options.set_log_errors(false);
            auto re = std::make_shared<re2::RE2>(source, options);
            if (!re->ok()) {
                throw ConfigError("failed to compile " + std::string(what) + " '" + pattern_name + "': " + re->error());
            }
            return re;
        }

        // Length of the UTF-8 sequence starting at text[pos], at least 1.
        size_t rune_length(const std::string& text, size_t pos) {
            size_t end = pos + 1;
            while (end < text.size() && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) ++end;
            return end - pos;
        }

        bool is_blank(const std::string& line) {
            return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
        }

    }

    Redactor Redactor::compile(const std::vector<RedactionPattern>& patterns) {
        std::vector<CompiledPattern> compiled;
        compiled.reserve(patterns.size());

        for (const auto& p : patterns) {
            if (p.pattern.empty() && p.field_pattern.empty()) {
                throw ConfigError("pattern '" + p.name + "' must have either pattern or field_pattern");
            }

            CompiledPattern cp;
            cp.name = p.name;
            cp.marker = make_marker(p.type);
            cp.capture_group = p.capture_group;
            if (!p.pattern.empty()) cp.value = compile_regex(p.pattern, p.name, "pattern");
            if (!p.field_pattern.empty()) cp.field = compile_regex(p.field_pattern, p.name, "field pattern");

            compiled.push_back(std::move(cp));
        }

        return Redactor(std::move(compiled));
    }

    std::optional<Redactor> Redactor::from_config(const RedactionConfig& config) {
        std::vector<RedactionPattern> patterns;
        if (config.use_default_patterns) {
            patterns = default_redaction_patterns();
        }
        patterns.insert(patterns.end(), config.patterns.begin(), config.patterns.end());

        if (patterns.empty()) return std::nullopt;
        return compile(patterns);
    }

    std::string Redactor::redact_text(const std::string& input) const {
        std::string result = input;
        for (const auto& p : m_patterns) {
            if (p.field || !p.value) continue;
            result = apply(result, p);
        }
        return result;
    }

    std::string Redactor::redact_lines(const std::string& input) const {
        std::ostringstream out;
        std::istringstream stream(input);
        std::string line;
        bool first = true;

        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();

            if (!first) out << '\n';
            first = false;

            if (is_blank(line)) continue;
            out << redact_json_line(line);
        }

        return out.str();
    }

    std::string Redactor::redact_json_line(const std::string& line) const {
        json value = json::parse(line, nullptr, false);
        if (value.is_discarded()) {
            // Not JSON (or a number nlohmann cannot hold): no field context, value patterns only
            return redact_text(line);
        }

        redact_value(value, "");
        return value.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    void Redactor::redact_value(json& value, const std::string& field_name) const {
        if (value.is_string()) {
            value = redact_string(value.get_ref<const std::string&>(), field_name);
        } else if (value.is_object()) {
            for (auto it = value.begin(); it != value.end(); ++it) {
                redact_value(it.value(), it.key());
            }
        } else if (value.is_array()) {
            // Elements share the field name of the array itself
            for (auto& element : value) {
                redact_value(element, field_name);
            }
        }
    }

    std::string Redactor::redact_string(const std::string& value, const std::string& field_name) const {
        std::string result = value;

        for (const auto& p : m_patterns) {
            if (p.field) {
                if (field_name.empty() || !re2::RE2::PartialMatch(field_name, *p.field)) continue;
                if (p.value) {
                    result = apply(result, p);
                } else {
                    result = p.marker;
                }
            } else if (p.value) {
                result = apply(result, p);
            }
        }

        return result;
    }

    std::string Redactor::apply(const std::string& input, const CompiledPattern& p) {
        const re2::RE2& re = *p.value;
        const int groups = re.NumberOfCapturingGroups();
        const int group = p.capture_group > 0 ? p.capture_group : 0;
        const int nsubmatch = group <= groups ? group + 1 : 1;
        std::vector<re2::StringPiece> submatch(static_cast<size_t>(nsubmatch));

        std::string out;
        size_t last = 0;
        size_t pos = 0;
        size_t prev_end = std::string::npos;
        bool changed = false;

        while (pos <= input.size() &&
               re.Match(input, pos, input.size(), re2::RE2::UNANCHORED, submatch.data(), nsubmatch)) {
            if (submatch[0].data() == nullptr) break;
            const auto match_start = static_cast<size_t>(submatch[0].data() - input.data());
            const auto match_end = match_start + submatch[0].size();

            // Span to replace: the whole match, or the group if it took part in the match
            size_t cut_start = match_start;
            size_t cut_end = match_end;
            // An empty match right after the previous match is not a match of its own
            const bool abutting = match_end == match_start && match_start == prev_end;
            bool replace = group == 0 && !abutting;
            if (!abutting && group > 0 && group < nsubmatch && submatch[group].data() != nullptr) {
                cut_start = static_cast<size_t>(submatch[group].data() - input.data());
                cut_end = cut_start + submatch[group].size();
                replace = true;
            }

            if (replace) {
                out.append(input, last, cut_start - last);
                out += p.marker;
                last = cut_end;
                changed = true;
            }
            if (!abutting) prev_end = match_end;

            if (match_end > match_start) {
                pos = match_end;
            } else if (match_end < input.size()) {
                pos = match_end + rune_length(input, match_end);
            } else {
                break;
            }
        }

        if (!changed) return input;
        out.append(input, last, std::string::npos);
        return out;
    }

}
