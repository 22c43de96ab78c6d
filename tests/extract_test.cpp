#include <gtest/gtest.h>
#include "engine/extract.hpp"
#include <nlohmann/json.hpp>

using namespace ferry::engine;
using json = nlohmann::json;

TEST(ExtractReferenceIdsTest, RootToolUseResult) {
    json msg = {{"type", "user"}, {"toolUseResult", {{"agentId", "0123abcd"}}}};
    EXPECT_EQ(extract_reference_ids(msg), std::vector<std::string>{"0123abcd"});
}

TEST(ExtractReferenceIdsTest, NestedToolResultBlocks) {
    json msg = json::parse(R"({
        "type": "user",
        "message": {"content": [
            {"type": "text", "text": "hi"},
            {"type": "tool_result", "content": {"toolUseResult": {"agentId": "aaaabbbb"}}},
            {"type": "tool_result", "content": "plain text result"},
            {"type": "tool_result", "content": {"toolUseResult": {"agentId": "ccccdddd"}}}
        ]}
    })");
    EXPECT_EQ(extract_reference_ids(msg), (std::vector<std::string>{"aaaabbbb", "ccccdddd"}));
}

TEST(ExtractReferenceIdsTest, OnlyUserMessages) {
    json msg = {{"type", "assistant"}, {"toolUseResult", {{"agentId", "0123abcd"}}}};
    EXPECT_TRUE(extract_reference_ids(msg).empty());
}

TEST(ExtractReferenceIdsTest, RejectsMalformedIds) {
    EXPECT_TRUE(is_valid_reference_id("deadbeef"));
    EXPECT_TRUE(is_valid_reference_id("DEADBEEF"));
    EXPECT_FALSE(is_valid_reference_id("deadbee"));
    EXPECT_FALSE(is_valid_reference_id("deadbeef0"));
    EXPECT_FALSE(is_valid_reference_id("../../et"));
    EXPECT_FALSE(is_valid_reference_id(""));

    json msg = {{"type", "user"}, {"toolUseResult", {{"agentId", 12345678}}}};
    EXPECT_TRUE(extract_reference_ids(msg).empty());
}

TEST(ExtractReferenceIdsTest, FileNameForId) {
    EXPECT_EQ(reference_file_name("deadbeef"), "agent-deadbeef.jsonl");
}

TEST(ExtractBranchHintTest, RequiresBranch) {
    EXPECT_FALSE(extract_branch_hint(json{{"cwd", "/x"}}).has_value());
    EXPECT_FALSE(extract_branch_hint(json{{"gitBranch", ""}}).has_value());

    auto hint = extract_branch_hint(json{{"gitBranch", "main"}, {"cwd", "/repo"}});
    ASSERT_TRUE(hint.has_value());
    EXPECT_EQ(hint->branch, "main");
    EXPECT_EQ(hint->cwd, "/repo");
}

TEST(ExtractMetadataTest, FirstUserMessageAndSummaries) {
    std::vector<std::string> lines = {
        R"({"type":"summary","summary":"Earlier work","leafUuid":"leaf-1"})",
        R"({"type":"assistant","message":{"content":"ignored"}})",
        R"({"type":"user","message":{"content":[{"type":"text","text":""},{"type":"text","text":"Fix   the <b>parser</b> &amp; tests"}]}})",
        R"({"type":"user","message":{"content":"second message"}})",
        "not json",
        "",
        R"({"type":"summary","summary":"First title"})",
        R"({"type":"summary","summary":"Final title"})",
    };

    auto result = extract_metadata_from_lines(lines);
    EXPECT_EQ(result.first_user_message, "Fix the parser & tests");
    EXPECT_EQ(result.summary, "Final title");
    ASSERT_EQ(result.summary_links.size(), 1u);
    EXPECT_EQ(result.summary_links[0].summary, "Earlier work");
    EXPECT_EQ(result.summary_links[0].leaf_uuid, "leaf-1");
}

TEST(ExtractMetadataTest, LongFirstMessageIsTruncated) {
    json line = {{"type", "user"}, {"message", {{"content", std::string(10000, 'a')}}}};
    auto result = extract_metadata_from_lines({line.dump()});
    EXPECT_EQ(result.first_user_message.size(), MAX_METADATA_FIELD_SIZE / 2);
    EXPECT_EQ(result.first_user_message.substr(result.first_user_message.size() - 3), "...");
}

TEST(SanitizeTextTest, StripsTagsDecodesEntitiesAndCollapsesWhitespace) {
    EXPECT_EQ(sanitize_text("  <p>Hello</p>\n\n<i>world</i>  "), "Hello world");
    EXPECT_EQ(sanitize_text("a &lt;b&gt; &quot;c&quot; &#39;d&#39; &#x41;"), "a <b> \"c\" 'd' A");
    EXPECT_EQ(sanitize_text("AT&T &unknown; &"), "AT&T &unknown; &");
}

TEST(SanitizeTextTest, UnclosedAngleBracketIsKept) {
    EXPECT_EQ(sanitize_text("x <y"), "x <y");
    EXPECT_EQ(sanitize_text("a <b>c</b> < d"), "a c < d");

    const std::string text = "if (a < b) " + std::string(100000, 'y');
    EXPECT_EQ(sanitize_text(text), text);
}

TEST(ExtractMetadataTest, LongMessageWithComparisonIsExtracted) {
    const std::string text = "if (a < b) " + std::string(100000, 'y');
    json line = {{"type", "user"}, {"message", {{"content", text}}}};
    auto result = extract_metadata_from_lines({R"({"x":1e999})", line.dump()});
    EXPECT_EQ(result.first_user_message.size(), MAX_METADATA_FIELD_SIZE / 2);
    EXPECT_EQ(result.first_user_message.rfind("if (a < b) yyy", 0), 0u);
}

TEST(TruncateUtf8Test, KeepsShortInput) {
    EXPECT_EQ(truncate_utf8("short", 10), "short");
}

TEST(TruncateUtf8Test, DoesNotSplitMultibyteCharacters) {
    // "é" is two bytes; a cut at byte 2 would land inside the first one
    const std::string input = "a\xC3\xA9\xC3\xA9\xC3\xA9";
    EXPECT_EQ(truncate_utf8(input, 5), "a...");
    EXPECT_EQ(truncate_utf8(input, 6), "a\xC3\xA9...");
}
