#include "temp_dir.hpp"
#include "engine/summary_link.hpp"

using namespace ferry::engine;

class SummaryLinkTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        write_lines("aaaaaaaa-1111-1111-1111-111111111111.jsonl", {
            R"({"type":"user","message":{"content":"Hello"}})",
            R"({"type":"assistant","message":{"content":"Hi there"}})",
            R"({"type":"user","message":{"content":"Thanks"},"uuid":"target-uuid-123"})",
        });
        write_lines("bbbbbbbb-2222-2222-2222-222222222222.jsonl", {
            R"({"type":"assistant","message":{"content":"Response"},"uuid":"different-uuid"})",
        });
        write_lines("cccccccc-3333-3333-3333-333333333333.jsonl", {
            R"({"type":"summary","summary":"Test","leafUuid":"target-uuid-123"})",
        });
        write_lines("agent-12345678.jsonl", {R"({"type":"agent","uuid":"agent-only-uuid"})"});
    }
};

TEST_F(SummaryLinkTest, FindsMatchingSession) {
    EXPECT_EQ(find_session_by_leaf_uuid(dir, "target-uuid-123", "cccccccc-3333-3333-3333-333333333333.jsonl"),
              "aaaaaaaa-1111-1111-1111-111111111111");
}

TEST_F(SummaryLinkTest, NoMatch) {
    EXPECT_EQ(find_session_by_leaf_uuid(dir, "nonexistent-uuid", "cccccccc-3333-3333-3333-333333333333.jsonl"), "");
}

TEST_F(SummaryLinkTest, ExcludesCurrentFile) {
    EXPECT_EQ(find_session_by_leaf_uuid(dir, "target-uuid-123", "aaaaaaaa-1111-1111-1111-111111111111.jsonl"), "");
}

TEST_F(SummaryLinkTest, SkipsAgentFiles) {
    EXPECT_EQ(find_session_by_leaf_uuid(dir, "agent-only-uuid", "none.jsonl"), "");
}

TEST_F(SummaryLinkTest, MissingDirectory) {
    EXPECT_EQ(find_session_by_leaf_uuid(dir / "nope", "target-uuid-123", ""), "");
}

TEST_F(SummaryLinkTest, OnlyLastLinesAreSearched) {
    std::vector<std::string> lines = {R"({"type":"user","uuid":"old-uuid-at-start"})"};
    for (int i = 0; i < 15; ++i) lines.push_back(R"({"type":"assistant","message":{"content":"filler"}})");
    auto path = write_lines("test-session.jsonl", lines);

    EXPECT_FALSE(has_uuid_in_last_lines(path, "old-uuid-at-start"));
}

TEST_F(SummaryLinkTest, UuidWithinLastLinesIsFound) {
    std::vector<std::string> lines;
    for (int i = 0; i < 5; ++i) lines.push_back(R"({"type":"assistant","message":{"content":"filler"}})");
    lines.push_back(R"({"type":"user","uuid":"recent-uuid"})");
    for (int i = 0; i < 4; ++i) lines.push_back(R"({"type":"assistant","message":{"content":"more filler"}})");
    auto path = write_lines("recent.jsonl", lines);

    EXPECT_TRUE(has_uuid_in_last_lines(path, "recent-uuid"));
}

TEST_F(SummaryLinkTest, TenthLineFromEndIsIncluded) {
    std::vector<std::string> lines = {R"({"uuid":"edge"})"};
    for (int i = 0; i < LEAF_SEARCH_LINES - 1; ++i) lines.push_back(R"({"uuid":"x"})");
    auto path = write_lines("edge.jsonl", lines);
    EXPECT_TRUE(has_uuid_in_last_lines(path, "edge"));

    append_lines("edge.jsonl", {R"({"uuid":"y"})"});
    EXPECT_FALSE(has_uuid_in_last_lines(path, "edge"));
}

TEST_F(SummaryLinkTest, EmptyAndMissingFiles) {
    auto empty = write_lines("empty.jsonl", {});
    EXPECT_FALSE(has_uuid_in_last_lines(empty, "any-uuid"));
    EXPECT_FALSE(has_uuid_in_last_lines(dir / "missing.jsonl", "any-uuid"));
}
