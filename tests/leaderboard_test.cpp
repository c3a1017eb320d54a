//
// Copyright (c) 2024-2025 JLGxy
//

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "leaderboard.h"
#include "store.h"

namespace {

void add_scored(arena::MemoryStore &st, const std::string &id, const std::string &agent,
                const std::string &challenge, std::int64_t score) {
    arena::submission_t s;
    s.id = id;
    s.agent_id = agent;
    s.challenge_id = challenge;
    s.breakdown = {static_cast<std::size_t>(score) / 2, static_cast<std::size_t>(score) / 2};
    st.create(std::move(s));
    st.claim(id);
    st.finish_scored(id, score, 1);
}

}  // namespace

TEST(leaderboard, bestPerAgentAndTies) {
    arena::MemoryStore st;
    add_scored(st, "1", "alice", "c", 500);
    add_scored(st, "2", "bob", "c", 300);
    add_scored(st, "3", "alice", "c", 300);
    add_scored(st, "4", "carol", "c", 400);
    add_scored(st, "5", "dave", "other", 1);
    add_scored(st, "6", "bob", "c", 300);

    // an errored submission never ranks
    arena::submission_t bad;
    bad.id = "7";
    bad.agent_id = "erin";
    bad.challenge_id = "c";
    st.create(std::move(bad));
    st.claim("7");
    st.finish_error("7", {"DECOMPRESSION_MISMATCH", ""}, 1);

    auto rows = arena::rank_challenge(st.list(), "c");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].agent_id, "bob");
    EXPECT_EQ(rows[0].submission_id, "2");
    EXPECT_EQ(rows[0].rank, 1);
    EXPECT_EQ(rows[1].agent_id, "alice");
    EXPECT_EQ(rows[1].submission_id, "3");
    EXPECT_EQ(rows[1].rank, 1);
    EXPECT_EQ(rows[2].agent_id, "carol");
    EXPECT_EQ(rows[2].rank, 3);

    auto text = arena::format_leaderboard("c", rows);
    EXPECT_NE(text.find("challenge c"), std::string::npos);
    EXPECT_NE(text.find("carol"), std::string::npos);
    EXPECT_EQ(text.find("dave"), std::string::npos);
}

TEST(leaderboard, empty) {
    arena::MemoryStore st;
    EXPECT_TRUE(arena::rank_challenge(st.list(), "c").empty());
    EXPECT_NE(arena::format_leaderboard("c", {}).find("no scored submissions"), std::string::npos);
}
