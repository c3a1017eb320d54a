//
// Copyright (c) 2024-2025 JLGxy
//

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "store.h"

using arena::MemoryStore;
using arena::submission_status_t;

namespace {

arena::submission_t make_sub(const std::string &id) {
    arena::submission_t s;
    s.id = id;
    s.challenge_id = "c1";
    s.agent_id = "agent";
    s.payload = std::make_shared<const std::string>("xyz");
    s.source = std::make_shared<const std::string>("def decompress(d):\n    return d\n");
    s.breakdown = {3, 30};
    return s;
}

}  // namespace

TEST(store, createAssignsSequence) {
    MemoryStore st;
    auto a = st.create(make_sub("a"));
    auto b = st.create(make_sub("b"));
    EXPECT_EQ(a->status, submission_status_t::_pending);
    EXPECT_LT(a->seq, b->seq);
    EXPECT_THROW(st.create(make_sub("a")), std::invalid_argument);
    EXPECT_EQ(st.get("missing"), nullptr);

    auto all = st.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0]->id, "a");
    EXPECT_EQ(all[1]->id, "b");
}

TEST(store, forwardTransitionsOnly) {
    MemoryStore st;
    st.create(make_sub("a"));
    EXPECT_FALSE(st.finish_scored("a", 10, 5));
    EXPECT_TRUE(st.claim("a"));
    EXPECT_FALSE(st.claim("a"));
    EXPECT_TRUE(st.finish_scored("a", 33, 12));

    auto snap = st.get("a");
    EXPECT_EQ(snap->status, submission_status_t::_scored);
    EXPECT_EQ(*snap->score, 33);
    EXPECT_EQ(snap->execution_ms, 12);
    EXPECT_FALSE(snap->error.has_value());

    // terminal records are frozen
    EXPECT_FALSE(st.finish_error("a", {"INTERNAL_ERROR", "x"}, 1));
    EXPECT_FALSE(st.finish_scored("a", 1, 1));
    EXPECT_FALSE(st.claim("a"));
    EXPECT_EQ(*st.get("a")->score, 33);
}

TEST(store, errorOutcome) {
    MemoryStore st;
    st.create(make_sub("a"));
    ASSERT_TRUE(st.claim("a"));
    ASSERT_TRUE(st.finish_error("a", {"DECOMPRESSION_TIMEOUT", "too slow"}, 61000));
    auto snap = st.get("a");
    EXPECT_EQ(snap->status, submission_status_t::_error);
    EXPECT_FALSE(snap->score.has_value());
    EXPECT_EQ(snap->error->code, "DECOMPRESSION_TIMEOUT");
    EXPECT_TRUE(snap->is_terminal());
    EXPECT_NE(snap->to_str().find("DECOMPRESSION_TIMEOUT"), std::string::npos);
}

TEST(store, snapshotsAreImmutable) {
    MemoryStore st;
    auto created = st.create(make_sub("a"));
    st.claim("a");
    auto processing = st.get("a");
    st.finish_scored("a", 1, 1);
    EXPECT_EQ(created->status, submission_status_t::_pending);
    EXPECT_EQ(processing->status, submission_status_t::_processing);
    EXPECT_EQ(st.get("a")->status, submission_status_t::_scored);
}

TEST(store, listenerSeesEveryChange) {
    MemoryStore st;
    std::vector<submission_status_t> seen;
    st.add_listener([&](const arena::submission_ptr &s) { seen.push_back(s->status); });
    st.create(make_sub("a"));
    st.claim("a");
    st.claim("a");
    st.finish_error("a", {"X", "y"}, 0);
    EXPECT_EQ(seen, (std::vector<submission_status_t>{submission_status_t::_pending,
                                                      submission_status_t::_processing,
                                                      submission_status_t::_error}));
}
