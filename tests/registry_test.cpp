//
// Copyright (c) 2024-2025 JLGxy
//

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "registry.h"
#include "scorer.h"

TEST(agentRegistry, identifiers) {
    EXPECT_TRUE(arena::is_valid_agent_id("agent_1.v2-beta"));
    EXPECT_TRUE(arena::is_valid_agent_id(std::string(64, 'a')));
    EXPECT_FALSE(arena::is_valid_agent_id(""));
    EXPECT_FALSE(arena::is_valid_agent_id(std::string(65, 'a')));
    EXPECT_FALSE(arena::is_valid_agent_id("has space"));
    EXPECT_FALSE(arena::is_valid_agent_id("../etc"));
    EXPECT_FALSE(arena::is_valid_agent_id("a/b"));
}

TEST(agentRegistry, registrationNeverOverwrites) {
    arena::AgentRegistry reg;
    EXPECT_TRUE(reg.register_agent({"bot", "The Bot", "ops@example.com"}));
    EXPECT_FALSE(reg.register_agent({"bot", "Impostor", std::nullopt}));
    EXPECT_EQ(reg.find("bot")->display_name, "The Bot");
    EXPECT_THROW(reg.register_agent({"bad id", "x", std::nullopt}), std::invalid_argument);

    auto created = reg.get_or_create("newcomer");
    EXPECT_EQ(created->display_name, "newcomer");
    EXPECT_EQ(reg.get_or_create("newcomer"), created);
    EXPECT_EQ(reg.get_or_create("bot")->display_name, "The Bot");
    EXPECT_EQ(reg.size(), 2u);
    EXPECT_EQ(reg.find("ghost"), nullptr);
}

TEST(challengeRegistry, datasetIsShared) {
    arena::ChallengeRegistry reg;
    reg.add(arena::make_challenge("c1", "First", "bytes", "abc"));
    EXPECT_THROW(reg.add(arena::make_challenge("c1", "Again", "bytes", "x")),
                 std::invalid_argument);

    auto a = reg.find("c1");
    auto b = reg.find("c1");
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->dataset.get(), b->dataset.get());
    EXPECT_EQ(a->dataset_sha256, arena::sha256_hex("abc"));
    EXPECT_EQ(a->dataset_size(), 3u);
    EXPECT_FALSE(reg.find("c2").has_value());

    EXPECT_TRUE(reg.set_active("c1", false));
    EXPECT_FALSE(reg.find("c1")->active);
    EXPECT_TRUE(a->active);
    EXPECT_FALSE(reg.set_active("c2", true));
    EXPECT_EQ(reg.ids(), std::vector<std::string>{"c1"});
}
