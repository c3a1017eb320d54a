//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arena {

// 1..64 characters from [A-Za-z0-9_.-], without "..".
bool is_valid_agent_id(std::string_view id);

struct agent_t {
    std::string id;
    std::string display_name;
    std::optional<std::string> contact;
};

class AgentRegistry {
  public:
    AgentRegistry() = default;
    AgentRegistry(const AgentRegistry &) = delete;
    AgentRegistry &operator=(const AgentRegistry &) = delete;

    // Returns false if the id is already registered; the existing owner is kept.
    // Throws std::invalid_argument for a malformed id.
    bool register_agent(agent_t agent);
    // Display name defaults to the id.
    std::shared_ptr<const agent_t> get_or_create(const std::string &id);
    std::shared_ptr<const agent_t> find(const std::string &id) const;
    std::size_t size() const;

  private:
    mutable std::mutex lock_;
    std::map<std::string, std::shared_ptr<const agent_t>, std::less<>> agents_;
};

struct challenge_t {
    std::string id;
    std::string title;
    std::string scoring;  // rule descriptor, shown to agents
    std::shared_ptr<const std::string> dataset;
    std::string dataset_sha256;
    bool active = true;

    std::size_t dataset_size() const { return dataset->size(); }
};

challenge_t make_challenge(std::string id, std::string title, std::string scoring,
                           std::string dataset, bool active = true);

class ChallengeRegistry {
  public:
    ChallengeRegistry() = default;
    ChallengeRegistry(const ChallengeRegistry &) = delete;
    ChallengeRegistry &operator=(const ChallengeRegistry &) = delete;

    // Throws std::invalid_argument on a duplicate id.
    void add(challenge_t ch);
    // Snapshot. The dataset is shared, never copied.
    std::optional<challenge_t> find(const std::string &id) const;
    bool set_active(const std::string &id, bool active);
    std::vector<std::string> ids() const;

  private:
    mutable std::mutex lock_;
    std::map<std::string, challenge_t, std::less<>> challenges_;
};

}  // namespace arena
