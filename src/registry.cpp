//
// Copyright (c) 2024-2025 JLGxy
//

#include "registry.h"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "scorer.h"

namespace arena {

constexpr std::size_t _max_agent_id_length = 64;

bool is_valid_agent_id(const std::string_view id) {
    if (id.empty() || id.size() > _max_agent_id_length) return false;
    for (auto c : id) {
        if ((c < '0' || c > '9') && (c < 'a' || c > 'z') && (c < 'A' || c > 'Z') && c != '_' &&
            c != '.' && c != '-')
            return false;
    }
    return id.find("..") == std::string_view::npos;
}

bool AgentRegistry::register_agent(agent_t agent) {
    if (!is_valid_agent_id(agent.id)) throw std::invalid_argument("invalid agent id");
    if (agent.display_name.empty()) agent.display_name = agent.id;
    const std::lock_guard guard(lock_);
    auto id = agent.id;
    return agents_.emplace(std::move(id), std::make_shared<const agent_t>(std::move(agent)))
            .second;
}

std::shared_ptr<const agent_t> AgentRegistry::get_or_create(const std::string &id) {
    if (!is_valid_agent_id(id)) throw std::invalid_argument("invalid agent id");
    const std::lock_guard guard(lock_);
    auto it = agents_.find(id);
    if (it != agents_.end()) return it->second;
    auto agent = std::make_shared<const agent_t>(agent_t{id, id, std::nullopt});
    agents_.emplace(id, agent);
    return agent;
}

std::shared_ptr<const agent_t> AgentRegistry::find(const std::string &id) const {
    const std::lock_guard guard(lock_);
    auto it = agents_.find(id);
    return it == agents_.end() ? nullptr : it->second;
}

std::size_t AgentRegistry::size() const {
    const std::lock_guard guard(lock_);
    return agents_.size();
}

challenge_t make_challenge(std::string id, std::string title, std::string scoring,
                           std::string dataset, bool active) {
    challenge_t ch;
    ch.id = std::move(id);
    ch.title = std::move(title);
    ch.scoring = std::move(scoring);
    ch.dataset_sha256 = sha256_hex(dataset);
    ch.dataset = std::make_shared<const std::string>(std::move(dataset));
    ch.active = active;
    return ch;
}

void ChallengeRegistry::add(challenge_t ch) {
    if (!ch.dataset) throw std::invalid_argument("challenge " + ch.id + " has no dataset");
    const std::lock_guard guard(lock_);
    if (challenges_.count(ch.id) != 0) {
        throw std::invalid_argument("duplicate challenge id " + ch.id);
    }
    auto id = ch.id;
    challenges_.emplace(std::move(id), std::move(ch));
}

std::optional<challenge_t> ChallengeRegistry::find(const std::string &id) const {
    const std::lock_guard guard(lock_);
    auto it = challenges_.find(id);
    if (it == challenges_.end()) return std::nullopt;
    return it->second;
}

bool ChallengeRegistry::set_active(const std::string &id, bool active) {
    const std::lock_guard guard(lock_);
    auto it = challenges_.find(id);
    if (it == challenges_.end()) return false;
    it->second.active = active;
    return true;
}

std::vector<std::string> ChallengeRegistry::ids() const {
    const std::lock_guard guard(lock_);
    std::vector<std::string> out;
    out.reserve(challenges_.size());
    for (const auto &[id, ch] : challenges_) out.push_back(id);
    return out;
}

}  // namespace arena
