//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "store.h"

namespace arena {

struct leaderboard_row_t {
    int rank;
    std::string agent_id;
    std::int64_t score;
    breakdown_t breakdown;
    std::string submission_id;
    std::uint64_t seq;
};

// Best scored submission of each agent on `challenge_id`, lowest score first. Equal scores
// share a rank and keep submission order.
std::vector<leaderboard_row_t> rank_challenge(const std::vector<submission_ptr> &subs,
                                              const std::string &challenge_id);

std::string format_leaderboard(const std::string &challenge_id,
                               const std::vector<leaderboard_row_t> &rows);

}  // namespace arena
