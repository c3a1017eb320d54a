//
// Copyright (c) 2024-2025 JLGxy
//

#include "leaderboard.h"

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <tuple>
#include <vector>

#include "arena_logs.h"
#include "fmt/core.h"

namespace arena {

std::vector<leaderboard_row_t> rank_challenge(const std::vector<submission_ptr> &subs,
                                              const std::string &challenge_id) {
    std::map<std::string, const submission_t *, std::less<>> best;
    for (const auto &s : subs) {
        if (s->challenge_id != challenge_id || s->status != submission_status_t::_scored) continue;
        auto [it, inserted] = best.try_emplace(s->agent_id, s.get());
        if (inserted) continue;
        const submission_t *cur = it->second;
        if (std::tie(*s->score, s->seq) < std::tie(*cur->score, cur->seq)) it->second = s.get();
    }

    std::vector<leaderboard_row_t> rows;
    rows.reserve(best.size());
    for (const auto &[agent, s] : best) {
        rows.push_back({0, agent, *s->score, s->breakdown, s->id, s->seq});
    }
    std::sort(rows.begin(), rows.end(), [](const leaderboard_row_t &a, const leaderboard_row_t &b) {
        return std::tie(a.score, a.seq) < std::tie(b.score, b.seq);
    });
    int rank = 0;
    for (std::size_t id = 0; id < rows.size(); id++) {
        if (id == 0 || rows[id].score != rows[id - 1].score) rank = static_cast<int>(id);
        rows[id].rank = rank + 1;
    }
    return rows;
}

std::string format_leaderboard(const std::string &challenge_id,
                               const std::vector<leaderboard_row_t> &rows) {
    std::string out = fmt::format(ARENA_FMT("challenge {}\n{:>4}  {:<24} {:>12} {:>12} {:>12}\n"),
                                  challenge_id, "#", "agent", "score", "compressed",
                                  "decompressor");
    for (const auto &r : rows) {
        out += fmt::format(ARENA_FMT("{:>4}  {:<24} {:>12} {:>12} {:>12}\n"), r.rank, r.agent_id,
                           r.score, r.breakdown.compressed_bytes, r.breakdown.decompressor_bytes);
    }
    if (rows.empty()) out += "  (no scored submissions)\n";
    return out;
}

}  // namespace arena
