/**
 * @file side_pots.cpp
 * @brief Implementation of side-pot construction and winner assignment.
 *
 * Settlement order matters when one player collects from several pots: the
 * most exclusive pot is drained first so a large main-pot win is not credited
 * to a small side pot the same player was also eligible for. Do not reorder.
 */

#include "../include/kotrack/side_pots.hpp"
#include <algorithm>

namespace kotrack {

std::vector<Pot> build_pots(const ChipMap& contrib) {
    std::vector<ChipCount> levels;
    for (const auto& entry : contrib) {
        if (entry.second > 0) {
            levels.push_back(entry.second);
        }
    }
    std::sort(levels.begin(), levels.end());
    levels.erase(std::unique(levels.begin(), levels.end()), levels.end());

    std::vector<Pot> pots;
    pots.reserve(levels.size());

    ChipCount previous = 0;
    for (ChipCount level : levels) {
        NameSet eligible;
        for (const auto& entry : contrib) {
            if (entry.second >= level) {
                eligible.insert(entry.first);
            }
        }

        ChipCount size = (level - previous) * static_cast<ChipCount>(eligible.size());
        pots.emplace_back(size, eligible);
        previous = level;
    }

    return pots;
}

std::vector<size_t> settlement_order(const std::vector<Pot>& pots) {
    std::vector<size_t> order(pots.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(), [&pots](size_t a, size_t b) {
        return pots[a].eligible.size() < pots[b].eligible.size();
    });
    return order;
}

void assign_winners(std::vector<Pot>& pots, const ChipMap& collects) {
    ChipMap remaining = collects;

    for (size_t idx : settlement_order(pots)) {
        Pot& pot = pots[idx];
        ChipCount left = pot.size;

        for (const std::string& player : pot.eligible) {
            auto it = remaining.find(player);
            if (it == remaining.end() || it->second <= 0 || left <= 0) {
                continue;
            }
            ChipCount take = std::min(it->second, left);
            pot.winners.insert(player);
            it->second -= take;
            left -= take;
        }

        // Uncontested pot without a "collected" line
        if (left > 0 && !pot.eligible.empty()) {
            pot.winners.insert(*pot.eligible.begin());
        }
    }
}

ChipCount total_pot_size(const std::vector<Pot>& pots) {
    ChipCount total = 0;
    for (const Pot& pot : pots) {
        total += pot.size;
    }
    return total;
}

} // namespace kotrack
