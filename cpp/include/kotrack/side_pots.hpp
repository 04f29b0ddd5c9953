/**
 * @file side_pots.hpp
 * @brief Side-pot ladder construction and winner assignment.
 *
 * Ladder construction:
 * @code
 *   levels   = sorted distinct positive contributions
 *   eligible = { p : contrib[p] >= level }
 *   size     = (level - previous_level) * |eligible|
 * @endcode
 *
 * Example: contributions {A:100, B:50, C:20}
 *   | Level | Eligible  | Size          |
 *   |-------|-----------|---------------|
 *   | 20    | {A, B, C} | 20 x 3 = 60   |
 *   | 50    | {A, B}    | 30 x 2 = 60   |
 *   | 100   | {A}       | 50 x 1 = 50   |
 *
 * Winner assignment drains each player's collected total against the pots,
 * most exclusive pot (smallest eligible set) first. Players inside a pot are
 * visited in name order, so the result is fully deterministic.
 */

#pragma once

#include "hand.hpp"
#include <cstddef>
#include <vector>

namespace kotrack {

/**
 * @brief Build the main pot and side pots from per-player contributions.
 * @param contrib Net chips committed per player
 * @return Ladder ordered by increasing level (main pot first), winners empty
 *
 * Players with zero or negative contribution are eligible for nothing.
 */
std::vector<Pot> build_pots(const ChipMap& contrib);

/**
 * @brief Assign winners to each pot from observed collected amounts.
 * @param pots Ladder from build_pots() (winners are filled in)
 * @param collects Chips collected per player
 *
 * Pots are settled in ascending order of eligible-set size; equal sizes keep
 * ladder order. Within a pot each eligible player, in name order, takes
 * min(remaining collected, remaining pot) and becomes a winner if the take is
 * positive. A pot that still holds chips afterwards (uncontested pot with no
 * "collected" line, rounding) is given to its first eligible player.
 */
void assign_winners(std::vector<Pot>& pots, const ChipMap& collects);

/** @brief Sum of all pot sizes. */
ChipCount total_pot_size(const std::vector<Pot>& pots);

/**
 * @brief Indices of pots in settlement order.
 *
 * Ascending eligible-set size, stable with respect to ladder order. Shared by
 * winner assignment and bust-pot lookup so both use the same ordering.
 */
std::vector<size_t> settlement_order(const std::vector<Pot>& pots);

} // namespace kotrack
