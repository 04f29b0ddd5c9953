/**
 * @file knockouts.hpp
 * @brief Decides how many knockouts Hero is credited with in one hand.
 *
 * A bust counts for Hero only when both hold:
 *   - coverage: Hero's starting stack >= the busted player's starting stack
 *   - Hero won the busted player's pot, i.e. the most exclusive pot (smallest
 *     eligible set) that the busted player was eligible for
 *
 * Winning some other pot of the same hand is not enough. A hand below the
 * table-level filter (bb < min_bb), a hand without Hero, or a hand without
 * eliminations contributes nothing.
 */

#pragma once

#include "config.hpp"
#include "hand.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace kotrack {

/**
 * @brief Trace record for one credited knockout.
 */
struct KnockoutEvent {
    std::string hand_id;   ///< Hand in which the knockout happened
    std::string player;    ///< Busted player
    size_t pot_index;      ///< Index of the bust pot in Hand::pots
    ChipCount pot_size;    ///< Size of the bust pot
    ChipCount hero_stack;  ///< Hero's starting stack
    ChipCount bust_stack;  ///< Busted player's starting stack

    KnockoutEvent() : pot_index(0), pot_size(0), hero_stack(0), bust_stack(0) {}
};

/**
 * @brief Knockouts credited in one hand.
 *
 * events is only filled when KnockoutConfig::diagnostics is set.
 */
struct HandKnockouts {
    int count;
    std::vector<KnockoutEvent> events;

    HandKnockouts() : count(0) {}
};

/**
 * @brief Find the pot a player is associated with for knockout purposes.
 * @param hand Parsed hand with pots built and winners assigned
 * @param player Player name
 * @return Index into hand.pots, or -1 if the player is eligible for no pot
 *
 * Among the pots the player is eligible for, picks the one with the smallest
 * eligible set, using the same stable order as winner assignment.
 */
int find_bust_pot(const Hand& hand, const std::string& player);

/**
 * @brief Count Hero's knockouts in a hand.
 * @param hand Parsed hand with pots built and winners assigned
 * @param eliminated Players busted in this hand (from find_eliminated())
 * @param config Hero name, min_bb filter and diagnostics flag
 * @return Credited count and, with diagnostics on, one event per credit
 *
 * Busted players missing from the seat listing or eligible for no pot are
 * skipped.
 */
HandKnockouts count_hand_knockouts(const Hand& hand,
                                   const std::vector<std::string>& eliminated,
                                   const KnockoutConfig& config);

} // namespace kotrack
