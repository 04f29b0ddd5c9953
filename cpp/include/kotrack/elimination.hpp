/**
 * @file elimination.hpp
 * @brief Detects which players busted in a hand.
 *
 * The log format never flags a bust-out explicitly, so elimination is inferred:
 *   - with a following hand: seated now, not seated in the next hand
 *   - last hand of a file: decided by FinalHandRule (see config.hpp)
 *
 * Hands must be in chronological order (oldest first) before calling this.
 */

#pragma once

#include "config.hpp"
#include "hand.hpp"
#include <string>
#include <vector>

namespace kotrack {

/**
 * @brief Players present in a hand who are gone by the next one.
 * @param current Hand being examined
 * @param next Chronologically next hand, or nullptr if current is the last one
 * @param rule Bust rule applied when next is nullptr
 * @return Eliminated player names in seating order (Hero is not filtered out)
 */
std::vector<std::string> find_eliminated(const Hand& current, const Hand* next,
                                         FinalHandRule rule = FinalHandRule::MissingFromCollects);

} // namespace kotrack
