/**
 * @file hand_parser.hpp
 * @brief Parses one hand record into a Hand with its side-pot ladder.
 *
 * Recognised lines (GGPoker-style tournament hand history):
 * @code
 *   Poker Hand #TM123: Tournament #456, ... Level10(200/400(50)) - 2025/01/01 16:38:15
 *   Table '456 7' 9-max Seat #1 is the button
 *   Seat 1: Hero (15,000 in chips)
 *   Hero: posts the ante 50
 *   Villain: posts small blind 200
 *   *** HOLE CARDS ***
 *   Hero: raises 800 to 1,200
 *   Villain: calls 1,000 and is all-in
 *   *** FLOP *** [2h 7d 9s]
 *   Uncalled bet (2,000) returned to Hero
 *   Hero collected 2,900 from pot
 * @endcode
 *
 * Contribution rules:
 *   - posts / bets / calls / all-in add the first amount after the verb
 *   - "raises X to Y" adds Y minus what the player already put in this betting
 *     round; rounds restart at FLOP / TURN / RIVER markers
 *   - antes add to the contribution but not to the round commitment
 *   - "Uncalled bet (X) returned to P" subtracts X
 *
 * Scanning stops at the first blank line of the record. Malformed amounts
 * parse to 0; a missing or zero big blind falls back to the caller's default.
 */

#pragma once

#include "hand.hpp"
#include "hand_splitter.hpp"
#include <string>
#include <vector>

namespace kotrack {

/**
 * @brief Parse one hand record.
 * @param lines All lines of the file
 * @param range Line range of this hand from split_hands()
 * @param default_bb Big blind used when the header has none
 * @return Parsed hand with pots built and winners assigned
 *
 * Never throws on malformed content; problems are recorded in Hand::warnings.
 */
Hand parse_hand(const std::vector<std::string>& lines, const HandRange& range,
                ChipCount default_bb);

/**
 * @brief Parse the first hand record found in a block of text.
 * @param text Raw text containing at least one "Poker Hand #" line
 * @param default_bb Big blind used when the header has none
 * @return Parsed hand, or an empty Hand (bb = default_bb) if no record is found
 */
Hand parse_hand_text(const std::string& text, ChipCount default_bb);

/**
 * @brief Extract the big blind from a hand header line.
 * @param header First line of the hand record
 * @return Big blind, or 0 if no "sb/bb" pair is present
 *
 * Prefers the parenthesised "(sb/bb" form; otherwise takes the first bare
 * "a/b" pair that is not part of a date.
 */
ChipCount parse_big_blind(const std::string& header);

} // namespace kotrack
