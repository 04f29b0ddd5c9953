/**
 * @file hand.hpp
 * @brief Core data model for one parsed poker hand and its side-pot ladder.
 *
 * A Hand is built once by the hand parser, its pots are built and assigned by
 * the side-pot engine, and from then on it is only read by the elimination
 * tracker and the knockout attributor.
 *
 * Chip amounts are plain integers (ChipCount). Player identity within a hand
 * is the trimmed display name printed in the seat listing.
 *
 * Invariants:
 *   - sum(contrib) == sum(pot.size) for non-negative contributions
 *   - pot levels strictly increase along the ladder
 *   - each pot's eligible set is a subset of the previous pot's eligible set
 *   - pot.winners is a subset of pot.eligible
 */

#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace kotrack {

/** @brief Chip amount. Fractional chips are not supported. */
using ChipCount = int64_t;

/** @brief Name -> chip amount, ordered by name for deterministic iteration. */
using ChipMap = std::map<std::string, ChipCount>;

/** @brief Set of player names, ordered lexicographically. */
using NameSet = std::set<std::string>;

/**
 * @brief One seat from the hand's seat listing.
 */
struct Seat {
    std::string name;     ///< Trimmed display name (unique within the hand)
    int seat_number;      ///< Number printed after "Seat"
    ChipCount stack;      ///< Starting stack for this hand

    Seat() : seat_number(0), stack(0) {}
    Seat(const std::string& n, int number, ChipCount s)
        : name(n), seat_number(number), stack(s) {}
};

/**
 * @brief One level of the side-pot ladder.
 *
 * Built by build_pots() with empty winners; winners are filled in by
 * assign_winners().
 */
struct Pot {
    ChipCount size;   ///< Chips in this pot level
    NameSet eligible; ///< Players who contributed enough to contest this level
    NameSet winners;  ///< Players who took chips from this pot

    Pot() : size(0) {}
    Pot(ChipCount s, const NameSet& e) : size(s), eligible(e) {}
};

/**
 * @brief One played-out poker hand.
 *
 * Seats keep the printed seating order. contrib and collects are keyed by
 * player name; a player absent from a map contributed or collected nothing.
 */
struct Hand {
    std::string hand_id;        ///< Id after "Poker Hand #", empty if absent
    std::string tournament_id;  ///< Id after "Tournament #", empty if absent
    std::string timestamp;      ///< "YYYY/MM/DD hh:mm:ss" from the header, empty if absent
    int table_size;             ///< N from "N-max", 0 if absent
    ChipCount bb;               ///< Big blind (table-level filter value)

    std::vector<Seat> seats;    ///< Seat listing in printed order
    ChipMap contrib;            ///< Net chips committed to the pot this hand
    ChipMap collects;           ///< Chips collected from any pot this hand
    std::vector<Pot> pots;      ///< Side-pot ladder, main pot first

    std::vector<std::string> warnings; ///< Recoverable parse problems

    Hand() : table_size(0), bb(0) {}

    /**
     * @brief Look up a seat by player name.
     * @return Pointer into seats, or nullptr if the player is not seated
     */
    const Seat* find_seat(const std::string& name) const;

    /** @brief True if the player appears in the seat listing. */
    bool has_seat(const std::string& name) const { return find_seat(name) != nullptr; }

    /** @brief Starting stack of a seated player, 0 if not seated. */
    ChipCount stack_of(const std::string& name) const;

    /** @brief Net contribution of a player, 0 if none recorded. */
    ChipCount contrib_of(const std::string& name) const;

    /** @brief Total collected by a player, 0 if none recorded. */
    ChipCount collected_by(const std::string& name) const;

    /**
     * @brief Stack after the hand: stack - contrib + collects.
     *
     * Only meaningful for seated players; rake is not reconciled.
     */
    ChipCount final_stack(const std::string& name) const;

    /** @brief True if the player committed their whole (positive) starting stack. */
    bool is_all_in(const std::string& name) const;

    /** @brief Sum of all contributions. */
    ChipCount total_contrib() const;

    /** @brief Sum of all collected amounts. */
    ChipCount total_collected() const;
};

/**
 * @brief Parse a chip amount such as "1,500".
 * @param text Digits with optional thousands separators
 * @return Parsed amount, or 0 if the text is empty or malformed
 */
ChipCount parse_chips(const std::string& text);

/** @brief Strip leading and trailing whitespace. */
std::string trim(const std::string& text);

} // namespace kotrack
