/**
 * @file config.hpp
 * @brief Run configuration for knockout counting.
 *
 * KnockoutConfig is a plain value passed to every stage that needs it. The
 * diagnostics flag lives here rather than in any process-wide state.
 *
 * JSON form (every key optional):
 * @code
 *   {
 *     "hero": "Hero",
 *     "min_bb": 100,
 *     "diagnostics": false,
 *     "final_hand_rule": "missing_from_collects",
 *     "newest_first": true,
 *     "extension": ".txt"
 *   }
 * @endcode
 */

#pragma once

#include "hand.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace kotrack {

/** @brief Default Hero name. */
extern const char* const DEFAULT_HERO;

/** @brief Default table-level filter (50/100 level). */
constexpr ChipCount DEFAULT_MIN_BB = 100;

/**
 * @brief How busts are detected in the last hand of a file.
 *
 * MissingFromCollects treats every seat that collected nothing as busted. It
 * cannot tell a showdown bust from a player who folded, so a folded survivor
 * in the final hand is reported as eliminated. ZeroFinalStack uses
 * stack - contrib + collects <= 0 instead.
 */
enum class FinalHandRule {
    MissingFromCollects = 0,
    ZeroFinalStack = 1
};

/**
 * @brief Settings consumed by the session aggregator and knockout attributor.
 */
struct KnockoutConfig {
    std::string hero;               ///< Hero's display name
    ChipCount min_bb;               ///< Hands with a smaller big blind count no knockouts
    bool diagnostics;               ///< Record and log every credited knockout
    FinalHandRule final_hand_rule;  ///< Bust detection for a file's last hand
    bool newest_first;              ///< Files list hands newest-first
    std::string extension;          ///< File extension matched when walking directories

    KnockoutConfig()
        : hero(DEFAULT_HERO), min_bb(DEFAULT_MIN_BB), diagnostics(false),
          final_hand_rule(FinalHandRule::MissingFromCollects), newest_first(true),
          extension(".txt") {}
};

/** @brief Config-file name of a rule ("missing_from_collects", "zero_final_stack"). */
const char* final_hand_rule_name(FinalHandRule rule);

/**
 * @brief Parse a rule name.
 * @throws InputError (BadConfig) for an unknown name
 */
FinalHandRule parse_final_hand_rule(const std::string& name);

/**
 * @brief Parse a table-level filter value given on the command line.
 * @param text Non-negative integer, thousands separators allowed ("1,000")
 * @throws InputError (BadConfig) if text is not a valid chip amount
 */
ChipCount parse_min_bb(const std::string& text);

/**
 * @brief Overlay JSON settings on the defaults.
 * @param j JSON object with any subset of the documented keys
 * @return Resulting configuration
 * @throws InputError (BadConfig) if j is not an object or a value has the wrong type
 */
KnockoutConfig config_from_json(const nlohmann::json& j);

/** @brief Serialise a configuration to the JSON form above. */
nlohmann::json config_to_json(const KnockoutConfig& config);

/**
 * @brief Load a configuration file.
 * @param path Path to a JSON file
 * @throws InputError (BadConfig) if the file cannot be read or parsed
 */
KnockoutConfig load_config(const std::string& path);

} // namespace kotrack
