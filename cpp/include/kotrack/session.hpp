/**
 * @file session.hpp
 * @brief Applies the knockout pipeline to whole files and sums the results.
 *
 * Per file:
 * @code
 *   lines  = split_lines(text)
 *   hands  = parse_hand(lines, r) for r in split_hands(lines)
 *   hands  = reversed(hands)            // files are stored newest-first
 *   for i: count_hand_knockouts(hands[i],
 *                               find_eliminated(hands[i], hands[i+1] or null))
 * @endcode
 *
 * Files are independent. Nothing is shared between them except the totals in
 * SessionResult.
 */

#pragma once

#include "config.hpp"
#include "hand.hpp"
#include "knockouts.hpp"
#include <string>
#include <vector>

namespace kotrack {

/**
 * @brief Outcome for one input file.
 */
struct FileResult {
    std::string source;                ///< File path (or caller-supplied label)
    int hands;                         ///< Hand records parsed
    int knockouts;                     ///< Knockouts credited to Hero
    std::vector<KnockoutEvent> events; ///< Trace, filled only with diagnostics on
    bool readable;                     ///< False if the file could not be opened

    FileResult() : hands(0), knockouts(0), readable(true) {}
};

/**
 * @brief Outcome for a whole run.
 */
struct SessionResult {
    std::vector<FileResult> files; ///< One entry per input file, in input order
    int total_knockouts;

    SessionResult() : total_knockouts(0) {}

    /** @brief Paths of files with at least one knockout, in input order. */
    std::vector<std::string> files_with_knockouts() const;
};

/**
 * @brief Parse every hand of a file in chronological order.
 * @param lines All lines of the file
 * @param config Uses min_bb (default big blind) and newest_first
 * @return Hands oldest-first
 */
std::vector<Hand> parse_hands(const std::vector<std::string>& lines,
                              const KnockoutConfig& config);

/**
 * @brief Count Hero's knockouts in an already split file.
 * @param lines All lines of the file
 * @param config Run configuration
 * @param source Label stored in the result
 */
FileResult process_lines(const std::vector<std::string>& lines,
                         const KnockoutConfig& config,
                         const std::string& source);

/** @brief Count Hero's knockouts in raw file text. */
FileResult process_text(const std::string& text, const KnockoutConfig& config,
                        const std::string& source = "");

/**
 * @brief Read a file once and count Hero's knockouts in it.
 *
 * An unreadable file is logged and reported with readable = false and no
 * hands; it does not abort the run.
 */
FileResult process_file(const std::string& path, const KnockoutConfig& config);

/**
 * @brief Process every file and sum the knockout counts.
 * @param files Paths, typically from collect_input_files()
 * @param config Run configuration
 */
SessionResult count_session(const std::vector<std::string>& files,
                            const KnockoutConfig& config);

/**
 * @brief Expand input paths into a sorted, de-duplicated list of files.
 * @param paths Files (taken as given) or directories (walked recursively)
 * @param extension Extension matched in directories, case-insensitive (".txt")
 * @return Matching regular files
 * @throws InputError (NoInput) if no file is found
 */
std::vector<std::string> collect_input_files(const std::vector<std::string>& paths,
                                             const std::string& extension);

} // namespace kotrack
