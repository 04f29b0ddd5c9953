/**
 * @file hand_splitter.hpp
 * @brief Splits a raw hand-history log into per-hand line ranges.
 *
 * A hand starts at a line beginning with "Poker Hand #" and runs up to the
 * line before the next such marker, or to the end of the file. A file with no
 * markers yields no ranges.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kotrack {

/** @brief Prefix of the first line of every hand record. */
extern const char* const HAND_START_MARKER;

/**
 * @brief Half-open line range [begin, end) covering one hand record.
 */
struct HandRange {
    size_t begin; ///< Index of the hand-start marker line
    size_t end;   ///< One past the last line of the hand

    HandRange() : begin(0), end(0) {}
    HandRange(size_t b, size_t e) : begin(b), end(e) {}

    size_t size() const { return end - begin; }
};

/**
 * @brief Split raw file text into lines.
 * @param text Whole file contents
 * @return Lines without terminators; a trailing '\r' and a leading UTF-8 BOM are removed
 */
std::vector<std::string> split_lines(const std::string& text);

/** @brief True if the line opens a new hand record. */
bool is_hand_start(const std::string& line);

/**
 * @brief Locate every hand record in a file.
 * @param lines All lines of the file, in file order
 * @return One range per marker line, in file order
 */
std::vector<HandRange> split_hands(const std::vector<std::string>& lines);

} // namespace kotrack
