/**
 * @file hand_splitter.cpp
 * @brief Line splitting and hand-start detection.
 */

#include "../include/kotrack/hand_splitter.hpp"

namespace kotrack {

const char* const HAND_START_MARKER = "Poker Hand #";

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;

    size_t start = 0;
    // Skip UTF-8 byte-order mark written by some clients
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        start = 3;
    }

    while (start < text.size()) {
        size_t newline = text.find('\n', start);
        size_t stop = (newline == std::string::npos) ? text.size() : newline;

        std::string line = text.substr(start, stop - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);

        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }

    return lines;
}

bool is_hand_start(const std::string& line) {
    return line.compare(0, std::char_traits<char>::length(HAND_START_MARKER),
                        HAND_START_MARKER) == 0;
}

std::vector<HandRange> split_hands(const std::vector<std::string>& lines) {
    std::vector<size_t> starts;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (is_hand_start(lines[i])) {
            starts.push_back(i);
        }
    }

    std::vector<HandRange> ranges;
    ranges.reserve(starts.size());
    for (size_t i = 0; i < starts.size(); ++i) {
        size_t end = (i + 1 < starts.size()) ? starts[i + 1] : lines.size();
        ranges.emplace_back(starts[i], end);
    }
    return ranges;
}

} // namespace kotrack
