/**
 * @file hand.cpp
 * @brief Hand accessors and chip/name helpers.
 */

#include "../include/kotrack/hand.hpp"
#include <cctype>
#include <limits>

namespace kotrack {

const Seat* Hand::find_seat(const std::string& name) const {
    for (const Seat& seat : seats) {
        if (seat.name == name) {
            return &seat;
        }
    }
    return nullptr;
}

ChipCount Hand::stack_of(const std::string& name) const {
    const Seat* seat = find_seat(name);
    return seat ? seat->stack : 0;
}

ChipCount Hand::contrib_of(const std::string& name) const {
    auto it = contrib.find(name);
    return it != contrib.end() ? it->second : 0;
}

ChipCount Hand::collected_by(const std::string& name) const {
    auto it = collects.find(name);
    return it != collects.end() ? it->second : 0;
}

ChipCount Hand::final_stack(const std::string& name) const {
    return stack_of(name) - contrib_of(name) + collected_by(name);
}

bool Hand::is_all_in(const std::string& name) const {
    ChipCount stack = stack_of(name);
    return stack > 0 && contrib_of(name) >= stack;
}

ChipCount Hand::total_contrib() const {
    ChipCount total = 0;
    for (const auto& entry : contrib) {
        total += entry.second;
    }
    return total;
}

ChipCount Hand::total_collected() const {
    ChipCount total = 0;
    for (const auto& entry : collects) {
        total += entry.second;
    }
    return total;
}

ChipCount parse_chips(const std::string& text) {
    const ChipCount max = std::numeric_limits<ChipCount>::max();
    ChipCount value = 0;
    bool any_digit = false;

    for (char c : text) {
        if (c == ',') {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return 0; // Malformed field
        }
        int digit = c - '0';
        if (value > (max - digit) / 10) {
            return 0; // Overflow
        }
        value = value * 10 + digit;
        any_digit = true;
    }

    return any_digit ? value : 0;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

} // namespace kotrack
