/**
 * @file elimination.cpp
 * @brief Bust detection between consecutive hands.
 */

#include "../include/kotrack/elimination.hpp"

namespace kotrack {

std::vector<std::string> find_eliminated(const Hand& current, const Hand* next,
                                         FinalHandRule rule) {
    std::vector<std::string> eliminated;

    for (const Seat& seat : current.seats) {
        bool busted = false;
        if (next != nullptr) {
            busted = !next->has_seat(seat.name);
        } else if (rule == FinalHandRule::ZeroFinalStack) {
            busted = current.final_stack(seat.name) <= 0;
        } else {
            // A "collected 0" line counts the same as no line at all
            busted = current.collected_by(seat.name) <= 0;
        }

        if (busted) {
            eliminated.push_back(seat.name);
        }
    }

    return eliminated;
}

} // namespace kotrack
