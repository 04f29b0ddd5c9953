/**
 * @file knockouts.cpp
 * @brief Knockout attribution with the stack-coverage rule.
 */

#include "../include/kotrack/knockouts.hpp"
#include "../include/kotrack/logging.hpp"
#include "../include/kotrack/side_pots.hpp"

namespace kotrack {

int find_bust_pot(const Hand& hand, const std::string& player) {
    for (size_t idx : settlement_order(hand.pots)) {
        if (hand.pots[idx].eligible.count(player) > 0) {
            return static_cast<int>(idx);
        }
    }
    return -1;
}

HandKnockouts count_hand_knockouts(const Hand& hand,
                                   const std::vector<std::string>& eliminated,
                                   const KnockoutConfig& config) {
    HandKnockouts result;

    const Seat* hero = hand.find_seat(config.hero);
    if (hand.bb < config.min_bb || hero == nullptr || eliminated.empty()) {
        return result;
    }

    for (const std::string& bust : eliminated) {
        if (bust == config.hero) {
            continue;
        }

        const Seat* bust_seat = hand.find_seat(bust);
        if (bust_seat == nullptr) {
            continue;
        }

        int pot_idx = find_bust_pot(hand, bust);
        if (pot_idx < 0) {
            continue;
        }

        const Pot& pot = hand.pots[pot_idx];
        bool covered = hero->stack >= bust_seat->stack;
        bool hero_won = pot.winners.count(config.hero) > 0;
        if (!covered || !hero_won) {
            continue;
        }

        result.count++;

        if (config.diagnostics) {
            KnockoutEvent event;
            event.hand_id = hand.hand_id;
            event.player = bust;
            event.pot_index = static_cast<size_t>(pot_idx);
            event.pot_size = pot.size;
            event.hero_stack = hero->stack;
            event.bust_stack = bust_seat->stack;
            result.events.push_back(event);

            log_info("knockouts", "knockout_credited",
                     {{"hand_id", hand.hand_id}, {"player", bust},
                      {"pot_index", pot_idx}, {"pot_size", pot.size}});
        }
    }

    return result;
}

} // namespace kotrack
