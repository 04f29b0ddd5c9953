// Example: walk one synthetic three-way all-in through the pipeline

#include "../include/kotrack/elimination.hpp"
#include "../include/kotrack/hand_parser.hpp"
#include "../include/kotrack/knockouts.hpp"
#include "../include/kotrack/session.hpp"
#include <iostream>

using namespace kotrack;

namespace {

const char* SAMPLE_LOG =
    "Poker Hand #TM1002: Tournament #777, Bounty Hold'em No Limit - Level10(200/400) - 2025/01/01 16:40:00\n"
    "Table '777 1' 9-max Seat #1 is the button\n"
    "Seat 1: Hero (1,000 in chips)\n"
    "Seat 2: Mid (3,000 in chips)\n"
    "*** HOLE CARDS ***\n"
    "Hero: folds\n"
    "Mid: folds\n"
    "\n"
    "Poker Hand #TM1001: Tournament #777, Bounty Hold'em No Limit - Level10(200/400) - 2025/01/01 16:38:15\n"
    "Table '777 1' 9-max Seat #1 is the button\n"
    "Seat 1: Hero (1,000 in chips)\n"
    "Seat 2: Mid (500 in chips)\n"
    "Seat 3: Short (200 in chips)\n"
    "*** HOLE CARDS ***\n"
    "Hero: bets 1,000 and is all-in\n"
    "Mid: calls 500 and is all-in\n"
    "Short: calls 200 and is all-in\n"
    "Uncalled bet (500) returned to Hero\n"
    "*** SHOWDOWN ***\n"
    "Hero collected 1,200 from pot\n"
    "\n";

void print_hand(const Hand& hand) {
    std::cout << "Hand " << hand.hand_id << " (bb " << hand.bb << ")" << std::endl;
    for (const Seat& seat : hand.seats) {
        std::cout << "  Seat " << seat.seat_number << ": " << seat.name
                  << " stack=" << seat.stack
                  << " contrib=" << hand.contrib_of(seat.name)
                  << " collected=" << hand.collected_by(seat.name) << std::endl;
    }
    for (size_t i = 0; i < hand.pots.size(); ++i) {
        const Pot& pot = hand.pots[i];
        std::cout << "  Pot " << i << ": size=" << pot.size << " eligible={";
        for (const std::string& name : pot.eligible) std::cout << " " << name;
        std::cout << " } winners={";
        for (const std::string& name : pot.winners) std::cout << " " << name;
        std::cout << " }" << std::endl;
    }
}

} // namespace

int main() {
    KnockoutConfig config;
    config.diagnostics = true;

    std::vector<std::string> lines = split_lines(SAMPLE_LOG);
    std::vector<Hand> hands = parse_hands(lines, config);

    // Hero covers both opponents and wins both pots; only Short is gone next hand
    for (size_t i = 0; i < hands.size(); ++i) {
        print_hand(hands[i]);
        const Hand* next = (i + 1 < hands.size()) ? &hands[i + 1] : nullptr;
        std::vector<std::string> eliminated = find_eliminated(hands[i], next);
        HandKnockouts kos = count_hand_knockouts(hands[i], eliminated, config);
        std::cout << "  Eliminated: " << eliminated.size()
                  << ", Hero KO(s): " << kos.count << std::endl;
    }

    FileResult result = process_lines(lines, config, "sample");
    std::cout << "\nTotal for sample: " << result.knockouts << " KO(s)" << std::endl;
    return 0;
}
