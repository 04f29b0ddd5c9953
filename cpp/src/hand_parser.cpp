/**
 * @file hand_parser.cpp
 * @brief Implementation of the hand record parser.
 *
 * Contributions are accumulated in two maps per hand:
 *   - contrib: net chips put into the pot over the whole hand
 *   - round:   chips put in during the current betting round, used to turn
 *              "raises X to Y" into the incremental amount Y - round[player]
 *
 * Both maps are local to one call and never escape it.
 */

#include "../include/kotrack/hand_parser.hpp"
#include "../include/kotrack/logging.hpp"
#include "../include/kotrack/side_pots.hpp"
#include <algorithm>
#include <regex>

namespace kotrack {

namespace {

const std::regex RE_HAND_ID(R"(^Poker Hand #([A-Za-z0-9]+))");
const std::regex RE_TOURNAMENT_ID(R"(Tournament #(\d+))");
const std::regex RE_TIMESTAMP(R"((\d{4}/\d{2}/\d{2} \d{1,2}:\d{2}:\d{2}))");
const std::regex RE_BLINDS_PAREN(R"(\(([\d,]+)/([\d,]+))");
const std::regex RE_BLINDS_BARE(R"((?:^|[^\d,/])([\d,]+)/([\d,]+)(?![\d/]))");
const std::regex RE_TABLE(R"(^Table '[^']*' (\d+)-max)");
const std::regex RE_SEAT(R"(^Seat (\d+): (.+?) \(.*?([\d,]+) in chips)");
const std::regex RE_ACTION(R"(^([^:]+): (posts|bets|calls|raises|all-in|checks|folds)\b(.*)$)");
const std::regex RE_RAISE_TO(R"(raises [\d,]+ to ([\d,]+))");
const std::regex RE_UNCALLED(R"(^Uncalled bet \(([\d,]+)\) returned to (.+)$)");
const std::regex RE_COLLECTED(R"(^([^:]+?) collected ([\d,]+) from)");
const std::regex RE_AMOUNT(R"(\d[\d,]*)");
const std::regex RE_ANTE(R"(^\s*(?:the )?ante\b)");

bool starts_with(const std::string& line, const char* prefix) {
    return line.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

bool is_street_marker(const std::string& line) {
    return starts_with(line, "*** FLOP") || starts_with(line, "*** TURN") ||
           starts_with(line, "*** RIVER");
}

void parse_header(const std::string& header, Hand& hand) {
    std::smatch m;
    if (std::regex_search(header, m, RE_HAND_ID)) {
        hand.hand_id = m[1].str();
    }
    if (std::regex_search(header, m, RE_TOURNAMENT_ID)) {
        hand.tournament_id = m[1].str();
    }
    if (std::regex_search(header, m, RE_TIMESTAMP)) {
        hand.timestamp = m[1].str();
    }
    hand.bb = parse_big_blind(header);
}

void add_seat(Hand& hand, const std::smatch& m) {
    std::string name = trim(m[2].str());
    if (hand.has_seat(name)) {
        std::string warning = "duplicate seat name '" + name + "' ignored";
        log_warn("parser", "duplicate_seat_name",
                 {{"hand_id", hand.hand_id}, {"player", name}});
        hand.warnings.push_back(warning);
        return;
    }
    hand.seats.emplace_back(name, static_cast<int>(parse_chips(m[1].str())),
                            parse_chips(m[3].str()));
}

void add_action(Hand& hand, ChipMap& round, const std::string& line, const std::smatch& m) {
    std::string player = trim(m[1].str());
    std::string verb = m[2].str();
    std::string rest = m[3].str();

    if (verb == "checks" || verb == "folds") {
        return;
    }

    if (verb == "raises") {
        std::smatch to;
        if (!std::regex_search(line, to, RE_RAISE_TO)) {
            hand.warnings.push_back("raise without target amount: " + line);
            return;
        }
        ChipCount total = parse_chips(to[1].str());
        ChipCount delta = total - round[player];
        hand.contrib[player] += delta;
        round[player] = total;
        return;
    }

    // posts / bets / calls / all-in
    std::smatch amount;
    ChipCount chips = 0;
    if (std::regex_search(rest, amount, RE_AMOUNT)) {
        chips = parse_chips(amount[0].str());
    }
    hand.contrib[player] += chips;

    // Antes are dead money: they do not count toward the betting round
    bool is_ante = (verb == "posts") && std::regex_search(rest, RE_ANTE);
    if (!is_ante) {
        round[player] += chips;
    }
}

} // namespace

ChipCount parse_big_blind(const std::string& header) {
    std::smatch m;
    if (std::regex_search(header, m, RE_BLINDS_PAREN) ||
        std::regex_search(header, m, RE_BLINDS_BARE)) {
        return parse_chips(m[2].str());
    }
    return 0;
}

Hand parse_hand(const std::vector<std::string>& lines, const HandRange& range,
                ChipCount default_bb) {
    Hand hand;
    size_t end = std::min(range.end, lines.size());
    if (range.begin >= end) {
        hand.bb = default_bb;
        return hand;
    }

    parse_header(lines[range.begin], hand);
    if (hand.bb <= 0) {
        hand.bb = default_bb;
    }

    ChipMap round;
    bool in_seat_section = true;

    for (size_t i = range.begin + 1; i < end; ++i) {
        const std::string& line = lines[i];
        if (trim(line).empty()) {
            break; // End of record; trailing blank lines belong to the range
        }

        std::smatch m;

        if (starts_with(line, "*** HOLE")) {
            in_seat_section = false;
            continue;
        }
        if (in_seat_section) {
            if (std::regex_search(line, m, RE_SEAT)) {
                add_seat(hand, m);
                continue;
            }
            if (std::regex_search(line, m, RE_TABLE)) {
                hand.table_size = static_cast<int>(parse_chips(m[1].str()));
                continue;
            }
        }
        if (is_street_marker(line)) {
            round.clear();
            continue;
        }

        if (std::regex_search(line, m, RE_UNCALLED)) {
            std::string player = trim(m[2].str());
            ChipCount amount = parse_chips(m[1].str());
            hand.contrib[player] -= amount;
            round[player] -= amount;
        } else if (std::regex_search(line, m, RE_ACTION)) {
            add_action(hand, round, line, m);
        } else if (std::regex_search(line, m, RE_COLLECTED)) {
            hand.collects[trim(m[1].str())] += parse_chips(m[2].str());
        }
    }

    hand.pots = build_pots(hand.contrib);
    assign_winners(hand.pots, hand.collects);
    return hand;
}

Hand parse_hand_text(const std::string& text, ChipCount default_bb) {
    std::vector<std::string> lines = split_lines(text);
    std::vector<HandRange> ranges = split_hands(lines);
    if (ranges.empty()) {
        Hand empty;
        empty.bb = default_bb;
        return empty;
    }
    return parse_hand(lines, ranges.front(), default_bb);
}

} // namespace kotrack
