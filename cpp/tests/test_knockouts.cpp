#include <gtest/gtest.h>
#include "kotrack/knockouts.hpp"
#include "kotrack/side_pots.hpp"
#include <utility>

using namespace kotrack;

namespace {

// Seats in the given order, pots built from contrib and settled from collects.
Hand make_hand(const std::vector<std::pair<std::string, ChipCount>>& seats,
               const ChipMap& contrib, const ChipMap& collects, ChipCount bb = 200) {
    Hand hand;
    hand.hand_id = "TM100";
    hand.bb = bb;
    int number = 1;
    for (const auto& seat : seats) {
        hand.seats.emplace_back(seat.first, number++, seat.second);
    }
    hand.contrib = contrib;
    hand.collects = collects;
    hand.pots = build_pots(contrib);
    assign_winners(hand.pots, collects);
    return hand;
}

} // namespace

TEST(KnockoutTest, HeroCoversAndWins) {
    Hand hand = make_hand({{"Hero", 1000}, {"Villain", 500}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}});

    KnockoutConfig config;
    HandKnockouts kos = count_hand_knockouts(hand, {"Villain"}, config);
    EXPECT_EQ(kos.count, 1);
    EXPECT_TRUE(kos.events.empty());
}

TEST(KnockoutTest, BelowTableLevelFilter) {
    Hand hand = make_hand({{"Hero", 1000}, {"Villain", 500}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}}, 50);

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"Villain"}, config).count, 0);

    config.min_bb = 50;
    EXPECT_EQ(count_hand_knockouts(hand, {"Villain"}, config).count, 1);
}

TEST(KnockoutTest, HeroDoesNotCover) {
    // Hero wins but started with less than the busted player
    Hand hand = make_hand({{"Hero", 400}, {"Villain", 500}},
                          {{"Hero", 400}, {"Villain", 400}},
                          {{"Hero", 800}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"Villain"}, config).count, 0);
}

TEST(KnockoutTest, EqualStacksCount) {
    Hand hand = make_hand({{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"Villain"}, config).count, 1);
}

TEST(KnockoutTest, HeroWinsOnlySidePot) {
    // Main 600 {Hero, Mid, Short} won by Mid; side 800 {Hero, Mid} won by Hero.
    // Short busted in the main pot, which Hero did not win.
    Hand hand = make_hand({{"Hero", 1000}, {"Mid", 600}, {"Short", 200}},
                          {{"Hero", 600}, {"Mid", 600}, {"Short", 200}},
                          {{"Mid", 600}, {"Hero", 800}});

    ASSERT_EQ(hand.pots.size(), 2u);
    EXPECT_EQ(hand.pots[0].winners, NameSet{"Mid"});
    EXPECT_EQ(hand.pots[1].winners, NameSet{"Hero"});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"Short"}, config).count, 0);
}

TEST(KnockoutTest, TwoBustsInOneHand) {
    Hand hand = make_hand({{"Hero", 3000}, {"A", 500}, {"B", 800}},
                          {{"Hero", 800}, {"A", 500}, {"B", 800}},
                          {{"Hero", 2100}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"A", "B"}, config).count, 2);
}

TEST(KnockoutTest, HeroNotSeated) {
    Hand hand = make_hand({{"A", 500}, {"B", 800}},
                          {{"A", 500}, {"B", 500}},
                          {{"B", 1000}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"A"}, config).count, 0);
}

TEST(KnockoutTest, NoEliminations) {
    Hand hand = make_hand({{"Hero", 1000}, {"Villain", 500}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {}, config).count, 0);
}

TEST(KnockoutTest, HeroOwnBustIsSkipped) {
    Hand hand = make_hand({{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"Hero"}, config).count, 0);
}

TEST(KnockoutTest, UnseatedBustIsSkipped) {
    Hand hand = make_hand({{"Hero", 1000}, {"Villain", 500}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"Ghost", "Villain"}, config).count, 1);
}

TEST(KnockoutTest, BustWithoutPotIsSkipped) {
    // Sitting-out player who put nothing in and is gone next hand
    Hand hand = make_hand({{"Hero", 1000}, {"Villain", 500}, {"Away", 300}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}});

    KnockoutConfig config;
    EXPECT_EQ(find_bust_pot(hand, "Away"), -1);
    EXPECT_EQ(count_hand_knockouts(hand, {"Away"}, config).count, 0);
}

TEST(KnockoutTest, CustomHeroName) {
    Hand hand = make_hand({{"me", 1000}, {"Villain", 500}},
                          {{"me", 500}, {"Villain", 500}},
                          {{"me", 1000}});

    KnockoutConfig config;
    EXPECT_EQ(count_hand_knockouts(hand, {"Villain"}, config).count, 0);

    config.hero = "me";
    EXPECT_EQ(count_hand_knockouts(hand, {"Villain"}, config).count, 1);
}

TEST(KnockoutTest, DiagnosticsRecordsEvents) {
    Hand hand = make_hand({{"Hero", 1000}, {"Villain", 500}},
                          {{"Hero", 500}, {"Villain", 500}},
                          {{"Hero", 1000}});

    KnockoutConfig config;
    config.diagnostics = true;
    HandKnockouts kos = count_hand_knockouts(hand, {"Villain"}, config);

    ASSERT_EQ(kos.count, 1);
    ASSERT_EQ(kos.events.size(), 1u);
    EXPECT_EQ(kos.events[0].hand_id, "TM100");
    EXPECT_EQ(kos.events[0].player, "Villain");
    EXPECT_EQ(kos.events[0].pot_index, 0u);
    EXPECT_EQ(kos.events[0].pot_size, 1000);
    EXPECT_EQ(kos.events[0].hero_stack, 1000);
    EXPECT_EQ(kos.events[0].bust_stack, 500);
}

TEST(BustPotTest, PicksMostExclusivePot) {
    // Pots: 60 {A,B,C}, 60 {A,B}, 50 {A}
    Hand hand = make_hand({{"A", 100}, {"B", 50}, {"C", 20}},
                          {{"A", 100}, {"B", 50}, {"C", 20}},
                          {{"A", 170}});

    EXPECT_EQ(find_bust_pot(hand, "C"), 0);
    EXPECT_EQ(find_bust_pot(hand, "B"), 1);
    EXPECT_EQ(find_bust_pot(hand, "A"), 2);
    EXPECT_EQ(find_bust_pot(hand, "Nobody"), -1);
}
