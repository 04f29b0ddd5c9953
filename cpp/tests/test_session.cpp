#include <gtest/gtest.h>
#include "kotrack/errors.hpp"
#include "kotrack/hand_splitter.hpp"
#include "kotrack/session.hpp"
#include <filesystem>
#include <fstream>

using namespace kotrack;

namespace fs = std::filesystem;

namespace {

// Hero busts Villain; Other folds and survives into HD2.
const char* HAND_HD1 =
    "Poker Hand #HD1: Tournament #9001, Hold'em No Limit - Level5(100/200) - 2025/02/01 10:00:00\n"
    "Table '9001 1' 6-max Seat #1 is the button\n"
    "Seat 1: Hero (1,800 in chips)\n"
    "Seat 2: Villain (500 in chips)\n"
    "Seat 3: Other (800 in chips)\n"
    "Villain: posts small blind 100\n"
    "Other: posts big blind 200\n"
    "*** HOLE CARDS ***\n"
    "Hero: raises 400 to 600\n"
    "Villain: calls 400 and is all-in\n"
    "Other: folds\n"
    "Uncalled bet (100) returned to Hero\n"
    "*** FLOP *** [2h 7d 9s]\n"
    "*** TURN *** [2h 7d 9s] [3h]\n"
    "*** RIVER *** [2h 7d 9s 3h] [Jd]\n"
    "*** SHOWDOWN ***\n"
    "Hero collected 1,200 from pot\n"
    "*** SUMMARY ***\n"
    "\n";

// Other folds the small blind; nobody busts.
const char* HAND_HD2 =
    "Poker Hand #HD2: Tournament #9001, Hold'em No Limit - Level5(100/200) - 2025/02/01 10:01:00\n"
    "Table '9001 1' 6-max Seat #1 is the button\n"
    "Seat 1: Hero (2,500 in chips)\n"
    "Seat 3: Other (600 in chips)\n"
    "Other: posts small blind 100\n"
    "Hero: posts big blind 200\n"
    "*** HOLE CARDS ***\n"
    "Other: folds\n"
    "Uncalled bet (100) returned to Hero\n"
    "Hero collected 200 from pot\n"
    "*** SUMMARY ***\n"
    "\n";

// Newest hand first, as the client writes them
std::string two_hand_file() {
    return std::string(HAND_HD2) + "\n" + HAND_HD1;
}

class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(fs::temp_directory_path() / name) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string write(const std::string& relative, const std::string& content) const {
        fs::path file = path_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file.string();
    }

    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST(SessionTest, ParseHandsReversesNewestFirst) {
    KnockoutConfig config;
    auto hands = parse_hands(split_lines(two_hand_file()), config);
    ASSERT_EQ(hands.size(), 2u);
    EXPECT_EQ(hands[0].hand_id, "HD1");
    EXPECT_EQ(hands[1].hand_id, "HD2");
}

TEST(SessionTest, ParseHandsKeepsOrderWhenOldestFirst) {
    KnockoutConfig config;
    config.newest_first = false;
    auto hands = parse_hands(split_lines(two_hand_file()), config);
    ASSERT_EQ(hands.size(), 2u);
    EXPECT_EQ(hands[0].hand_id, "HD2");
}

TEST(SessionTest, TwoHandFileDefaultRule) {
    // HD1: Villain gone from HD2. HD2 is the last hand and Other collected
    // nothing, so the final-hand heuristic reports Other as well.
    KnockoutConfig config;
    FileResult result = process_text(two_hand_file(), config, "two.txt");

    EXPECT_EQ(result.source, "two.txt");
    EXPECT_TRUE(result.readable);
    EXPECT_EQ(result.hands, 2);
    EXPECT_EQ(result.knockouts, 2);
}

TEST(SessionTest, TwoHandFileZeroFinalStackRule) {
    KnockoutConfig config;
    config.final_hand_rule = FinalHandRule::ZeroFinalStack;
    FileResult result = process_text(two_hand_file(), config);

    EXPECT_EQ(result.knockouts, 1);
}

TEST(SessionTest, SingleHandFile) {
    // Both opponents collected nothing in the only hand
    KnockoutConfig config;
    EXPECT_EQ(process_text(HAND_HD1, config).knockouts, 2);

    config.min_bb = 400;
    EXPECT_EQ(process_text(HAND_HD1, config).knockouts, 0);
}

TEST(SessionTest, OtherHeroSeesNothing) {
    KnockoutConfig config;
    config.hero = "Villain";
    EXPECT_EQ(process_text(two_hand_file(), config).knockouts, 0);
}

TEST(SessionTest, DiagnosticsCollectsEvents) {
    KnockoutConfig config;
    config.diagnostics = true;
    config.final_hand_rule = FinalHandRule::ZeroFinalStack;
    FileResult result = process_text(two_hand_file(), config);

    ASSERT_EQ(result.events.size(), 1u);
    EXPECT_EQ(result.events[0].hand_id, "HD1");
    EXPECT_EQ(result.events[0].player, "Villain");
    EXPECT_EQ(result.events[0].pot_size, 600);
}

TEST(SessionTest, TextWithoutHands) {
    KnockoutConfig config;
    FileResult result = process_text("Tournament summary\nnothing here\n", config);
    EXPECT_EQ(result.hands, 0);
    EXPECT_EQ(result.knockouts, 0);
}

TEST(SessionTest, UnreadableFile) {
    KnockoutConfig config;
    FileResult result = process_file("/nonexistent/kotrack/hands.txt", config);
    EXPECT_FALSE(result.readable);
    EXPECT_EQ(result.hands, 0);
    EXPECT_EQ(result.knockouts, 0);
}

TEST(SessionTest, CountSessionSumsFiles) {
    TempDir dir("kotrack_session_sum");
    std::string a = dir.write("a.txt", two_hand_file());
    std::string b = dir.write("b.txt", HAND_HD2);
    std::string c = dir.write("c.txt", "no hands\n");

    KnockoutConfig config;
    config.final_hand_rule = FinalHandRule::ZeroFinalStack;
    SessionResult session = count_session({a, b, c}, config);

    ASSERT_EQ(session.files.size(), 3u);
    EXPECT_EQ(session.files[0].knockouts, 1);
    EXPECT_EQ(session.files[1].knockouts, 0);
    EXPECT_EQ(session.files[2].knockouts, 0);
    EXPECT_EQ(session.total_knockouts, 1);

    auto with_ko = session.files_with_knockouts();
    ASSERT_EQ(with_ko.size(), 1u);
    EXPECT_EQ(with_ko[0], a);
}

TEST(SessionTest, CountSessionKeepsGoingPastUnreadableFile) {
    TempDir dir("kotrack_session_unreadable");
    std::string a = dir.write("a.txt", two_hand_file());

    KnockoutConfig config;
    SessionResult session = count_session({"/nonexistent/kotrack/x.txt", a}, config);

    ASSERT_EQ(session.files.size(), 2u);
    EXPECT_FALSE(session.files[0].readable);
    EXPECT_EQ(session.total_knockouts, 2);
}

TEST(CollectInputFilesTest, WalksDirectoriesRecursively) {
    TempDir dir("kotrack_collect_walk");
    std::string a = dir.write("a.txt", "");
    std::string b = dir.write("nested/deeper/b.TXT", "");
    dir.write("notes.md", "");
    dir.write("nested/c.log", "");

    auto files = collect_input_files({dir.str()}, ".txt");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], a);
    EXPECT_EQ(files[1], b);
}

TEST(CollectInputFilesTest, ExplicitFilesAreTakenAsGiven) {
    TempDir dir("kotrack_collect_explicit");
    std::string md = dir.write("hands.md", "");

    auto files = collect_input_files({md}, ".txt");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], md);
}

TEST(CollectInputFilesTest, Deduplicates) {
    TempDir dir("kotrack_collect_dedup");
    std::string a = dir.write("a.txt", "");

    auto files = collect_input_files({a, dir.str(), a}, ".txt");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], a);
}

TEST(CollectInputFilesTest, NothingFoundThrows) {
    TempDir dir("kotrack_collect_empty");
    dir.write("notes.md", "");

    try {
        collect_input_files({dir.str(), "/nonexistent/kotrack"}, ".txt");
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_EQ(e.kind(), InputError::Kind::NoInput);
    }
}
