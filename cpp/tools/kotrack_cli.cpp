// Command-line front end: counts Hero's knockouts in hand-history files.
//
//   kotrack_cli INPUT... [--hero NAME] [--min-bb N] [--config FILE]
//               [--final-hand-rule RULE] [--verbose] [--json]

#include "kotrack/config.hpp"
#include "kotrack/errors.hpp"
#include "kotrack/report.hpp"
#include "kotrack/session.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace kotrack;

namespace {

void print_usage() {
    std::cerr << "Usage: kotrack_cli INPUT [...] [--hero NAME] [--min-bb N] "
                 "[--config FILE] [--final-hand-rule missing_from_collects|zero_final_stack] "
                 "[--verbose] [--json]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 1;
    }

    try {
        // The config file is applied first so flags on the command line win
        KnockoutConfig config;
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == "--config") {
                config = load_config(args[i + 1]);
            }
        }

        std::vector<std::string> inputs;
        bool json = false;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            bool has_value = i + 1 < args.size();

            if (arg == "--config" && has_value) {
                ++i;
            } else if (arg == "--hero" && has_value) {
                config.hero = args[++i];
            } else if (arg == "--min-bb" && has_value) {
                config.min_bb = parse_min_bb(args[++i]);
            } else if (arg == "--final-hand-rule" && has_value) {
                config.final_hand_rule = parse_final_hand_rule(args[++i]);
            } else if (arg == "--verbose") {
                config.diagnostics = true;
            } else if (arg == "--json") {
                json = true;
            } else if (arg.compare(0, 2, "--") == 0) {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                print_usage();
                return 1;
            } else {
                inputs.push_back(arg);
            }
        }

        std::vector<std::string> files = collect_input_files(inputs, config.extension);
        SessionResult session = count_session(files, config);

        if (json) {
            std::cout << to_json(session).dump(2) << std::endl;
        } else {
            write_text_report(std::cout, session, config);
        }
    } catch (const InputError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    return 0;
}
