/**
 * @file session.cpp
 * @brief File and session aggregation.
 *
 * The only run-terminating condition is "no input files at all"; everything
 * below file level degrades to fewer knockouts counted.
 */

#include "../include/kotrack/session.hpp"
#include "../include/kotrack/elimination.hpp"
#include "../include/kotrack/errors.hpp"
#include "../include/kotrack/hand_parser.hpp"
#include "../include/kotrack/hand_splitter.hpp"
#include "../include/kotrack/logging.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace kotrack {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::vector<std::string> SessionResult::files_with_knockouts() const {
    std::vector<std::string> selected;
    for (const FileResult& file : files) {
        if (file.knockouts > 0) {
            selected.push_back(file.source);
        }
    }
    return selected;
}

std::vector<Hand> parse_hands(const std::vector<std::string>& lines,
                              const KnockoutConfig& config) {
    std::vector<Hand> hands;
    for (const HandRange& range : split_hands(lines)) {
        hands.push_back(parse_hand(lines, range, config.min_bb));
    }
    if (config.newest_first) {
        std::reverse(hands.begin(), hands.end());
    }
    return hands;
}

FileResult process_lines(const std::vector<std::string>& lines,
                         const KnockoutConfig& config,
                         const std::string& source) {
    FileResult result;
    result.source = source;

    std::vector<Hand> hands = parse_hands(lines, config);
    result.hands = static_cast<int>(hands.size());

    for (size_t i = 0; i < hands.size(); ++i) {
        const Hand* next = (i + 1 < hands.size()) ? &hands[i + 1] : nullptr;
        std::vector<std::string> eliminated =
            find_eliminated(hands[i], next, config.final_hand_rule);

        HandKnockouts kos = count_hand_knockouts(hands[i], eliminated, config);
        result.knockouts += kos.count;
        result.events.insert(result.events.end(), kos.events.begin(), kos.events.end());
    }

    if (config.diagnostics) {
        log_debug("session", "file_processed",
                  {{"source", source}, {"hands", result.hands},
                   {"knockouts", result.knockouts}});
    }
    return result;
}

FileResult process_text(const std::string& text, const KnockoutConfig& config,
                        const std::string& source) {
    return process_lines(split_lines(text), config, source);
}

FileResult process_file(const std::string& path, const KnockoutConfig& config) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        log_warn("session", "file_unreadable", {{"path", path}});
        FileResult result;
        result.source = path;
        result.readable = false;
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return process_text(buffer.str(), config, path);
}

SessionResult count_session(const std::vector<std::string>& files,
                            const KnockoutConfig& config) {
    SessionResult session;
    session.files.reserve(files.size());

    for (const std::string& path : files) {
        FileResult result = process_file(path, config);
        session.total_knockouts += result.knockouts;
        session.files.push_back(std::move(result));
    }
    return session;
}

std::vector<std::string> collect_input_files(const std::vector<std::string>& paths,
                                             const std::string& extension) {
    const std::string wanted = to_lower(extension);
    std::vector<std::string> files;

    for (const std::string& path : paths) {
        std::error_code ec;
        fs::file_status status = fs::status(path, ec);

        if (!ec && fs::is_directory(status)) {
            fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
            for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (it->is_regular_file(ec) &&
                    to_lower(it->path().extension().string()) == wanted) {
                    files.push_back(it->path().string());
                }
            }
            if (ec) {
                log_warn("session", "directory_walk_failed",
                         {{"path", path}, {"error", ec.message()}});
            }
        } else if (!ec && fs::is_regular_file(status)) {
            files.push_back(path);
        } else {
            log_warn("session", "input_path_missing", {{"path", path}});
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    if (files.empty()) {
        throw InputError::no_input("no " + extension + " files found in the given paths");
    }
    return files;
}

} // namespace kotrack
