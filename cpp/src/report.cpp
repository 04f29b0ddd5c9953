/**
 * @file report.cpp
 * @brief JSON and text rendering of session results.
 */

#include "../include/kotrack/report.hpp"

namespace kotrack {

nlohmann::json to_json(const KnockoutEvent& event) {
    return {
        {"hand_id", event.hand_id},
        {"player", event.player},
        {"pot_index", event.pot_index},
        {"pot_size", event.pot_size},
        {"hero_stack", event.hero_stack},
        {"bust_stack", event.bust_stack}
    };
}

nlohmann::json to_json(const FileResult& file) {
    nlohmann::json events = nlohmann::json::array();
    for (const KnockoutEvent& event : file.events) {
        events.push_back(to_json(event));
    }
    return {
        {"source", file.source},
        {"readable", file.readable},
        {"hands", file.hands},
        {"knockouts", file.knockouts},
        {"events", events}
    };
}

nlohmann::json to_json(const SessionResult& session) {
    nlohmann::json files = nlohmann::json::array();
    for (const FileResult& file : session.files) {
        files.push_back(to_json(file));
    }
    return {
        {"files", files},
        {"total_knockouts", session.total_knockouts}
    };
}

void write_text_report(std::ostream& out, const SessionResult& session,
                       const KnockoutConfig& config) {
    for (const FileResult& file : session.files) {
        out << file.source << ": " << file.knockouts << " KO(s)";
        if (!file.readable) {
            out << " (unreadable)";
        }
        out << "\n";

        if (config.diagnostics) {
            for (const KnockoutEvent& event : file.events) {
                out << "  KO -> " << event.player << " via pot " << event.pot_size
                    << " (hand " << event.hand_id << ")\n";
            }
        }
    }

    out << "--------------\n";
    out << "TOTAL: " << session.total_knockouts << " KO(s)\n";

    std::vector<std::string> selected = session.files_with_knockouts();
    if (selected.empty()) {
        out << "No KO found with min_bb >= " << config.min_bb << "\n";
        return;
    }
    out << "WITH KO:";
    for (const std::string& path : selected) {
        out << " " << path;
    }
    out << "\n";
}

} // namespace kotrack
