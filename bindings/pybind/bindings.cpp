#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "kotrack/config.hpp"
#include "kotrack/elimination.hpp"
#include "kotrack/errors.hpp"
#include "kotrack/hand_parser.hpp"
#include "kotrack/knockouts.hpp"
#include "kotrack/report.hpp"
#include "kotrack/session.hpp"
#include "kotrack/side_pots.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_kotrack_core, m) {
    m.doc() = "Hand-history knockout counter core module";

    m.attr("DEFAULT_MIN_BB") = kotrack::DEFAULT_MIN_BB;
    m.attr("HAND_START_MARKER") = std::string(kotrack::HAND_START_MARKER);

    py::register_exception<kotrack::InputError>(m, "InputError", PyExc_ValueError);

    py::enum_<kotrack::FinalHandRule>(m, "FinalHandRule")
        .value("MISSING_FROM_COLLECTS", kotrack::FinalHandRule::MissingFromCollects)
        .value("ZERO_FINAL_STACK", kotrack::FinalHandRule::ZeroFinalStack)
        .export_values();

    // Seat struct
    py::class_<kotrack::Seat>(m, "Seat")
        .def(py::init<>())
        .def(py::init<const std::string&, int, kotrack::ChipCount>(),
             py::arg("name"), py::arg("seat_number"), py::arg("stack"))
        .def_readwrite("name", &kotrack::Seat::name)
        .def_readwrite("seat_number", &kotrack::Seat::seat_number)
        .def_readwrite("stack", &kotrack::Seat::stack)
        .def("__repr__", [](const kotrack::Seat& seat) {
            return "<Seat " + std::to_string(seat.seat_number) + " " + seat.name +
                   " stack=" + std::to_string(seat.stack) + ">";
        });

    // Pot struct
    py::class_<kotrack::Pot>(m, "Pot")
        .def(py::init<>())
        .def_readwrite("size", &kotrack::Pot::size)
        .def_readwrite("eligible", &kotrack::Pot::eligible)
        .def_readwrite("winners", &kotrack::Pot::winners)
        .def("__repr__", [](const kotrack::Pot& pot) {
            return "<Pot size=" + std::to_string(pot.size) +
                   " eligible=" + std::to_string(pot.eligible.size()) +
                   " winners=" + std::to_string(pot.winners.size()) + ">";
        });

    // Hand struct
    py::class_<kotrack::Hand>(m, "Hand")
        .def(py::init<>())
        .def_readwrite("hand_id", &kotrack::Hand::hand_id)
        .def_readwrite("tournament_id", &kotrack::Hand::tournament_id)
        .def_readwrite("timestamp", &kotrack::Hand::timestamp)
        .def_readwrite("table_size", &kotrack::Hand::table_size)
        .def_readwrite("bb", &kotrack::Hand::bb)
        .def_readwrite("seats", &kotrack::Hand::seats)
        .def_readwrite("contrib", &kotrack::Hand::contrib)
        .def_readwrite("collects", &kotrack::Hand::collects)
        .def_readwrite("pots", &kotrack::Hand::pots)
        .def_readonly("warnings", &kotrack::Hand::warnings)
        .def("stack_of", &kotrack::Hand::stack_of, py::arg("name"))
        .def("final_stack", &kotrack::Hand::final_stack, py::arg("name"))
        .def("is_all_in", &kotrack::Hand::is_all_in, py::arg("name"))
        .def("__repr__", [](const kotrack::Hand& hand) {
            return "<Hand " + hand.hand_id + " seats=" + std::to_string(hand.seats.size()) +
                   " pots=" + std::to_string(hand.pots.size()) +
                   " bb=" + std::to_string(hand.bb) + ">";
        });

    // Configuration
    py::class_<kotrack::KnockoutConfig>(m, "KnockoutConfig")
        .def(py::init<>())
        .def_readwrite("hero", &kotrack::KnockoutConfig::hero)
        .def_readwrite("min_bb", &kotrack::KnockoutConfig::min_bb)
        .def_readwrite("diagnostics", &kotrack::KnockoutConfig::diagnostics)
        .def_readwrite("final_hand_rule", &kotrack::KnockoutConfig::final_hand_rule)
        .def_readwrite("newest_first", &kotrack::KnockoutConfig::newest_first)
        .def_readwrite("extension", &kotrack::KnockoutConfig::extension)
        .def("__repr__", [](const kotrack::KnockoutConfig& config) {
            return "<KnockoutConfig " + kotrack::config_to_json(config).dump() + ">";
        });

    m.def("load_config", &kotrack::load_config, py::arg("path"),
          "Load a KnockoutConfig from a JSON file");

    // Results
    py::class_<kotrack::KnockoutEvent>(m, "KnockoutEvent")
        .def(py::init<>())
        .def_readonly("hand_id", &kotrack::KnockoutEvent::hand_id)
        .def_readonly("player", &kotrack::KnockoutEvent::player)
        .def_readonly("pot_index", &kotrack::KnockoutEvent::pot_index)
        .def_readonly("pot_size", &kotrack::KnockoutEvent::pot_size)
        .def_readonly("hero_stack", &kotrack::KnockoutEvent::hero_stack)
        .def_readonly("bust_stack", &kotrack::KnockoutEvent::bust_stack);

    py::class_<kotrack::HandKnockouts>(m, "HandKnockouts")
        .def_readonly("count", &kotrack::HandKnockouts::count)
        .def_readonly("events", &kotrack::HandKnockouts::events);

    py::class_<kotrack::FileResult>(m, "FileResult")
        .def_readonly("source", &kotrack::FileResult::source)
        .def_readonly("hands", &kotrack::FileResult::hands)
        .def_readonly("knockouts", &kotrack::FileResult::knockouts)
        .def_readonly("events", &kotrack::FileResult::events)
        .def_readonly("readable", &kotrack::FileResult::readable)
        .def("__repr__", [](const kotrack::FileResult& result) {
            return "<FileResult " + result.source + " hands=" + std::to_string(result.hands) +
                   " knockouts=" + std::to_string(result.knockouts) + ">";
        });

    py::class_<kotrack::SessionResult>(m, "SessionResult")
        .def_readonly("files", &kotrack::SessionResult::files)
        .def_readonly("total_knockouts", &kotrack::SessionResult::total_knockouts)
        .def("files_with_knockouts", &kotrack::SessionResult::files_with_knockouts)
        .def("to_json", [](const kotrack::SessionResult& session) {
            return kotrack::to_json(session).dump();
        });

    // Pipeline stages
    m.def("split_lines", &kotrack::split_lines, py::arg("text"));
    m.def("split_hands", [](const std::vector<std::string>& lines) {
              std::vector<std::pair<size_t, size_t>> ranges;
              for (const kotrack::HandRange& range : kotrack::split_hands(lines)) {
                  ranges.emplace_back(range.begin, range.end);
              }
              return ranges;
          },
          py::arg("lines"),
          "Return (begin, end) line ranges for every hand record");
    m.def("parse_hand", [](const std::vector<std::string>& lines, size_t begin, size_t end,
                           kotrack::ChipCount default_bb) {
              return kotrack::parse_hand(lines, kotrack::HandRange(begin, end), default_bb);
          },
          py::arg("lines"), py::arg("begin"), py::arg("end"),
          py::arg("default_bb") = kotrack::DEFAULT_MIN_BB);
    m.def("parse_hand_text", &kotrack::parse_hand_text,
          py::arg("text"), py::arg("default_bb") = kotrack::DEFAULT_MIN_BB);
    m.def("build_pots", &kotrack::build_pots, py::arg("contrib"));
    m.def("assign_winners", [](std::vector<kotrack::Pot> pots, const kotrack::ChipMap& collects) {
              kotrack::assign_winners(pots, collects);
              return pots;
          },
          py::arg("pots"), py::arg("collects"),
          "Return a copy of the pots with winners assigned");
    m.def("find_eliminated", [](const kotrack::Hand& current, const kotrack::Hand* next,
                                kotrack::FinalHandRule rule) {
              return kotrack::find_eliminated(current, next, rule);
          },
          py::arg("current"), py::arg("next") = nullptr,
          py::arg("rule") = kotrack::FinalHandRule::MissingFromCollects);
    m.def("count_hand_knockouts", &kotrack::count_hand_knockouts,
          py::arg("hand"), py::arg("eliminated"), py::arg("config"));
    m.def("process_text", &kotrack::process_text,
          py::arg("text"), py::arg("config"), py::arg("source") = "");
    m.def("process_file", &kotrack::process_file, py::arg("path"), py::arg("config"));
    m.def("count_session", &kotrack::count_session, py::arg("files"), py::arg("config"));
    m.def("collect_input_files", &kotrack::collect_input_files,
          py::arg("paths"), py::arg("extension") = ".txt");
}
