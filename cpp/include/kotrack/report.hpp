/**
 * @file report.hpp
 * @brief Text and JSON rendering of knockout results.
 *
 * Text form:
 * @code
 *   logs/a.txt: 2 KO(s)
 *   logs/b.txt: 0 KO(s)
 *   --------------
 *   TOTAL: 2 KO(s)
 *   WITH KO: logs/a.txt
 * @endcode
 */

#pragma once

#include "config.hpp"
#include "knockouts.hpp"
#include "session.hpp"
#include <nlohmann/json.hpp>
#include <ostream>

namespace kotrack {

nlohmann::json to_json(const KnockoutEvent& event);
nlohmann::json to_json(const FileResult& file);
nlohmann::json to_json(const SessionResult& session);

/**
 * @brief Write the per-file and total counts in text form.
 * @param out Destination stream
 * @param session Results to print
 * @param config Used for the "no knockouts" note (min_bb) and trace lines
 *
 * With diagnostics on, each credited knockout is listed under its file.
 */
void write_text_report(std::ostream& out, const SessionResult& session,
                       const KnockoutConfig& config);

} // namespace kotrack
