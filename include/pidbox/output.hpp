#pragma once

/**
 * @file output.hpp
 * @brief Text and JSON rendering of ping results
 */

#include "pidbox/collector/response_collector.hpp"
#include "pidbox/config.hpp"
#include <ostream>

namespace pidbox {

/// "<name>: OK <status>" per worker, then "<n> nodes online."
void render_text(std::ostream& out, const ResponseMap& responses);

/// {"<name>": {"ok": "<status>"}} indented by two spaces; "{}" when empty.
void render_json(std::ostream& out, const ResponseMap& responses);

/**
 * @brief Render a result the way the command-line tool prints it
 * @return process exit code: 0 when at least one worker replied, else 1
 */
int write_result(std::ostream& out, const ResponseMap& responses, OutputFormat format);

} // namespace pidbox
