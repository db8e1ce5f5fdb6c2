#pragma once

#include <ostream>
#include <string>

namespace serde {

// =============================================================================
// Diagnostic log
// =============================================================================
//
// A process-wide log stream, disabled by default. Messages are written one
// per line and flushed immediately.

void set_log_stream(std::ostream* stream);

void log(const std::string& message);

} // namespace serde
