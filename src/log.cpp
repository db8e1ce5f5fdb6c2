// log.cpp - process-wide diagnostic log stream

#include "serde/log.hpp"

namespace serde {

namespace {

std::ostream* log_stream = nullptr;

} // namespace

void set_log_stream(std::ostream* stream) {
    log_stream = stream;
}

void log(const std::string& message) {
    if (log_stream) {
        *log_stream << message << "\n";
        log_stream->flush();
    }
}

} // namespace serde
