#include "observer.hpp"

#include <iostream>

namespace pagedecode {

const char *log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
    }
    return "?";
}

StderrObserver::StderrObserver(LogLevel threshold)
    : threshold_(threshold), stream_(std::cerr) {}

StderrObserver::StderrObserver(LogLevel threshold, std::ostream &stream)
    : threshold_(threshold), stream_(stream) {}

void StderrObserver::on_event(LogLevel level, const std::string &message,
                              const std::vector<LogField> &fields) {
    if (static_cast<int>(level) < static_cast<int>(threshold_)) return;

    stream_ << "[" << log_level_name(level) << "] " << message;
    for (const auto &field : fields) {
        stream_ << " " << field.key << "=" << field.value;
    }
    stream_ << std::endl;
}

} // namespace pagedecode
