#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace pagedecode {

enum class LogLevel { Trace, Debug, Info, Warn };

const char *log_level_name(LogLevel level);

struct LogField {
    std::string key;
    std::string value;
};

// Receives progress events from the extraction pipeline. The pipeline never
// logs anywhere else, so tests can record events without touching stderr.
class ExtractionObserver {
public:
    virtual ~ExtractionObserver() = default;

    virtual void on_event(LogLevel level, const std::string &message,
                          const std::vector<LogField> &fields) = 0;

    void trace(const std::string &message, const std::vector<LogField> &fields = {}) {
        on_event(LogLevel::Trace, message, fields);
    }
    void debug(const std::string &message, const std::vector<LogField> &fields = {}) {
        on_event(LogLevel::Debug, message, fields);
    }
    void info(const std::string &message, const std::vector<LogField> &fields = {}) {
        on_event(LogLevel::Info, message, fields);
    }
    void warn(const std::string &message, const std::vector<LogField> &fields = {}) {
        on_event(LogLevel::Warn, message, fields);
    }
};

// Writes "[level] message key=value ..." lines to a stream (stderr by default)
class StderrObserver : public ExtractionObserver {
public:
    explicit StderrObserver(LogLevel threshold = LogLevel::Info);
    StderrObserver(LogLevel threshold, std::ostream &stream);

    void on_event(LogLevel level, const std::string &message,
                  const std::vector<LogField> &fields) override;

private:
    LogLevel threshold_;
    std::ostream &stream_;
};

class NullObserver : public ExtractionObserver {
public:
    void on_event(LogLevel, const std::string &, const std::vector<LogField> &) override {}
};

} // namespace pagedecode
