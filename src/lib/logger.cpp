#include "osm2mbtiles.h"

#include "aixlog.hpp"

#include <memory>
#include <vector>

namespace osm2mbtiles {

namespace {

LogLevel current_level = LogLevel::Warning;
bool sink_installed = false;

void install_sink(LogLevel level) {
    std::vector<AixLog::log_sink_ptr> sinks;
    if (level != LogLevel::Silent) {
        AixLog::Severity threshold = AixLog::Severity::warning;
        switch (level) {
            case LogLevel::Debug:
                threshold = AixLog::Severity::debug;
                break;
            case LogLevel::Info:
                threshold = AixLog::Severity::info;
                break;
            case LogLevel::Error:
                threshold = AixLog::Severity::error;
                break;
            default:
                break;
        }
        AixLog::Filter filter;
        filter.add_filter(threshold);
        sinks.push_back(std::make_shared<AixLog::SinkCerr>(filter, "osm2mbtiles: #severity: #message"));
    }
    AixLog::Log::init(sinks);
    sink_installed = true;
}

}  // namespace

void Logger::set_level(LogLevel level) {
    if (sink_installed && level == current_level) {
        return;
    }
    current_level = level;
    install_sink(level);
}

LogLevel Logger::level() {
    if (!sink_installed) {
        install_sink(current_level);
    }
    return current_level;
}

LogLevel Logger::level_for_verbosity(int verbosity) {
    if (verbosity <= 0) {
        return LogLevel::Warning;
    }
    return verbosity == 1 ? LogLevel::Info : LogLevel::Debug;
}

}  // namespace osm2mbtiles
