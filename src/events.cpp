#include "objstore/events.hpp"
#include "objstore/log.hpp"

#include <cstdio>
#include <sstream>

namespace objstore {

std::string format_event(const Event& event) {
    std::ostringstream oss;
    oss << event.name;
    for (const auto& [key, value] : event.fields) {
        oss << " " << key << "=" << value;
    }
    if (event.bytes > 0) {
        oss << " bytes=" << event.bytes;
    }
    oss << (event.success ? " ok" : " failed");
    if (event.duration_secs > 0.0) {
        char buf[32];
        snprintf(buf, sizeof(buf), " %.3fs", event.duration_secs);
        oss << buf;
    }
    return oss.str();
}

void LogEventSink::emit(const Event& event) {
    std::string line = format_event(event);
    switch (event.level) {
        case EventLevel::Debug:
            if (verbose_) log_info("%s", line.c_str());
            break;
        case EventLevel::Info:
            log_info("%s", line.c_str());
            break;
        case EventLevel::Warning:
            log_warn("%s", line.c_str());
            break;
        case EventLevel::Error:
            log_error("%s", line.c_str());
            break;
    }
}

void FanoutEventSink::add(std::shared_ptr<EventSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanoutEventSink::emit(const Event& event) {
    for (auto& sink : sinks_) {
        sink->emit(event);
    }
}

} // namespace objstore
