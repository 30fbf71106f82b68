#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace objstore {

enum class EventLevel { Debug, Info, Warning, Error };

// A structured record of something the storage layer did.
// `name` is the operation ("save", "delete", "provision", ...).
struct Event {
    EventLevel level = EventLevel::Info;
    std::string name;
    bool success = true;
    double duration_secs = 0.0;
    uint64_t bytes = 0;
    std::map<std::string, std::string> fields;
};

// Observability collaborator injected into the storage layer
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event& event) = 0;
};

class NullEventSink : public EventSink {
public:
    void emit(const Event&) override {}
};

// Renders events through log_info / log_warn / log_error.
// Debug events are only printed when `verbose` is set.
class LogEventSink : public EventSink {
public:
    explicit LogEventSink(bool verbose = false) : verbose_(verbose) {}
    void emit(const Event& event) override;

private:
    bool verbose_;
};

// Forwards every event to each child sink
class FanoutEventSink : public EventSink {
public:
    void add(std::shared_ptr<EventSink> sink);
    void emit(const Event& event) override;

private:
    std::vector<std::shared_ptr<EventSink>> sinks_;
};

// "save key=a.txt bytes=12 ok 0.004s"
std::string format_event(const Event& event);

} // namespace objstore
