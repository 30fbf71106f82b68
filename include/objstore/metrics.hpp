#pragma once

#include "objstore/events.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace objstore {

/// Event sink that turns storage events into Prometheus metrics and
/// exports them to a textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. When started, a
/// background writer thread periodically serializes the registry to a .prom
/// file using atomic temp+rename.
class MetricsEventSink : public EventSink {
public:
    /// @param prom_file_path  Path to the .prom output file, empty to only
    ///                        collect in memory.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsEventSink(const std::filesystem::path& prom_file_path,
                     std::chrono::seconds write_interval = std::chrono::seconds(15),
                     const std::map<std::string, std::string>& labels = {});
    ~MetricsEventSink() override;

    MetricsEventSink(const MetricsEventSink&) = delete;
    MetricsEventSink& operator=(const MetricsEventSink&) = delete;

    void emit(const Event& event) override;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Current registry contents in the Prometheus text format.
    std::string serialize() const;

    /// Writes the textfile now. Returns false if it could not be replaced.
    bool write_file() const;

    std::shared_ptr<prometheus::Registry> registry() const { return registry_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Families (label values vary per operation) ---
    prometheus::Family<prometheus::Counter>* operations_;
    prometheus::Family<prometheus::Counter>* bytes_;
    prometheus::Family<prometheus::Histogram>* durations_;

    // --- Counters ---
    prometheus::Counter* backups_success_;
    prometheus::Counter* backups_failure_;
    prometheus::Counter* provision_created_;
    prometheus::Counter* provision_existed_;
    prometheus::Counter* provision_assumed_;
    prometheus::Counter* provision_failure_;

    // --- Gauges ---
    prometheus::Gauge* bucket_ready_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

} // namespace objstore
