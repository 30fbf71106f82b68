#include "objstore/metrics.hpp"
#include "objstore/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace objstore {

MetricsEventSink::MetricsEventSink(const std::filesystem::path& prom_file_path,
                                   std::chrono::seconds write_interval,
                                   const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Per-operation families ---

    operations_ = &prometheus::BuildCounter()
        .Name("objstore_operations_total")
        .Help("Storage operations by name and result")
        .Labels(labels)
        .Register(*registry_);

    bytes_ = &prometheus::BuildCounter()
        .Name("objstore_bytes_total")
        .Help("Payload bytes handled by storage operations")
        .Labels(labels)
        .Register(*registry_);

    durations_ = &prometheus::BuildHistogram()
        .Name("objstore_operation_duration_seconds")
        .Help("Storage operation duration in seconds")
        .Labels(labels)
        .Register(*registry_);

    // --- Counters ---

    auto& backups_family = prometheus::BuildCounter()
        .Name("objstore_backups_total")
        .Help("Objects archived to the backup bucket before deletion")
        .Labels(labels)
        .Register(*registry_);
    backups_success_ = &backups_family.Add({{"result", "success"}});
    backups_failure_ = &backups_family.Add({{"result", "failure"}});

    auto& provision_family = prometheus::BuildCounter()
        .Name("objstore_bucket_provisions_total")
        .Help("Bucket provisioning attempts by outcome")
        .Labels(labels)
        .Register(*registry_);
    provision_created_ = &provision_family.Add({{"outcome", "created"}});
    provision_existed_ = &provision_family.Add({{"outcome", "existed"}});
    provision_assumed_ = &provision_family.Add({{"outcome", "assumed"}});
    provision_failure_ = &provision_family.Add({{"outcome", "failure"}});

    // --- Gauges ---

    bucket_ready_ = &prometheus::BuildGauge()
        .Name("objstore_bucket_ready")
        .Help("1 once the bucket has been provisioned")
        .Labels(labels)
        .Register(*registry_)
        .Add({});
}

MetricsEventSink::~MetricsEventSink() {
    stop();
}

void MetricsEventSink::emit(const Event& event) {
    if (event.name == "provision") {
        if (!event.success) {
            provision_failure_->Increment();
            return;
        }
        auto it = event.fields.find("outcome");
        std::string outcome = it != event.fields.end() ? it->second : "";
        if (outcome == "created") provision_created_->Increment();
        else if (outcome == "existed") provision_existed_->Increment();
        else provision_assumed_->Increment();
        bucket_ready_->Set(1);
        return;
    }

    if (event.name == "backup") {
        (event.success ? backups_success_ : backups_failure_)->Increment();
        return;
    }

    operations_->Add({{"op", event.name},
                      {"result", event.success ? "success" : "failure"}}).Increment();
    if (event.bytes > 0) {
        bytes_->Add({{"op", event.name}}).Increment(static_cast<double>(event.bytes));
    }
    durations_->Add({{"op", event.name}}, prometheus::Histogram::BucketBoundaries{
        0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60})
        .Observe(event.duration_secs);
}

void MetricsEventSink::start() {
    if (prom_file_path_.empty()) return;
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsEventSink::writer_loop, this);
}

void MetricsEventSink::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
        // Final snapshot
        if (!write_file()) {
            log_warn("Could not write metrics file %s", prom_file_path_.c_str());
        }
    }
}

void MetricsEventSink::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        if (!write_file()) {
            log_warn("Could not write metrics file %s", prom_file_path_.c_str());
        }
    }
}

std::string MetricsEventSink::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

bool MetricsEventSink::write_file() const {
    if (prom_file_path_.empty()) return false;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

} // namespace objstore
