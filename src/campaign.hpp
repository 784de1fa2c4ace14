#pragma once
#include "campaign_status.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "media.hpp"
#include "message_template.hpp"
#include "store.hpp"
#include "task_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace wacast {

class EventBus; // forward declaration

// One unit of dispatcher work: a single recipient of a single campaign.
// rendered_message and media are never both empty.
struct CampaignTask {
    TenantId tenant_id = 0;
    uint64_t generation = 0;
    std::string recipient;
    std::string rendered_message;
    std::shared_ptr<const std::vector<MediaPayload>> media; // shared by the whole campaign
    uint32_t delay_seconds = 0;

    size_t media_count() const { return media ? media->size() : 0; }
};

enum class CampaignError { None, InvalidCampaignRequest, NoActiveCampaign };

const char* campaign_error_to_string(CampaignError error);

struct CampaignResult {
    bool success = false;
    std::string message; // human-readable summary on success
    std::string error;   // reason on failure
    CampaignError code = CampaignError::None;
};

struct EngineOptions {
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds media_gap{1000};

    static EngineOptions from_config(const Config& config);
};

// Process-wide campaign dispatcher. Owns the task queue and the per-tenant
// status table; one background thread sends tasks strictly in enqueue order.
// start/stop/progress are safe to call from any thread and never wait on
// delivery.
class CampaignEngine {
public:
    CampaignEngine(GatewayDirectory& gateways, DeliveryRecorder& recorder,
                   EngineOptions options = {});
    ~CampaignEngine();

    CampaignEngine(const CampaignEngine&) = delete;
    CampaignEngine& operator=(const CampaignEngine&) = delete;

    // Spawn the dispatcher thread. No-op if already running.
    void start_dispatcher();

    // Ask the dispatcher to exit and join it. Queued tasks are left in place.
    void shutdown();

    bool dispatcher_running() const { return worker_running_.load(); }

    // Reset the tenant's status and enqueue one task per contact.
    CampaignResult start(TenantId tenant,
                         const std::vector<Contact>& contacts,
                         const std::string& message_template,
                         uint32_t delay_seconds,
                         std::vector<MediaPayload> media = {});

    // Snapshot with derived percentage/ETA; state None if never started.
    ProgressView progress(TenantId tenant) const;

    // Mark a running campaign stopped. Queued tasks are skipped on dequeue.
    CampaignResult stop(TenantId tenant);

    // Optional event bus for push-style progress (set before start_dispatcher)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    size_t queued_tasks() const { return queue_.size(); }

    // Tasks discarded because their campaign was stopped, finished or replaced
    uint64_t dropped_tasks() const { return dropped_.load(); }

    // Tasks that went through a delivery attempt
    uint64_t dispatched_tasks() const { return dispatched_.load(); }

private:
    void run();

    // Returns false when the task was dropped without a send attempt.
    bool process(const CampaignTask& task);

    void record_outcome(const CampaignTask& task, const SendResult& result);

    // Sleep up to `delay`, returning early on shutdown.
    void throttle(std::chrono::seconds delay);

    GatewayDirectory& gateways_;
    DeliveryRecorder& recorder_;
    EngineOptions options_;
    EventBus* event_bus_ = nullptr;

    TaskQueue<CampaignTask> queue_;

    mutable std::mutex status_mutex_;
    std::unordered_map<TenantId, CampaignStatus> statuses_;
    uint64_t next_generation_ = 0;

    std::thread worker_;
    std::atomic<bool> worker_running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex throttle_mutex_;
    std::condition_variable throttle_cv_;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> dispatched_{0};
};

} // namespace wacast
