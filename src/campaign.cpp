#include "campaign.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <iostream>

namespace wacast {

const char* campaign_error_to_string(CampaignError error) {
    switch (error) {
        case CampaignError::None: return "none";
        case CampaignError::InvalidCampaignRequest: return "invalid_campaign_request";
        case CampaignError::NoActiveCampaign: return "no_active_campaign";
    }
    return "none";
}

EngineOptions EngineOptions::from_config(const Config& config) {
    EngineOptions opts;
    opts.poll_interval = std::chrono::milliseconds(config.campaign.poll_interval_ms);
    opts.media_gap = std::chrono::milliseconds(config.gateway.media_gap_ms);
    return opts;
}

CampaignEngine::CampaignEngine(GatewayDirectory& gateways, DeliveryRecorder& recorder,
                               EngineOptions options)
    : gateways_(gateways), recorder_(recorder), options_(options)
{}

CampaignEngine::~CampaignEngine() {
    shutdown();
}

void CampaignEngine::start_dispatcher() {
    if (worker_running_.load()) return;
    stop_requested_.store(false);
    worker_running_.store(true);
    worker_ = std::thread([this]() { run(); });
}

void CampaignEngine::shutdown() {
    if (!worker_running_.load()) return;
    {
        std::lock_guard<std::mutex> lock(throttle_mutex_);
        stop_requested_.store(true);
    }
    throttle_cv_.notify_all();
    queue_.wake();
    if (worker_.joinable()) worker_.join();
    worker_running_.store(false);
}

// ── Control operations ────────────────────────────────────────

CampaignResult CampaignEngine::start(TenantId tenant,
                                     const std::vector<Contact>& contacts,
                                     const std::string& message_template,
                                     uint32_t delay_seconds,
                                     std::vector<MediaPayload> media) {
    if (contacts.empty()) {
        return {false, "", "No contacts provided", CampaignError::InvalidCampaignRequest};
    }
    if (message_template.empty() && media.empty()) {
        return {false, "", "Either message or media files are required",
                CampaignError::InvalidCampaignRequest};
    }
    for (size_t i = 0; i < contacts.size(); i++) {
        if (contacts[i].phone.empty()) {
            return {false, "", "Contact " + std::to_string(i + 1) + " has no phone number",
                    CampaignError::InvalidCampaignRequest};
        }
    }

    auto shared_media = std::make_shared<const std::vector<MediaPayload>>(std::move(media));
    size_t media_count = shared_media->size();

    CampaignStatus status;
    status.state = CampaignState::Running;
    status.total = static_cast<uint32_t>(contacts.size());
    status.delay_seconds = delay_seconds;
    status.media_count = media_count;
    status.started_at = std::chrono::steady_clock::now();
    status.started_epoch = epoch_seconds();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status.generation = ++next_generation_;
        statuses_[tenant] = status;
    }

    std::vector<CampaignTask> tasks;
    tasks.reserve(contacts.size());
    for (const auto& contact : contacts) {
        CampaignTask task;
        task.tenant_id = tenant;
        task.generation = status.generation;
        task.recipient = contact.phone;
        if (!message_template.empty()) {
            task.rendered_message = personalize(message_template, contact);
        }
        task.media = shared_media;
        task.delay_seconds = delay_seconds;
        tasks.push_back(std::move(task));
    }

    std::cerr << "[campaign] Tenant " << tenant << ": campaign #" << status.generation
              << " started, " << contacts.size() << " recipients, delay "
              << delay_seconds << "s\n";

    if (event_bus_) {
        CampaignStartedEvent ev;
        ev.tenant_id = tenant;
        ev.generation = status.generation;
        ev.total = status.total;
        event_bus_->publish(ev);
    }
    queue_.push_all(tasks.begin(), tasks.end());

    std::string media_info = media_count > 0
        ? " with " + std::to_string(media_count) + " media files" : "";
    return {true,
            "Campaign started! " + std::to_string(contacts.size()) + " messages" +
                media_info + " queued for processing.",
            "", CampaignError::None};
}

ProgressView CampaignEngine::progress(TenantId tenant) const {
    CampaignStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        auto it = statuses_.find(tenant);
        if (it == statuses_.end()) return ProgressView{};
        snapshot = it->second;
    }
    return make_progress_view(snapshot, std::chrono::steady_clock::now());
}

CampaignResult CampaignEngine::stop(TenantId tenant) {
    CampaignStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        auto it = statuses_.find(tenant);
        if (it == statuses_.end() || it->second.state != CampaignState::Running) {
            return {false, "", "No active campaign found", CampaignError::NoActiveCampaign};
        }
        it->second.state = CampaignState::Stopped;
        snapshot = it->second;
    }

    std::cerr << "[campaign] Tenant " << tenant << ": campaign #" << snapshot.generation
              << " stopped at " << snapshot.processed << "/" << snapshot.total << "\n";

    if (event_bus_) {
        CampaignFinishedEvent ev;
        ev.tenant_id = tenant;
        ev.status = snapshot;
        event_bus_->publish(ev);
    }
    return {true, "Campaign stopped", "", CampaignError::None};
}

// ── Dispatcher ────────────────────────────────────────────────

void CampaignEngine::run() {
    while (!stop_requested_.load()) {
        auto task = queue_.pop_for(options_.poll_interval);
        if (!task) continue;

        bool attempted = false;
        try {
            attempted = process(*task);
        } catch (const std::exception& e) {
            std::cerr << "[campaign] Dispatcher error on " << task->recipient
                      << ": " << e.what() << "\n";
        }

        if (attempted && task->delay_seconds > 0) {
            throttle(std::chrono::seconds(task->delay_seconds));
        }
    }
}

bool CampaignEngine::process(const CampaignTask& task) {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        auto it = statuses_.find(task.tenant_id);
        if (it == statuses_.end() ||
            it->second.generation != task.generation ||
            it->second.state != CampaignState::Running) {
            dropped_.fetch_add(1);
            std::cerr << "[campaign] Skipping " << task.recipient << ": campaign #"
                      << task.generation << " is no longer running\n";
            return false;
        }
    }

    // Outbound call runs without the status lock.
    SendResult result;
    try {
        auto gateway = gateways_.gateway_for(task.tenant_id);
        if (!gateway) {
            result = {false, "", "No WhatsApp connection configured for tenant"};
        } else {
            static const std::vector<MediaPayload> kNoMedia;
            result = deliver(*gateway, task.recipient, task.rendered_message,
                             task.media ? *task.media : kNoMedia, options_.media_gap);
        }
    } catch (const std::exception& e) {
        result = {false, "", std::string("Worker error: ") + e.what()};
    }
    dispatched_.fetch_add(1);

    if (!result.success) {
        std::cerr << "[campaign] Failed to send message to " << task.recipient
                  << ": " << (result.error.empty() ? "Unknown error" : result.error) << "\n";
    }

    record_outcome(task, result);
    return true;
}

void CampaignEngine::record_outcome(const CampaignTask& task, const SendResult& result) {
    CampaignStatus snapshot;
    bool counted = false;
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        auto it = statuses_.find(task.tenant_id);
        // A restart while this task was in flight moved tracking on; the
        // result belongs to no live campaign.
        if (it != statuses_.end() && it->second.generation == task.generation) {
            auto& st = it->second;
            if (result.success) st.sent++;
            else st.failed++;
            st.processed++;
            if (st.processed >= st.total && st.state == CampaignState::Running) {
                st.state = CampaignState::Completed;
                finished = true;
            }
            snapshot = st;
            counted = true;
        }
    }

    const char* status = result.success ? contact_status::Sent : contact_status::Failed;
    std::string summary = task.rendered_message;
    if (task.media_count() > 0) {
        summary = "[Media: " + std::to_string(task.media_count()) + " files] " + summary;
    }

    try {
        recorder_.append_message(task.tenant_id, task.recipient, summary, status,
                                 epoch_seconds());
    } catch (const std::exception& e) {
        std::cerr << "[campaign] Error logging message: " << e.what() << "\n";
    }

    if (result.success) {
        try {
            recorder_.set_contact_status(task.tenant_id, task.recipient, contact_status::Sent);
        } catch (const std::exception& e) {
            std::cerr << "[campaign] Error updating contact status: " << e.what() << "\n";
        }
    }

    if (finished) {
        std::cerr << "[campaign] Tenant " << task.tenant_id << ": campaign #"
                  << snapshot.generation << " completed, " << snapshot.sent << " sent, "
                  << snapshot.failed << " failed\n";
    }

    if (event_bus_ && counted) {
        CampaignProgressEvent ev;
        ev.tenant_id = task.tenant_id;
        ev.recipient = task.recipient;
        ev.delivered = result.success;
        ev.status = snapshot;
        event_bus_->publish(ev);

        if (finished) {
            CampaignFinishedEvent done;
            done.tenant_id = task.tenant_id;
            done.status = snapshot;
            event_bus_->publish(done);
        }
    }
}

void CampaignEngine::throttle(std::chrono::seconds delay) {
    std::unique_lock<std::mutex> lock(throttle_mutex_);
    throttle_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

} // namespace wacast
