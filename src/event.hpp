#pragma once
#include "campaign_status.hpp"
#include <string>
#include <cstdint>

namespace wacast {

// Events are dispatched by tag string; no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* CampaignStarted  = "CampaignStarted";
    constexpr const char* CampaignProgress = "CampaignProgress";
    constexpr const char* CampaignFinished = "CampaignFinished";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct CampaignStartedEvent : Event {
    static constexpr const char* TAG = event_tags::CampaignStarted;
    uint64_t tenant_id = 0;
    uint64_t generation = 0;
    uint32_t total = 0;

    CampaignStartedEvent() { type_tag = TAG; }
};

// Published after every processed task with the post-update snapshot.
struct CampaignProgressEvent : Event {
    static constexpr const char* TAG = event_tags::CampaignProgress;
    uint64_t tenant_id = 0;
    std::string recipient;
    bool delivered = false;
    CampaignStatus status;

    CampaignProgressEvent() { type_tag = TAG; }
};

// Published once when a campaign reaches Completed or Stopped.
struct CampaignFinishedEvent : Event {
    static constexpr const char* TAG = event_tags::CampaignFinished;
    uint64_t tenant_id = 0;
    CampaignStatus status;

    CampaignFinishedEvent() { type_tag = TAG; }
};

} // namespace wacast
