#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace wacast {

enum class CampaignState { None, Running, Stopped, Completed };

const char* campaign_state_to_string(CampaignState state);

// Per-tenant tracking record. Invariants: processed == sent + failed,
// processed <= total.
struct CampaignStatus {
    CampaignState state = CampaignState::None;
    uint64_t generation = 0;   // bumps on every start for the tenant
    uint32_t total = 0;
    uint32_t processed = 0;
    uint32_t sent = 0;
    uint32_t failed = 0;
    uint32_t delay_seconds = 0;
    size_t media_count = 0;
    std::chrono::steady_clock::time_point started_at{};
    uint64_t started_epoch = 0;
};

// Snapshot returned to callers, with derived fields.
struct ProgressView {
    CampaignStatus status;
    double percentage = 0.0; // one decimal
    uint64_t eta_seconds = 0;
};

// Percentage is processed/total*100 rounded to one decimal (0 for an empty
// campaign). Halves round to even, as does the ETA. ETA is only estimated
// while running with at least one task done.
ProgressView make_progress_view(const CampaignStatus& status,
                                std::chrono::steady_clock::time_point now);

// Wall time and throughput of a finished run, e.g. "ran 2m05s, 4.8 msg/min".
std::string run_summary(const CampaignStatus& status,
                        std::chrono::steady_clock::time_point finished_at);

} // namespace wacast
