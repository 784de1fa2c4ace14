#include "campaign_status.hpp"
#include <cmath>
#include <cstdio>

namespace wacast {

const char* campaign_state_to_string(CampaignState state) {
    switch (state) {
        case CampaignState::None: return "none";
        case CampaignState::Running: return "running";
        case CampaignState::Stopped: return "stopped";
        case CampaignState::Completed: return "completed";
    }
    return "none";
}

ProgressView make_progress_view(const CampaignStatus& status,
                                std::chrono::steady_clock::time_point now) {
    ProgressView view;
    view.status = status;

    if (status.total > 0) {
        double pct = static_cast<double>(status.processed) * 100.0 / status.total;
        view.percentage = std::nearbyint(pct * 10.0) / 10.0;
    }

    if (status.state == CampaignState::Running && status.processed > 0) {
        double elapsed = std::chrono::duration<double>(now - status.started_at).count();
        if (elapsed > 0.0) {
            double rate = status.processed / elapsed;
            double remaining = (status.total - status.processed) / rate;
            view.eta_seconds = static_cast<uint64_t>(std::llrint(remaining));
        }
    }
    return view;
}

std::string run_summary(const CampaignStatus& status,
                        std::chrono::steady_clock::time_point finished_at) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        finished_at - status.started_at).count();
    if (elapsed < 0) elapsed = 0;

    char buf[96];
    long long minutes = elapsed / 60;
    long long seconds = elapsed % 60;
    int n = minutes > 0
        ? std::snprintf(buf, sizeof(buf), "ran %lldm%02llds", minutes, seconds)
        : std::snprintf(buf, sizeof(buf), "ran %llds", seconds);
    std::string out(buf, n > 0 ? static_cast<size_t>(n) : 0);

    if (elapsed > 0) {
        double per_minute = status.processed * 60.0 / static_cast<double>(elapsed);
        std::snprintf(buf, sizeof(buf), ", %.1f msg/min", per_minute);
        out += buf;
    }
    return out;
}

} // namespace wacast
