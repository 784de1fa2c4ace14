#pragma once
#include "api_server.hpp"
#include "campaign.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "store.hpp"
#include <string>

namespace wacast {

// Routes control-API requests onto the campaign engine and the store.
// The caller's tenant comes from the X-Tenant-Id header, which the upstream
// web layer sets after authenticating the user.
class ControlApi {
public:
    ControlApi(CampaignEngine& engine, Store& store, GatewayDirectory& gateways,
               const Config& config);

    ApiResponse handle(const ApiRequest& request);

private:
    ApiResponse start_campaign(TenantId tenant, const ApiRequest& request);
    ApiResponse campaign_progress(TenantId tenant);
    ApiResponse stop_campaign(TenantId tenant);
    ApiResponse connection_status(TenantId tenant);
    ApiResponse recent_messages(TenantId tenant, const ApiRequest& request);
    ApiResponse send_message(TenantId tenant, const ApiRequest& request);
    ApiResponse dashboard_stats(TenantId tenant);

    CampaignEngine& engine_;
    Store& store_;
    GatewayDirectory& gateways_;
    const Config& config_;
};

// Parse a positive decimal tenant id. Returns false for empty, zero or
// non-numeric input.
bool parse_tenant_id(const std::string& value, TenantId& out);

} // namespace wacast
