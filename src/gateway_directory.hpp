#pragma once
#include "config.hpp"
#include "gateway.hpp"
#include "store.hpp"

namespace wacast {

// Builds an EvolutionGateway per tenant from the tenants table. Tenants
// without an instance name resolve to nullptr.
class StoreGatewayDirectory : public GatewayDirectory {
public:
    StoreGatewayDirectory(Store& store, GatewayConfig config, HttpClient& http);

    std::unique_ptr<Gateway> gateway_for(TenantId tenant) override;

private:
    Store& store_;
    GatewayConfig config_;
    HttpClient& http_;
};

} // namespace wacast
