#include "gateway_directory.hpp"

namespace wacast {

StoreGatewayDirectory::StoreGatewayDirectory(Store& store, GatewayConfig config,
                                             HttpClient& http)
    : store_(store), config_(std::move(config)), http_(http)
{}

std::unique_ptr<Gateway> StoreGatewayDirectory::gateway_for(TenantId tenant) {
    auto rec = store_.tenant(tenant);
    if (!rec || rec->instance_name.empty()) return nullptr;

    EvolutionInstance instance;
    instance.api_url = config_.api_url;
    instance.instance_name = rec->instance_name;
    instance.api_key = rec->api_key.empty() ? config_.global_key : rec->api_key;
    instance.text_timeout = config_.text_timeout;
    instance.media_timeout = config_.media_timeout;
    instance.status_timeout = config_.status_timeout;
    return std::make_unique<EvolutionGateway>(std::move(instance), http_);
}

} // namespace wacast
