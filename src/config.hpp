#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

namespace wacast {

struct GatewayConfig {
    std::string api_url = "http://localhost:8340";
    std::string global_key;
    uint32_t text_timeout = 30;    // seconds
    uint32_t media_timeout = 60;   // seconds
    uint32_t status_timeout = 5;   // seconds; connection checks run on the API thread
    uint32_t media_gap_ms = 1000;  // pause between media items to one recipient
};

struct CampaignConfig {
    uint32_t default_delay = 2;        // seconds between sends
    uint32_t max_delay = 3600;         // largest delay a request may ask for
    uint32_t poll_interval_ms = 1000;  // dispatcher queue wait
    uint32_t max_template_length = 4096;
};

struct StorageConfig {
    std::string path; // empty = ~/.wacast/wacast.db
};

struct ServerConfig {
    std::string listen = "127.0.0.1:8090";
    uint32_t max_body = 1048576;
};

struct MediaConfig {
    std::string upload_dir = "~/.wacast/uploads"; // media paths must resolve inside
    uint64_t max_image_size = 10ull * 1024 * 1024;
    uint64_t max_video_size = 50ull * 1024 * 1024;
    std::vector<std::string> allowed_extensions = {
        "png", "jpg", "jpeg", "gif", "webp",
        "mp4", "avi", "mov", "wmv", "flv", "webm"
    };
};

struct Config {
    GatewayConfig gateway;
    CampaignConfig campaign;
    StorageConfig storage;
    ServerConfig server;
    MediaConfig media;

    // Load from ~/.wacast/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file is created with
    // defaults; a malformed one falls back to defaults.
    static Config load_from(const std::string& path);

    // Parse an already-merged JSON document (no file or env access)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Override fields from environment variables
    void apply_env();

    // Resolved database path (default under ~/.wacast)
    std::string storage_path() const;
};

// Recursively add keys present in defaults but missing from existing.
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace wacast
