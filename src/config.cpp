#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace wacast {

nlohmann::json Config::defaults_json() {
    return {
        {"gateway", {
            {"api_url", "http://localhost:8340"},
            {"global_key", ""},
            {"text_timeout", 30},
            {"media_timeout", 60},
            {"status_timeout", 5},
            {"media_gap_ms", 1000}
        }},
        {"campaign", {
            {"default_delay", 2},
            {"max_delay", 3600},
            {"poll_interval_ms", 1000},
            {"max_template_length", 4096}
        }},
        {"storage", {
            {"path", ""}
        }},
        {"server", {
            {"listen", "127.0.0.1:8090"},
            {"max_body", 1048576}
        }},
        {"media", {
            {"upload_dir", "~/.wacast/uploads"},
            {"max_image_size", 10 * 1024 * 1024},
            {"max_video_size", 50 * 1024 * 1024},
            {"allowed_extensions", {"png", "jpg", "jpeg", "gif", "webp",
                                    "mp4", "avi", "mov", "wmv", "flv", "webm"}}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    return load_from(expand_home("~/.wacast/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " ("
                      << e.what() << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("gateway") && j["gateway"].is_object()) {
        auto& g = j["gateway"];
        if (g.contains("api_url") && g["api_url"].is_string())
            cfg.gateway.api_url = g["api_url"].get<std::string>();
        if (g.contains("global_key") && g["global_key"].is_string())
            cfg.gateway.global_key = g["global_key"].get<std::string>();
        if (g.contains("text_timeout") && g["text_timeout"].is_number_unsigned())
            cfg.gateway.text_timeout = g["text_timeout"].get<uint32_t>();
        if (g.contains("media_timeout") && g["media_timeout"].is_number_unsigned())
            cfg.gateway.media_timeout = g["media_timeout"].get<uint32_t>();
        if (g.contains("status_timeout") && g["status_timeout"].is_number_unsigned())
            cfg.gateway.status_timeout = g["status_timeout"].get<uint32_t>();
        if (g.contains("media_gap_ms") && g["media_gap_ms"].is_number_unsigned())
            cfg.gateway.media_gap_ms = g["media_gap_ms"].get<uint32_t>();
    }

    if (j.contains("campaign") && j["campaign"].is_object()) {
        auto& c = j["campaign"];
        if (c.contains("default_delay") && c["default_delay"].is_number_unsigned())
            cfg.campaign.default_delay = c["default_delay"].get<uint32_t>();
        if (c.contains("max_delay") && c["max_delay"].is_number_unsigned())
            cfg.campaign.max_delay = c["max_delay"].get<uint32_t>();
        if (c.contains("poll_interval_ms") && c["poll_interval_ms"].is_number_unsigned())
            cfg.campaign.poll_interval_ms = c["poll_interval_ms"].get<uint32_t>();
        if (c.contains("max_template_length") && c["max_template_length"].is_number_unsigned())
            cfg.campaign.max_template_length = c["max_template_length"].get<uint32_t>();
    }

    if (j.contains("storage") && j["storage"].is_object()) {
        auto& s = j["storage"];
        if (s.contains("path") && s["path"].is_string())
            cfg.storage.path = s["path"].get<std::string>();
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("listen") && s["listen"].is_string())
            cfg.server.listen = s["listen"].get<std::string>();
        if (s.contains("max_body") && s["max_body"].is_number_unsigned())
            cfg.server.max_body = s["max_body"].get<uint32_t>();
    }

    if (j.contains("media") && j["media"].is_object()) {
        auto& m = j["media"];
        if (m.contains("upload_dir") && m["upload_dir"].is_string())
            cfg.media.upload_dir = m["upload_dir"].get<std::string>();
        if (m.contains("max_image_size") && m["max_image_size"].is_number_unsigned())
            cfg.media.max_image_size = m["max_image_size"].get<uint64_t>();
        if (m.contains("max_video_size") && m["max_video_size"].is_number_unsigned())
            cfg.media.max_video_size = m["max_video_size"].get<uint64_t>();
        if (m.contains("allowed_extensions") && m["allowed_extensions"].is_array()) {
            cfg.media.allowed_extensions.clear();
            for (const auto& ext : m["allowed_extensions"])
                if (ext.is_string())
                    cfg.media.allowed_extensions.push_back(to_lower(ext.get<std::string>()));
        }
    }

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("EVOLUTION_API_URL"))
        gateway.api_url = v;
    if (const char* v = std::getenv("EVOLUTION_GLOBAL_KEY"))
        gateway.global_key = v;
    if (const char* v = std::getenv("WACAST_DB_PATH"))
        storage.path = v;
    if (const char* v = std::getenv("WACAST_LISTEN"))
        server.listen = v;
}

std::string Config::storage_path() const {
    if (!storage.path.empty()) return expand_home(storage.path);
    return expand_home("~/.wacast/wacast.db");
}

} // namespace wacast
