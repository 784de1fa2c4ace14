#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace wacast {

enum class MediaKind { Image, Video, Unknown };

const char* media_kind_to_string(MediaKind kind);

// Classify by file extension (case-insensitive).
MediaKind media_kind_from_filename(const std::string& filename);

// A ready-to-send attachment: base64 bytes plus kind. Shared read-only by
// every task of a campaign.
struct MediaPayload {
    std::string filename;
    std::string base64;
    MediaKind kind = MediaKind::Unknown;
    uint64_t size = 0; // raw byte count
};

// Validate an uploaded file (name, extension allow-list, per-kind size
// limit) and encode it. Returns false and sets error on rejection.
bool make_media_payload(const std::string& filename,
                        const std::string& bytes,
                        const MediaConfig& limits,
                        MediaPayload& out,
                        std::string& error);

// Read path from disk and delegate to make_media_payload. Relative paths are
// taken from limits.upload_dir; anything resolving outside it is rejected.
bool load_media_file(const std::string& path,
                     const MediaConfig& limits,
                     MediaPayload& out,
                     std::string& error);

} // namespace wacast
