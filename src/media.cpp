#include "media.hpp"
#include "util.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace wacast {

const char* media_kind_to_string(MediaKind kind) {
    switch (kind) {
        case MediaKind::Image: return "image";
        case MediaKind::Video: return "video";
        case MediaKind::Unknown: break;
    }
    return "unknown";
}

static std::string extension_of(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 == filename.size()) return {};
    return to_lower(filename.substr(dot + 1));
}

MediaKind media_kind_from_filename(const std::string& filename) {
    static const std::vector<std::string> kImage = {"png", "jpg", "jpeg", "gif", "webp"};
    static const std::vector<std::string> kVideo = {"mp4", "avi", "mov", "wmv", "flv", "webm"};

    std::string ext = extension_of(filename);
    if (std::find(kImage.begin(), kImage.end(), ext) != kImage.end()) return MediaKind::Image;
    if (std::find(kVideo.begin(), kVideo.end(), ext) != kVideo.end()) return MediaKind::Video;
    return MediaKind::Unknown;
}

bool make_media_payload(const std::string& filename,
                        const std::string& bytes,
                        const MediaConfig& limits,
                        MediaPayload& out,
                        std::string& error) {
    if (filename.empty()) {
        error = "No filename provided";
        return false;
    }
    if (filename.find("..") != std::string::npos ||
        filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos) {
        error = filename + ": Invalid filename";
        return false;
    }

    std::string ext = extension_of(filename);
    const auto& allowed = limits.allowed_extensions;
    if (ext.empty() || std::find(allowed.begin(), allowed.end(), ext) == allowed.end()) {
        error = filename + ": Invalid file type";
        return false;
    }

    MediaKind kind = media_kind_from_filename(filename);
    if (kind == MediaKind::Unknown) {
        error = filename + ": Unsupported media type (use image or video)";
        return false;
    }

    if (bytes.empty()) {
        error = filename + ": File is empty";
        return false;
    }

    uint64_t max_size = kind == MediaKind::Image ? limits.max_image_size
                                                 : limits.max_video_size;
    if (bytes.size() > max_size) {
        error = filename + ": File too large. Maximum size: " +
                std::to_string(max_size / (1024 * 1024)) + "MB";
        return false;
    }

    out.filename = filename;
    out.kind = kind;
    out.size = bytes.size();
    out.base64 = base64_encode(bytes);
    return true;
}

static bool inside_directory(const std::filesystem::path& file,
                             const std::filesystem::path& dir) {
    auto f = file.begin();
    for (auto d = dir.begin(); d != dir.end(); ++d, ++f) {
        if (d->empty()) continue; // trailing separator
        if (f == file.end() || *f != *d) return false;
    }
    return f != file.end();
}

bool load_media_file(const std::string& path,
                     const MediaConfig& limits,
                     MediaPayload& out,
                     std::string& error) {
    namespace fs = std::filesystem;
    if (path.empty()) {
        error = "Media path is empty";
        return false;
    }
    if (limits.upload_dir.empty()) {
        error = "Media upload directory is not configured";
        return false;
    }

    std::error_code ec;
    fs::path root = fs::weakly_canonical(expand_home(limits.upload_dir), ec);
    if (ec) {
        error = "Invalid media upload directory: " + limits.upload_dir;
        return false;
    }
    fs::path requested(path);
    if (requested.is_relative()) requested = root / requested;
    fs::path resolved = fs::weakly_canonical(requested, ec);
    if (ec || !inside_directory(resolved, root)) {
        error = "Media path outside upload directory: " + path;
        return false;
    }

    std::ifstream in(resolved, std::ios::binary);
    if (!in.is_open()) {
        error = "Cannot open media file: " + path;
        return false;
    }
    std::string bytes((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
    if (in.bad()) {
        error = "Failed to read media file: " + path;
        return false;
    }

    std::string filename = resolved.filename().string();
    return make_media_payload(filename, bytes, limits, out, error);
}

} // namespace wacast
