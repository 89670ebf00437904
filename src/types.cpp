#include "mediasync/types.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace mediasync {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct ExtensionInfo {
    MediaKind kind;
    const char* content_type;
};

const std::unordered_map<std::string, ExtensionInfo>& extension_table() {
    static const std::unordered_map<std::string, ExtensionInfo> table = {
        {".jpg",  {MediaKind::Photo, "image/jpeg"}},
        {".jpeg", {MediaKind::Photo, "image/jpeg"}},
        {".png",  {MediaKind::Photo, "image/png"}},
        {".gif",  {MediaKind::Photo, "image/gif"}},
        {".webp", {MediaKind::Photo, "image/webp"}},
        {".bmp",  {MediaKind::Photo, "image/bmp"}},
        {".tif",  {MediaKind::Photo, "image/tiff"}},
        {".tiff", {MediaKind::Photo, "image/tiff"}},
        {".heic", {MediaKind::Photo, "image/heic"}},
        {".heif", {MediaKind::Photo, "image/heif"}},
        {".mp4",  {MediaKind::Video, "video/mp4"}},
        {".m4v",  {MediaKind::Video, "video/x-m4v"}},
        {".mov",  {MediaKind::Video, "video/quicktime"}},
        {".avi",  {MediaKind::Video, "video/x-msvideo"}},
        {".mkv",  {MediaKind::Video, "video/x-matroska"}},
        {".webm", {MediaKind::Video, "video/webm"}},
        {".3gp",  {MediaKind::Video, "video/3gpp"}},
    };
    return table;
}

}  // namespace

const char* backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::Local: return "local";
        case BackendKind::GooglePhotos: return "google-photos";
        case BackendKind::GoogleDrive: return "google-drive";
        case BackendKind::OneDrive: return "onedrive";
    }
    return "unknown";
}

const char* media_kind_name(MediaKind kind) {
    switch (kind) {
        case MediaKind::Photo: return "photo";
        case MediaKind::Video: return "video";
    }
    return "unknown";
}

const char* sync_error_kind_name(SyncErrorKind kind) {
    switch (kind) {
        case SyncErrorKind::None: return "none";
        case SyncErrorKind::NotFound: return "not-found";
        case SyncErrorKind::AlreadyRunning: return "already-running";
        case SyncErrorKind::Cancelled: return "cancelled";
        case SyncErrorKind::BackendError: return "backend-error";
    }
    return "unknown";
}

std::optional<BackendKind> parse_backend_kind(const std::string& name) {
    auto n = lower(name);
    if (n == "local") return BackendKind::Local;
    if (n == "google-photos" || n == "googlephotos") return BackendKind::GooglePhotos;
    if (n == "google-drive" || n == "googledrive") return BackendKind::GoogleDrive;
    if (n == "onedrive") return BackendKind::OneDrive;
    return std::nullopt;
}

std::optional<MediaKind> media_kind_for_extension(const std::string& ext) {
    auto& table = extension_table();
    auto it = table.find(lower(ext));
    if (it == table.end()) return std::nullopt;
    return it->second.kind;
}

std::string content_type_for_extension(const std::string& ext) {
    auto& table = extension_table();
    auto it = table.find(lower(ext));
    if (it == table.end()) return "application/octet-stream";
    return it->second.content_type;
}

}  // namespace mediasync
