#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediasync {

using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;

// Backend kind discriminator stored with every provider record.
// Values are persisted; do not renumber.
enum class BackendKind {
    Local = 0,
    GooglePhotos = 1,  // RemotePicker
    GoogleDrive = 2,
    OneDrive = 3,
};

enum class MediaKind {
    Photo = 0,
    Video = 1,
};

const char* backend_kind_name(BackendKind kind);
const char* media_kind_name(MediaKind kind);

// Returns nullopt for names that don't map to a known kind.
std::optional<BackendKind> parse_backend_kind(const std::string& name);

struct ProviderRecord {
    int64_t id = 0;
    BackendKind kind = BackendKind::Local;
    std::string name;
    bool enabled = true;
    std::string configuration;  // opaque JSON blob, interpreted by the backend
    std::optional<TimePoint> last_sync;
};

struct CatalogItem {
    int64_t id = 0;
    std::optional<int64_t> provider_id;  // null: provider removed, file retained
    std::string provider_file_id;
    std::string filename;
    std::string file_path;  // local path or origin reference
    uint64_t size = 0;
    MediaKind media_kind = MediaKind::Photo;
    int width = 0;
    int height = 0;
    std::optional<TimePoint> date_taken;
    TimePoint first_seen;
    TimePoint updated_at;
};

struct FileDescriptor {
    std::string file_id;
    std::string name;
    std::string full_path;
    uint64_t size = 0;
    MediaKind media_kind = MediaKind::Photo;
    std::string content_type;
    std::optional<std::string> parent_folder_id;
    bool is_folder = false;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<TimePoint> created;
    std::optional<TimePoint> modified;
};

struct ListOptions {
    std::optional<std::string> folder_id;
    bool recursive = true;
};

struct UploadResult {
    bool success = false;
    std::string file_id;
    std::string file_name;
    std::string file_path;
    uint64_t file_size = 0;
    std::string content_type;
    std::string error_message;
};

// --- Sync request/response shapes ---

struct SyncRequest {
    bool full_sync = false;
    bool remove_deleted = true;
    bool skip_existing = true;
    int max_files = 0;  // 0 = unlimited
    std::optional<std::string> folder_id;
    bool recursive = true;
};

enum class SyncErrorKind {
    None,
    NotFound,
    AlreadyRunning,
    Cancelled,
    BackendError,
};

const char* sync_error_kind_name(SyncErrorKind kind);

struct SyncResult {
    bool success = false;
    SyncErrorKind error_kind = SyncErrorKind::None;
    int64_t provider_id = 0;
    std::string provider_name;
    int files_added = 0;
    int files_updated = 0;
    int files_removed = 0;
    int files_skipped = 0;
    int total_files_found = 0;
    int total_files_processed = 0;
    TimePoint start_time;
    std::chrono::milliseconds duration{0};
    std::string error_message;
    std::vector<std::string> errors;  // per-file problems that did not fail the run
};

struct SyncStatus {
    int64_t provider_id = 0;
    bool is_in_progress = false;
    int progress_percent = 0;
    std::string current_operation;
    int files_processed = 0;
    int total_files = 0;
    std::optional<TimePoint> start_time;
    std::optional<SyncResult> last_result;
};

struct ScanResult {
    int64_t provider_id = 0;
    bool success = false;
    int total_files_found = 0;
    int new_files_count = 0;
    int existing_files_count = 0;
    uint64_t new_files_total_size = 0;
    std::vector<FileDescriptor> sample_new_files;
    std::string error_message;
};

// Media extension helpers shared by backends and the cache
std::optional<MediaKind> media_kind_for_extension(const std::string& ext);
std::string content_type_for_extension(const std::string& ext);

}  // namespace mediasync
