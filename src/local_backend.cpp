#include "mediasync/errors.hpp"
#include "mediasync/log.hpp"
#include "mediasync/storage_backend.hpp"
#include "backends.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <nlohmann/json.hpp>
#include <random>
#include <string_view>

namespace mediasync {

namespace fs = std::filesystem;

namespace {

constexpr size_t CHUNK_SIZE = 64 * 1024;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// True if `p` is `root` or lies beneath it (both already canonical)
bool is_within(const fs::path& root, const fs::path& p) {
    auto diverge = std::mismatch(root.begin(), root.end(), p.begin(), p.end());
    return diverge.first == root.end();
}

TimePoint to_system(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

// Replace characters that are invalid in file names on common filesystems
std::string sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || std::string_view("<>:\"/\\|?*").find(c) != std::string_view::npos) {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    // Leading dots would hide the file from listings
    auto first = out.find_first_not_of(". ");
    out = (first == std::string::npos) ? std::string() : out.substr(first);
    return out;
}

class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(fs::path default_path)
        : default_path_(std::move(default_path)) {
        set_root(default_path_.empty() ? fs::path("photos") : default_path_);
    }

    BackendKind kind() const override { return BackendKind::Local; }
    std::string type_name() const override { return "local"; }

    void initialize(int64_t provider_id,
                    const std::string& display_name,
                    const std::string& config_json) override {
        provider_id_ = provider_id;
        display_name_ = display_name;

        fs::path base = default_path_.empty() ? fs::path("photos") : default_path_;
        organize_by_date_ = true;

        if (!config_json.empty()) {
            auto j = nlohmann::json::parse(config_json, nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                log_warn("Provider %ld: malformed local configuration, using defaults",
                         static_cast<long>(provider_id));
            } else {
                try {
                    auto path = j.value("base_path", std::string());
                    if (!path.empty()) base = path;
                    organize_by_date_ = j.value("organize_by_date", true);
                } catch (const nlohmann::json::exception& e) {
                    log_warn("Provider %ld: invalid local configuration (%s), using defaults",
                             static_cast<long>(provider_id), e.what());
                    base = default_path_.empty() ? fs::path("photos") : default_path_;
                    organize_by_date_ = true;
                }
            }
        }
        set_root(base);
    }

    std::vector<FileDescriptor> list_files(const ListOptions& options,
                                           std::stop_token stop) override {
        std::vector<FileDescriptor> files;

        fs::path dir = root_;
        if (options.folder_id && !options.folder_id->empty()) {
            try {
                dir = resolve(*options.folder_id);
            } catch (const AccessDeniedError&) {
                log_warn("Rejected listing outside storage root: %s", options.folder_id->c_str());
                return files;
            }
        }

        std::error_code ec;
        if (!fs::is_directory(dir, ec)) return files;

        auto visit = [&](const fs::directory_entry& entry) {
            if (stop.stop_requested()) throw OperationCancelled();
            if (!entry.is_regular_file()) return;
            auto name = entry.path().filename().string();
            if (name.starts_with(".")) return;
            auto ext = lower(entry.path().extension().string());
            auto media = media_kind_for_extension(ext);
            if (!media) return;
            files.push_back(describe(entry, *media, ext));
        };

        if (options.recursive) {
            auto it = fs::recursive_directory_iterator(
                dir, fs::directory_options::skip_permission_denied);
            for (; it != fs::recursive_directory_iterator(); ++it) {
                if (it->is_directory() && it->path().filename().string().starts_with(".")) {
                    it.disable_recursion_pending();  // .thumbnails and friends
                    continue;
                }
                visit(*it);
            }
        } else {
            for (auto& entry : fs::directory_iterator(
                     dir, fs::directory_options::skip_permission_denied)) {
                visit(entry);
            }
        }
        if (stop.stop_requested()) throw OperationCancelled();
        return files;
    }

    UploadResult upload(const std::string& file_name,
                        std::istream& data,
                        const std::string& content_type,
                        std::stop_token stop) override {
        UploadResult result;

        // Traversal and absolute names are rejected before taking the leaf
        validate_relative(file_name);

        auto leaf = fs::path(normalize_separators(file_name)).filename();
        auto ext = lower(leaf.extension().string());
        if (!media_kind_for_extension(ext)) {
            result.error_message = "Unsupported file type: " + (ext.empty() ? file_name : ext);
            return result;
        }

        auto safe = sanitize_filename(leaf.string());
        if (safe.empty() || safe == ext) safe = "upload" + ext;

        fs::path rel_dir;
        if (organize_by_date_) {
            std::time_t t = std::time(nullptr);
            std::tm tm{};
            gmtime_r(&t, &tm);
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04d/%02d", tm.tm_year + 1900, tm.tm_mon + 1);
            rel_dir = buf;
        }

        auto dir = root_ / rel_dir;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            result.error_message = "Failed to create directory: " + ec.message();
            return result;
        }

        auto target = unique_path(dir, safe);

        // Write to temp file then rename (atomic)
        auto temp_path = target;
        temp_path += ".tmp." + std::to_string(temp_counter_.fetch_add(1));
        uint64_t written = 0;
        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                result.error_message = "Failed to create file";
                return result;
            }
            std::vector<char> buf(CHUNK_SIZE);
            while (data) {
                if (stop.stop_requested()) {
                    file.close();
                    fs::remove(temp_path, ec);
                    throw OperationCancelled();
                }
                data.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                auto n = data.gcount();
                if (n <= 0) continue;
                file.write(buf.data(), n);
                written += static_cast<uint64_t>(n);
            }
            if (!file || data.bad()) {
                file.close();
                fs::remove(temp_path, ec);
                result.error_message = "Failed to write data";
                return result;
            }
        }

        fs::rename(temp_path, target, ec);
        if (ec) {
            std::error_code rm_ec;
            fs::remove(temp_path, rm_ec);
            result.error_message = "Failed to rename file: " + ec.message();
            return result;
        }

        result.success = true;
        result.file_id = fs::relative(target, root_).generic_string();
        result.file_name = target.filename().string();
        result.file_path = target.string();
        result.file_size = written;
        result.content_type = content_type.empty() ? content_type_for_extension(ext) : content_type;
        log_debug("Uploaded %s (%lu bytes)", result.file_id.c_str(),
                  static_cast<unsigned long>(written));
        return result;
    }

    std::vector<uint8_t> download(const std::string& file_id, std::stop_token stop) override {
        if (stop.stop_requested()) throw OperationCancelled();
        auto path = resolve(file_id);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw NotFoundError("File not found: " + file_id);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw NotFoundError("File not found: " + file_id);
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::runtime_error("Failed to read file: " + file_id);
        }
        return data;
    }

    std::unique_ptr<std::istream> open_read_stream(const std::string& file_id,
                                                   std::stop_token stop) override {
        if (stop.stop_requested()) throw OperationCancelled();
        auto path = resolve(file_id);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw NotFoundError("File not found: " + file_id);
        }
        auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!*stream) {
            throw NotFoundError("File not found: " + file_id);
        }
        return stream;
    }

    bool delete_file(const std::string& file_id, std::stop_token stop) override {
        if (stop.stop_requested()) throw OperationCancelled();
        auto path = resolve(file_id);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) return false;
        bool removed = fs::remove(path, ec);
        if (ec) {
            throw std::runtime_error("Failed to delete " + file_id + ": " + ec.message());
        }
        return removed;
    }

    bool file_exists(const std::string& file_id, std::stop_token stop) override {
        (void)stop;
        auto path = resolve(file_id);
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    bool test_connection(std::stop_token stop) override {
        if (stop.stop_requested()) return false;

        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) {
            log_warn("Local storage %s unavailable: %s", root_.c_str(), ec.message().c_str());
            return false;
        }

        std::random_device rd;
        auto marker = root_ / (".mediasync-test-" + std::to_string(rd()));
        {
            std::ofstream file(marker, std::ios::binary);
            if (!file) {
                log_warn("Local storage %s is not writable", root_.c_str());
                return false;
            }
            file << "test";
            if (!file) {
                file.close();
                fs::remove(marker, ec);
                return false;
            }
        }

        std::string content;
        {
            std::ifstream file(marker, std::ios::binary);
            std::getline(file, content);
        }
        fs::remove(marker, ec);
        return content == "test" && !ec;
    }

    bool supports_upload() const override { return true; }
    bool supports_watch() const override { return true; }

private:
    void set_root(const fs::path& base) {
        std::error_code ec;
        root_ = fs::absolute(base, ec).lexically_normal();
        if (ec) root_ = base.lexically_normal();
        // A trailing separator leaves an empty last component; drop it
        if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
            root_ = root_.parent_path();
        }
    }

    static std::string normalize_separators(const std::string& id) {
        std::string out = id;
        std::replace(out.begin(), out.end(), '\\', '/');
        return out;
    }

    // Rejects absolute ids (any separator style, drive letters) and '..' segments
    static void validate_relative(const std::string& id) {
        auto norm = normalize_separators(id);
        bool absolute = !norm.empty() && norm[0] == '/';
        bool drive = norm.size() >= 2 && std::isalpha(static_cast<unsigned char>(norm[0])) &&
                     norm[1] == ':';
        if (absolute || drive) {
            throw AccessDeniedError("Access denied: absolute path outside storage root: " + id);
        }

        size_t start = 0;
        while (start <= norm.size()) {
            auto end = norm.find('/', start);
            if (end == std::string::npos) end = norm.size();
            if (norm.compare(start, end - start, "..") == 0 && end - start == 2) {
                throw AccessDeniedError("Access denied: path traversal outside storage root: " + id);
            }
            start = end + 1;
        }
    }

    // Map a file id to a path inside root_, enforcing the sandbox
    fs::path resolve(const std::string& file_id) const {
        if (file_id.empty()) {
            throw NotFoundError("File not found: empty id");
        }
        validate_relative(file_id);

        auto result = (root_ / normalize_separators(file_id)).lexically_normal();

        // Symlinks can still point outside; compare canonical forms
        std::error_code ec;
        auto canonical_root = fs::weakly_canonical(root_, ec);
        if (ec) canonical_root = root_;
        auto canonical_result = fs::weakly_canonical(result, ec);
        if (ec) canonical_result = result;
        if (!is_within(canonical_root, canonical_result)) {
            throw AccessDeniedError("Access denied: path resolves outside storage root: " + file_id);
        }
        return result;
    }

    FileDescriptor describe(const fs::directory_entry& entry, MediaKind media,
                            const std::string& ext) const {
        FileDescriptor fd;
        auto rel = fs::relative(entry.path(), root_);
        fd.file_id = rel.generic_string();
        fd.name = entry.path().filename().string();
        fd.full_path = entry.path().string();
        std::error_code ec;
        fd.size = entry.file_size(ec);
        fd.media_kind = media;
        fd.content_type = content_type_for_extension(ext);
        auto parent = rel.parent_path().generic_string();
        if (!parent.empty()) fd.parent_folder_id = parent;
        auto mtime = entry.last_write_time(ec);
        if (!ec) {
            fd.modified = to_system(mtime);
            fd.created = fd.modified;
        }
        return fd;
    }

    static fs::path unique_path(const fs::path& dir, const std::string& name) {
        auto candidate = dir / name;
        std::error_code ec;
        if (!fs::exists(candidate, ec)) return candidate;

        auto stem = fs::path(name).stem().string();
        auto ext = fs::path(name).extension().string();
        for (int i = 1;; ++i) {
            candidate = dir / (stem + "_" + std::to_string(i) + ext);
            if (!fs::exists(candidate, ec)) return candidate;
        }
    }

    fs::path default_path_;
    fs::path root_;
    bool organize_by_date_ = true;
    std::atomic<uint64_t> temp_counter_{0};
};

}  // namespace

namespace detail {

std::unique_ptr<StorageBackend> make_local_backend(const BackendDependencies& deps) {
    return std::make_unique<LocalStorageBackend>(deps.default_local_path);
}

}  // namespace detail

}  // namespace mediasync
