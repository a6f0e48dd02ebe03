#include "candidate_pool.h"

#include "cli_parse.h"
#include "image_io.h"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <set>
#include <sstream>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

#include <archive.h>
#include <archive_entry.h>

namespace fs = std::filesystem;

namespace wallspan::core {

namespace {

constexpr size_t k_archive_block_size = 10240;

fs::path default_temp_dir() {
    std::error_code ec;
    fs::path path = fs::temp_directory_path(ec);
    if (!ec && !path.empty()) {
        return path;
    }

    const char* tmp = std::getenv("TMP");
    if (tmp != nullptr && *tmp != '\0') {
        return fs::path(tmp);
    }
    const char* temp = std::getenv("TEMP");
    if (temp != nullptr && *temp != '\0') {
        return fs::path(temp);
    }
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir != nullptr && *tmpdir != '\0') {
        return fs::path(tmpdir);
    }

    return fs::path("/tmp");
}

long current_process_id() {
#ifdef _WIN32
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(getpid());
#endif
}

std::string archive_message(struct archive* a) {
    const char* message = archive_error_string(a);
    return message != nullptr ? message : "unknown archive error";
}

fs::path build_extraction_dir(const fs::path& archive_path) {
    std::error_code ec;
    fs::path normalized = fs::absolute(archive_path, ec);
    std::string key = (!ec ? normalized.lexically_normal().string() : archive_path.string());
    size_t hash = std::hash<std::string>{}(key);

    // One cache per process so concurrent runs on the same archive stay apart.
    std::ostringstream name;
    name << "extract_" << current_process_id() << "_" << std::hex << hash;
    return default_temp_dir() / "wallspan" / name.str();
}

// Appends the image files of `dir` in name order, then (when recursive)
// those of its subdirectories, also in name order.
void collect_directory(const fs::path& dir,
                       bool recursive,
                       std::set<fs::path>& visited,
                       std::vector<std::string>& out) {
    std::error_code ec;
    fs::path canonical = fs::canonical(dir, ec);
    if (ec) {
        canonical = dir;
    }
    if (!visited.insert(canonical).second) {
        return;
    }

    std::vector<fs::path> files;
    std::vector<fs::path> subdirs;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return;
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::path& entry = it->path();
        std::error_code type_ec;
        if (fs::is_directory(entry, type_ec)) {
            subdirs.push_back(entry);
        } else if (!type_ec) {
            files.push_back(entry);
        }
    }
    std::sort(files.begin(), files.end());
    std::sort(subdirs.begin(), subdirs.end());

    for (const auto& file : files) {
        if (is_supported_image_extension(file)) {
            out.push_back(file.lexically_normal().string());
        }
    }
    if (!recursive) {
        return;
    }
    for (const auto& subdir : subdirs) {
        collect_directory(subdir, recursive, visited, out);
    }
}

} // namespace

fs::path resolve_user_path(const std::string& raw) {
    std::string path = raw;
    if (path.size() >= 2 && ((path.front() == '"' && path.back() == '"')
                             || (path.front() == '\'' && path.back() == '\''))) {
        path = path.substr(1, path.size() - 2);
    }
    if (!path.empty() && path.front() == '~' && (path.size() == 1 || path[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home != nullptr && home[0] != '\0') {
            path = std::string(home) + path.substr(1);
        }
    }
    std::error_code ec;
    fs::path resolved = fs::absolute(fs::path(path), ec);
    if (ec) {
        resolved = fs::path(path);
    }
    return resolved.lexically_normal();
}

bool is_archive_source(const fs::path& path) {
    const std::string filename = to_lower_copy(path.filename().string());
    auto ends_with = [&](const std::string& suffix) { return filename.ends_with(suffix); };
    return ends_with(".tar") || ends_with(".tar.gz") || ends_with(".tgz") ||
           ends_with(".tar.bz2") || ends_with(".tbz2") ||
           ends_with(".tar.xz") || ends_with(".txz");
}

CandidatePool::CandidatePool(std::vector<std::string> sources, bool recursive)
    : sources_(std::move(sources)), recursive_(recursive) {}

CandidatePool::~CandidatePool() {
    for (const auto& dir : extraction_dirs_) {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
}

bool CandidatePool::reload(std::string& error) {
    std::vector<std::string> reloaded;
    for (const auto& source : sources_) {
        if (!append_source(source, reloaded, error)) {
            return false;
        }
    }
    entries_ = std::move(reloaded);
    return true;
}

void CandidatePool::remove_at(size_t index) {
    if (index < entries_.size()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

bool CandidatePool::append_source(const std::string& source, std::vector<std::string>& out, std::string& error) {
    const fs::path path = resolve_user_path(source);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        error = "Path does not exist: " + path.string();
        return false;
    }

    std::set<fs::path> visited;
    if (fs::is_directory(path, ec)) {
        collect_directory(path, recursive_, visited, out);
        return true;
    }
    if (fs::is_regular_file(path, ec)) {
        if (is_archive_source(path)) {
            fs::path extracted;
            if (!extract_archive(path, extracted, error)) {
                return false;
            }
            collect_directory(extracted, true, visited, out);
        } else if (is_supported_image_extension(path)) {
            out.push_back(path.string());
        }
        return true;
    }
    if (is_supported_image_extension(path)) {
        error = "Not a file or a directory: " + path.string();
        return false;
    }
    return true;
}

bool CandidatePool::extract_archive(const fs::path& archive_path, fs::path& out_dir, std::string& error) {
    const fs::path output_dir = build_extraction_dir(archive_path);
    std::error_code ec;
    fs::remove_all(output_dir, ec);
    fs::create_directories(output_dir, ec);
    if (ec) {
        error = "Failed to create directory for archive extraction: " + output_dir.string();
        return false;
    }
    if (std::find(extraction_dirs_.begin(), extraction_dirs_.end(), output_dir) == extraction_dirs_.end()) {
        extraction_dirs_.push_back(output_dir);
    }

    struct archive* a = archive_read_new();
    if (!a) {
        error = "Failed to create archive reader";
        return false;
    }

    // Enable all supported formats and compression
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_filename(a, archive_path.string().c_str(), k_archive_block_size) != ARCHIVE_OK) {
        error = "Failed to open archive " + archive_path.string() + ": " + archive_message(a);
        archive_read_free(a);
        return false;
    }

    struct archive* ext = archive_write_disk_new();
    if (!ext) {
        error = "Failed to create archive writer";
        archive_read_free(a);
        return false;
    }

    archive_write_disk_set_options(ext, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT
                                            | ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    bool ok = true;
    struct archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_OK) {
            error = "Failed to read archive header: " + archive_message(a);
            ok = false;
            break;
        }

        if (archive_entry_filetype(entry) == AE_IFDIR) {
            continue;
        }

        const char* filename = archive_entry_pathname(entry);
        if (!filename) {
            continue;
        }

        // Keep the archive's directory structure below the extraction dir
        fs::path output_path = output_dir / fs::path(filename).relative_path();
        fs::create_directories(output_path.parent_path(), ec);
        archive_entry_set_pathname(entry, output_path.string().c_str());

        r = archive_write_header(ext, entry);
        if (r < ARCHIVE_OK) {
            std::cerr << "Warning: Skipping archive entry " << filename << ": " << archive_message(ext) << "\n";
        } else {
            const void* buff = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            while (archive_read_data_block(a, &buff, &size, &offset) == ARCHIVE_OK) {
                if (archive_write_data_block(ext, buff, size, offset) < ARCHIVE_OK) {
                    std::cerr << "Warning: Failed to write archive data: " << archive_message(ext) << "\n";
                    break;
                }
            }
        }

        if (archive_write_finish_entry(ext) < ARCHIVE_OK) {
            std::cerr << "Warning: Failed to finish archive entry: " << archive_message(ext) << "\n";
        }
    }

    archive_read_close(a);
    archive_read_free(a);
    archive_write_close(ext);
    archive_write_free(ext);

    if (ok) {
        out_dir = output_dir;
    }
    return ok;
}

} // namespace wallspan::core
