#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace wallspan::core {

// Strips one pair of surrounding quotes, expands a leading '~' and makes the
// path absolute.
std::filesystem::path resolve_user_path(const std::string& raw);

bool is_archive_source(const std::filesystem::path& path);

// The ordered list of image files drawn from by the selector. Entries are
// removed as they are used and the list is rebuilt from the source arguments
// (image files, image directories and tar archives) by reload().
class CandidatePool {
public:
    CandidatePool(std::vector<std::string> sources, bool recursive);
    ~CandidatePool();

    CandidatePool(const CandidatePool&) = delete;
    CandidatePool& operator=(const CandidatePool&) = delete;

    // Fails only when a source argument is unusable (missing path, archive
    // that cannot be extracted). An empty result is not an error.
    bool reload(std::string& error);

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const std::string& at(size_t index) const { return entries_.at(index); }

    void remove_at(size_t index);

private:
    bool append_source(const std::string& source, std::vector<std::string>& out, std::string& error);
    bool extract_archive(const std::filesystem::path& archive_path,
                         std::filesystem::path& out_dir,
                         std::string& error);

    std::vector<std::string> sources_;
    bool recursive_;
    std::vector<std::string> entries_;
    std::vector<std::filesystem::path> extraction_dirs_;
};

} // namespace wallspan::core
