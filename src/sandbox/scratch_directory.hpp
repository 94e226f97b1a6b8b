/**
 * @file scratch_directory.hpp
 * @brief Per-request temporary workspace, removed on every exit path.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string>

namespace codelab {

/**
 * @brief Uniquely named directory owned for the lifetime of one run.
 *
 * Created with mkdtemp; the destructor removes the tree. Move-only.
 */
class ScratchDirectory {
public:
    /// Create `<parent>/<prefix>XXXXXX`. An empty parent means the system temp dir.
    static Result<ScratchDirectory> create(const std::filesystem::path& parent,
                                           const std::string& prefix = "codelab_");

    ~ScratchDirectory();

    ScratchDirectory(ScratchDirectory&& other) noexcept;
    ScratchDirectory& operator=(ScratchDirectory&& other) noexcept;

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit ScratchDirectory(std::filesystem::path path) noexcept;
    void remove() noexcept;

    std::filesystem::path path_;
};

}  // namespace codelab
