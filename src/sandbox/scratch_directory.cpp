/**
 * @file scratch_directory.cpp
 * @brief ScratchDirectory implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/scratch_directory.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <utility>
#include <vector>

namespace codelab {

Result<ScratchDirectory> ScratchDirectory::create(const std::filesystem::path& parent,
                                                  const std::string& prefix) {
    std::error_code ec;
    auto base = parent.empty() ? std::filesystem::temp_directory_path(ec) : parent;
    if (ec) {
        return Error{ErrorCode::Io, "no temp directory: " + ec.message()};
    }
    std::filesystem::create_directories(base, ec);
    if (ec) {
        return Error{ErrorCode::Io, "cannot create " + base.string() + ": " + ec.message()};
    }

    auto pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        return Error{ErrorCode::Io, "mkdtemp failed in " + base.string() + ": "
                                    + std::strerror(errno)};
    }
    return ScratchDirectory(std::filesystem::path(buf.data()));
}

ScratchDirectory::ScratchDirectory(std::filesystem::path path) noexcept
    : path_(std::move(path)) {}

ScratchDirectory::~ScratchDirectory() {
    remove();
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

ScratchDirectory& ScratchDirectory::operator=(ScratchDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

void ScratchDirectory::remove() noexcept {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    path_.clear();
}

}  // namespace codelab
