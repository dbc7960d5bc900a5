#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "ferry/error_codes.hpp"

namespace ferry::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(ferry::ErrorCode code, std::string message);

        ferry::ErrorCode code() const noexcept { return code_; }

    private:
        ferry::ErrorCode code_;
    };

    // Resolves client supplied paths inside the served root.
    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return base_; }

        // The path must exist.
        std::filesystem::path resolve(const std::string &requested) const;

        std::filesystem::path resolve_for_new_entry(const std::string &requested) const;

        // Generic form of path relative to the root, "." for the root itself.
        std::string relative_to_root(const std::filesystem::path &path) const;

    private:
        std::filesystem::path base_;

        std::filesystem::path sanitize(const std::string &requested) const;
    };

} // namespace ferry::server
