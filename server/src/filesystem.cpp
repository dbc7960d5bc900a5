#include "ferry/server/filesystem.hpp"

#include <algorithm>
#include <utility>

namespace ferry::server
{

    FilesystemError::FilesystemError(ferry::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {

        bool is_within(const std::filesystem::path &base, const std::filesystem::path &path)
        {
            const auto mismatch = std::mismatch(base.begin(), base.end(), path.begin(), path.end());
            return mismatch.first == base.end();
        }

    } // namespace

    Filesystem::Filesystem(std::filesystem::path root)
    {
        std::filesystem::create_directories(root);
        base_ = std::filesystem::canonical(root);
    }

    std::filesystem::path Filesystem::resolve(const std::string &requested) const
    {
        const auto path = sanitize(requested);
        if (!std::filesystem::exists(path))
        {
            throw FilesystemError(ferry::ErrorCode::NotFound, "Path does not exist: " + requested);
        }
        return path;
    }

    std::filesystem::path Filesystem::resolve_for_new_entry(const std::string &requested) const
    {
        return sanitize(requested);
    }

    std::string Filesystem::relative_to_root(const std::filesystem::path &path) const
    {
        auto rel = path.lexically_relative(base_).generic_string();
        if (rel.empty())
        {
            return ".";
        }
        return rel;
    }

    std::filesystem::path Filesystem::sanitize(const std::string &requested) const
    {
        std::filesystem::path relative = requested;
        if (!requested.empty() && relative.is_absolute())
        {
            relative = relative.lexically_relative("/");
        }

        std::filesystem::path sanitized = base_;
        for (const auto &part : relative)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == ".")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FilesystemError(ferry::ErrorCode::PermissionDenied, "Path traversal detected: " + requested);
            }
            sanitized /= part;
        }

        // Symlinks inside the root must not lead out of it.
        std::error_code ec;
        const auto resolved = std::filesystem::weakly_canonical(sanitized, ec);
        if (ec || !is_within(base_, resolved))
        {
            throw FilesystemError(ferry::ErrorCode::PermissionDenied, "Path escapes the served root: " + requested);
        }
        return resolved;
    }

} // namespace ferry::server
