#include "core/file_walker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

FileWalker::FileWalker(const std::string &root_path, MediaClassifier classifier)
    : root_path_(root_path), classifier_(std::move(classifier))
{
    std::error_code ec;
    fs::path root = fs::canonical(fs::path(root_path), ec);
    if (ec)
    {
        recordFailure(root_path, ec.message());
        return;
    }

    visited_dirs_.insert(root.string());
    pending_dirs_.push_back(root);
}

std::optional<DiscoveredFile> FileWalker::next()
{
    while (pending_files_.empty())
    {
        if (pending_dirs_.empty())
        {
            return std::nullopt;
        }

        fs::path dir = std::move(pending_dirs_.back());
        pending_dirs_.pop_back();
        readDirectory(dir);
    }

    DiscoveredFile file = std::move(pending_files_.front());
    pending_files_.pop_front();
    ++files_emitted_;
    return file;
}

void FileWalker::readDirectory(const fs::path &dir)
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        recordFailure(dir, ec.message());
        return;
    }
    ++directories_visited_;

    std::vector<fs::directory_entry> entries;
    const fs::directory_iterator end;
    while (it != end)
    {
        entries.push_back(*it);
        it.increment(ec);
        if (ec)
        {
            // Keep what was listed before the error
            recordFailure(dir, ec.message());
            break;
        }
    }

    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry &a, const fs::directory_entry &b)
              { return a.path().filename().string() < b.path().filename().string(); });

    std::vector<fs::path> subdirs;
    for (const auto &entry : entries)
    {
        std::error_code status_ec;
        fs::file_status status = entry.status(status_ec);
        if (status_ec)
        {
            Logger::debug("Skipping unresolvable entry " + entry.path().string() + ": " + status_ec.message());
            continue;
        }

        if (!fs::is_directory(status) && !fs::is_regular_file(status))
        {
            Logger::trace("Skipping special file: " + entry.path().string());
            continue;
        }

        std::error_code canonical_ec;
        fs::path real = fs::canonical(entry.path(), canonical_ec);
        if (canonical_ec)
        {
            Logger::debug("Skipping entry with no canonical path " + entry.path().string() + ": " + canonical_ec.message());
            continue;
        }

        if (fs::is_directory(status))
        {
            if (visited_dirs_.insert(real.string()).second)
            {
                subdirs.push_back(real);
            }
            else
            {
                Logger::debug("Directory already visited, not entering again: " + entry.path().string());
            }
            continue;
        }

        std::string real_path = real.string();
        MediaType type = classifier_.classifyPath(real_path);
        pending_files_.push_back(DiscoveredFile{std::move(real_path), type});
    }

    // Stack order: the first subdirectory by name is walked first
    for (auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit)
    {
        pending_dirs_.push_back(*rit);
    }
}

void FileWalker::recordFailure(const fs::path &path, const std::string &reason)
{
    Logger::warn("Cannot read directory " + path.string() + ": " + reason);
    failures_.push_back(WalkFailure{path.string(), reason});
}

FileWalker::RootStatus FileWalker::checkRoot(const std::string &root_path)
{
    if (root_path.empty())
    {
        return RootStatus::NOT_FOUND;
    }

    std::error_code ec;
    fs::file_status status = fs::status(fs::path(root_path), ec);
    if (status.type() == fs::file_type::not_found)
    {
        return RootStatus::NOT_FOUND;
    }
    if (ec)
    {
        return ec == std::errc::permission_denied ? RootStatus::PERMISSION_DENIED : RootStatus::NOT_FOUND;
    }
    if (!fs::is_directory(status))
    {
        return RootStatus::NOT_A_DIRECTORY;
    }

    fs::directory_iterator listing(fs::path(root_path), ec);
    if (ec)
    {
        return ec == std::errc::permission_denied ? RootStatus::PERMISSION_DENIED : RootStatus::NOT_FOUND;
    }
    return RootStatus::OK;
}

std::string FileWalker::rootStatusToString(RootStatus status)
{
    switch (status)
    {
    case RootStatus::OK:
        return "OK";
    case RootStatus::NOT_FOUND:
        return "path not found";
    case RootStatus::NOT_A_DIRECTORY:
        return "not a directory";
    case RootStatus::PERMISSION_DENIED:
        return "permission denied";
    default:
        return "unknown";
    }
}
