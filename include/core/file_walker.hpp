#pragma once

#include "core/media_classifier.hpp"
#include "core/media_types.hpp"
#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief A file found by the walker. Unknown types are emitted too; the
 * consumer decides what to keep.
 */
struct DiscoveredFile
{
    std::string path; // Canonical absolute path
    MediaType type;
};

/**
 * @brief A directory the walker could not read
 */
struct WalkFailure
{
    std::string path;
    std::string reason;
};

/**
 * @brief Lazy depth-first traversal of a directory tree.
 *
 * Each call to next() reads at most one more directory. Entries are
 * visited in name order, every directory is entered at most once per
 * walk (symlink cycles terminate) and unreadable directories are
 * recorded in failures() without stopping the walk. A walker holds no
 * state shared with other walkers; walking again means constructing a
 * new one.
 */
class FileWalker
{
public:
    enum class RootStatus
    {
        OK,
        NOT_FOUND,
        NOT_A_DIRECTORY,
        PERMISSION_DENIED
    };

    FileWalker(const std::string &root_path, MediaClassifier classifier);

    /**
     * @brief Produce the next file of the walk
     * @return The file, or nullopt once the tree is exhausted
     */
    std::optional<DiscoveredFile> next();

    const std::vector<WalkFailure> &failures() const { return failures_; }
    size_t filesEmitted() const { return files_emitted_; }
    size_t directoriesVisited() const { return directories_visited_; }
    const std::string &rootPath() const { return root_path_; }

    /**
     * @brief Pre-flight check of a scan root, without walking it
     */
    static RootStatus checkRoot(const std::string &root_path);
    static std::string rootStatusToString(RootStatus status);

private:
    void readDirectory(const std::filesystem::path &dir);
    void recordFailure(const std::filesystem::path &path, const std::string &reason);

    std::string root_path_;
    MediaClassifier classifier_;

    std::vector<std::filesystem::path> pending_dirs_; // DFS stack, next directory at the back
    std::deque<DiscoveredFile> pending_files_;
    std::unordered_set<std::string> visited_dirs_;
    std::vector<WalkFailure> failures_;

    size_t files_emitted_ = 0;
    size_t directories_visited_ = 0;
};
