#pragma once

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory tree and database
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        static std::atomic<int> counter{0};
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();

        std::string name = std::string("gallery_indexer_") + info->test_suite_name() + "_" + info->name() + "_" +
                           std::to_string(getpid()) + "_" + std::to_string(counter++);
        std::filesystem::path base = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(base);
        std::filesystem::create_directories(base / "files");

        // Canonical so walker output can be compared with paths built here
        work_dir_ = std::filesystem::canonical(base);
        test_files_dir_ = work_dir_ / "files";
        test_db_path_ = (work_dir_ / "test_database.db").string();

        Logger::debug("TestBase SetUp completed for test: " + std::string(info->name()));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::permissions(work_dir_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(work_dir_, ec);
        if (ec)
        {
            Logger::warn("Could not remove " + work_dir_.string() + ": " + ec.message());
        }
    }

    // Create a file (and its parent directories) under the files directory
    std::string createFile(const std::string &relative_path, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_files_dir_ / relative_path;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    std::string createDir(const std::string &relative_path)
    {
        std::filesystem::path dir = test_files_dir_ / relative_path;
        std::filesystem::create_directories(dir);
        return dir.string();
    }

    std::string filePath(const std::string &relative_path) const
    {
        return (test_files_dir_ / relative_path).string();
    }

    std::string getTestDbPath() const { return test_db_path_; }
    std::string getTestFilesDir() const { return test_files_dir_.string(); }
    const std::filesystem::path &workDir() const { return work_dir_; }

    static bool runningAsRoot() { return geteuid() == 0; }

    // Poll until pred holds or timeout expires
    template <typename Pred>
    static bool waitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred())
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

private:
    std::filesystem::path work_dir_;
    std::filesystem::path test_files_dir_;
    std::string test_db_path_;
};
