#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <fstream>
#include <system_error>
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory and default configuration
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("uniqcast_" + std::string(info->test_suite_name()) + "_" + info->name());
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        std::filesystem::create_directories(test_dir_);

        PocoConfigManager::getInstance().resetToDefaults();
        Logger::setLevel("WARN");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        if (ec)
        {
            Logger::warn("Failed to remove test directory " + test_dir_.string() + ": " + ec.message());
        }
    }

    // Helper to create a file under the test directory
    std::string createDummyFile(const std::string &filename, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_dir_ / filename;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    std::string getTestDir() const { return test_dir_.string(); }

    std::string pathInTestDir(const std::string &name) const { return (test_dir_ / name).string(); }

private:
    std::filesystem::path test_dir_;
};
