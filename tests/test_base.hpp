#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a private scratch directory
 */
class TempDirTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("announcer_test_" + std::to_string(getpid()) + "_" + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::string path(const std::string &name) const
    {
        return (test_dir_ / name).string();
    }

    void writeFile(const std::string &name, const std::string &content) const
    {
        std::ofstream out(path(name), std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string readFile(const std::string &name) const
    {
        std::ifstream in(path(name), std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    bool exists(const std::string &name) const
    {
        return std::filesystem::exists(path(name));
    }

    // A complete configuration document; schedule and templates are raw lines
    static std::string configDocument(const std::string &schedule_lines,
                                      const std::string &template_lines = "hour = It's {time}.\n",
                                      const std::string &voice = "en-US-AriaNeural")
    {
        return "[credentials]\n"
               "server = db.local\n"
               "database = tickets\n"
               "username = announcer\n"
               "password = secret\n"
               "\n[schedule]\n" +
               schedule_lines +
               "\n[templates]\n" + template_lines +
               "\n[voice]\n"
               "voice_id = " +
               voice + "\n";
    }

    std::filesystem::path test_dir_;
};
