#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"

using namespace zero::core;

TEST(Dotenv, ParsesKeyValueLines) {
    auto entry = config::parse_dotenv_line("ZERO_LOG_LEVEL=debug");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->first, "ZERO_LOG_LEVEL");
    EXPECT_EQ(entry->second, "debug");

    auto quoted = config::parse_dotenv_line("  ZERO_LOG_FILE = \"/tmp/zero log.txt\"  ");
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(quoted->first, "ZERO_LOG_FILE");
    EXPECT_EQ(quoted->second, "/tmp/zero log.txt");

    EXPECT_EQ(config::parse_dotenv_line("EMPTY=")->second, "");
}

TEST(Dotenv, SkipsCommentsAndJunk) {
    EXPECT_FALSE(config::parse_dotenv_line("").has_value());
    EXPECT_FALSE(config::parse_dotenv_line("   ").has_value());
    EXPECT_FALSE(config::parse_dotenv_line("# ZERO_MAX_CAPS=4").has_value());
    EXPECT_FALSE(config::parse_dotenv_line("no equals sign").has_value());
    EXPECT_FALSE(config::parse_dotenv_line("=value").has_value());
}

TEST(Env, FallbackWhenUnset) {
    unsetenv("ZERO_CORE_TEST_UNSET");
    EXPECT_EQ(config::get_env("ZERO_CORE_TEST_UNSET"), "");
    EXPECT_EQ(config::get_env_or("ZERO_CORE_TEST_UNSET", "dflt"), "dflt");

    setenv("ZERO_CORE_TEST_SET", "x", 1);
    EXPECT_EQ(config::get_env_or("ZERO_CORE_TEST_SET", "dflt"), "x");
    unsetenv("ZERO_CORE_TEST_SET");
}

TEST(JsonFile, LoadsAndReportsThePath) {
    auto path = std::filesystem::temp_directory_path() / "zero_core_test.json";
    {
        std::ofstream out(path);
        out << R"({"steps": [1, 2]})";
    }
    EXPECT_EQ(config::load_json_file(path)["steps"].size(), 2u);

    {
        std::ofstream out(path);
        out << "{not json";
    }
    try {
        config::load_json_file(path);
        FAIL() << "expected a parse failure";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
    std::filesystem::remove(path);

    EXPECT_THROW(config::load_json_file("/nonexistent/zero_core_test.json"), std::runtime_error);
}

TEST(Logger, LevelNames) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_EQ(parse_log_level("chatty"), spdlog::level::info);
}

TEST(Paths, FindsFilesUnderTheWorkingDirectory) {
    auto roots = paths::search_roots();
    ASSERT_FALSE(roots.empty());
    EXPECT_EQ(roots.front(), std::filesystem::current_path());

    std::string name = "zero_core_test_marker.txt";
    std::ofstream(std::filesystem::current_path() / name) << "x";
    auto found = paths::find_relative(name);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename().string(), name);
    std::filesystem::remove(std::filesystem::current_path() / name);

    EXPECT_FALSE(paths::find_relative("zero_core_test_no_such_file").has_value());
}
