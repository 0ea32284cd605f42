/// @file test_config.cpp
/// @brief Unit tests for starlane::core::EngineConfig and ConfigLoader.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace starlane;
using namespace starlane::core;

int main(int argc, char** argv)
{
    starlane::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    starlane::core::Logger::shutdown();
    return result;
}

class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& filename, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempConfigFile()
    {
        std::filesystem::remove(m_path);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempConfigFile(const TempConfigFile&) = delete;
    TempConfigFile& operator=(const TempConfigFile&) = delete;

private:
    std::filesystem::path m_path;
};

// =================================================================
// Defaults
// =================================================================

TEST_CASE("Default config is valid")
{
    const EngineConfig config;
    CHECK_FALSE(config.validate().has_value());
    CHECK(config.max_spatial_neighbors == 12);
    CHECK(config.heat_calibration_constant == doctest::Approx(1e-7));
    CHECK(config.heat_critical_threshold == doctest::Approx(150.0));
    CHECK(config.heat_overheated_threshold == doctest::Approx(90.0));
    CHECK(config.heat_nominal_threshold == doctest::Approx(30.0));
    CHECK(config.fuel_quality == doctest::Approx(10.0));
    CHECK(config.compression_level == 6);
    CHECK(config.log_level == spdlog::level::info);
    CHECK(config.log_file.empty());
}

TEST_CASE("validate() names the first bad field")
{
    EngineConfig config;

    SUBCASE("zero neighbours")
    {
        config.max_spatial_neighbors = 0;
        REQUIRE(config.validate().has_value());
        CHECK(config.validate()->find("max_spatial_neighbors") != std::string::npos);
    }

    SUBCASE("threshold ordering")
    {
        config.heat_overheated_threshold = 200.0;
        REQUIRE(config.validate().has_value());
        CHECK(config.validate()->find("thresholds") != std::string::npos);
    }

    SUBCASE("fuel quality out of range")
    {
        config.fuel_quality = 0.5;
        CHECK(config.validate().has_value());
    }

    SUBCASE("non-positive calibration")
    {
        config.heat_calibration_constant = 0.0;
        CHECK(config.validate().has_value());
    }
}

// =================================================================
// Parsing
// =================================================================

TEST_CASE("parse() reads key = value lines with comments")
{
    const EngineConfig config = ConfigLoader::parse(
        "# routing\n"
        "max_spatial_neighbors = 8\n"
        "\n"
        "heat_calibration_constant = 2e-7   # tuned\n"
        "fuel_quality=15\n"
        "compression_level = 9\n"
        "log_level = debug\n"
        "log_file = /tmp/starlane.log\n");

    CHECK(config.max_spatial_neighbors == 8);
    CHECK(config.heat_calibration_constant == doctest::Approx(2e-7));
    CHECK(config.fuel_quality == doctest::Approx(15.0));
    CHECK(config.compression_level == 9);
    CHECK(config.log_level == spdlog::level::debug);
    CHECK(config.log_file == "/tmp/starlane.log");
}

TEST_CASE("parse() clamps out-of-range values")
{
    const EngineConfig config = ConfigLoader::parse(
        "max_spatial_neighbors = 0\n"
        "fuel_quality = 250\n"
        "compression_level = 12\n");

    CHECK(config.max_spatial_neighbors == 1);
    CHECK(config.fuel_quality == doctest::Approx(100.0));
    CHECK(config.compression_level == 9);
    CHECK_FALSE(config.validate().has_value());
}

TEST_CASE("parse() keeps defaults for unknown keys and bad values")
{
    const EngineConfig config = ConfigLoader::parse(
        "no_such_key = 1\n"
        "max_spatial_neighbors = twelve\n"
        "heat_calibration_constant = -1\n"
        "log_level = loud\n"
        "this line has no equals sign\n");

    const EngineConfig defaults;
    CHECK(config.max_spatial_neighbors == defaults.max_spatial_neighbors);
    CHECK(config.heat_calibration_constant == doctest::Approx(defaults.heat_calibration_constant));
    CHECK(config.log_level == defaults.log_level);
}

TEST_CASE("parse_level() accepts the spdlog level names")
{
    CHECK(ConfigLoader::parse_level("trace") == spdlog::level::trace);
    CHECK(ConfigLoader::parse_level("warn") == spdlog::level::warn);
    CHECK(ConfigLoader::parse_level("error") == spdlog::level::err);
    CHECK(ConfigLoader::parse_level("off") == spdlog::level::off);
    CHECK_FALSE(ConfigLoader::parse_level("verbose").has_value());
}

// =================================================================
// Files
// =================================================================

TEST_CASE("load_file() reads a config from disk")
{
    const TempConfigFile file("test_starlane.conf",
        "max_spatial_neighbors = 4\n"
        "heat_critical_threshold = 160\n");

    const auto config = ConfigLoader::load_file(file.path());
    REQUIRE(config.has_value());
    CHECK(config->max_spatial_neighbors == 4);
    CHECK(config->heat_critical_threshold == doctest::Approx(160.0));
}

TEST_CASE("load_file() returns nullopt for a missing file")
{
    const auto config = ConfigLoader::load_file("/nonexistent/path/starlane.conf");
    CHECK_FALSE(config.has_value());
}
