/// @file test_starmap_loader.cpp
/// @brief Unit tests for starlane::starmap::StarmapLoader.
///
/// Verifies CSV parsing of systems and gates, missing coordinates and
/// temperatures, and error handling for malformed or missing files.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "starmap/starmap_loader.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace starlane;
using namespace starlane::starmap;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    starlane::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    starlane::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helper: create a temporary CSV file for testing
// =================================================================

class TempCsvFile
{
public:
    explicit TempCsvFile(const std::string& filename, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempCsvFile()
    {
        std::filesystem::remove(m_path);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempCsvFile(const TempCsvFile&) = delete;
    TempCsvFile& operator=(const TempCsvFile&) = delete;

private:
    std::filesystem::path m_path;
};

static const std::string kSystemsHeader = "id,name,x,y,z,temperature,region\n";
static const std::string kGatesHeader = "from,to\n";

// =================================================================
// Well-formed fixtures
// =================================================================

TEST_CASE("Load systems and gates")
{
    const TempCsvFile systems("test_sl_systems.csv",
        kSystemsHeader +
        "30000142,Jita,-129.06,60.75,117.84,24.5,The Forge\n"
        "30002187,Amarr,-80.12,48.11,-2.67,,Domain\n"
        "30002659,Dodixie,45.0,12.3,-88.1,31.0\n");
    const TempCsvFile gates("test_sl_gates.csv",
        kGatesHeader +
        "30000142,30002187\n"
        "30002187,30002659\n");

    const auto loaded = StarmapLoader::load_csv(systems.path(), gates.path());
    REQUIRE(loaded.has_value());
    const auto& set = **loaded;

    CHECK(set.size() == 3);
    CHECK(set.gate_link_count() == 2);

    const Point* jita = set.find(30000142);
    REQUIRE(jita != nullptr);
    CHECK(jita->name == "Jita");
    REQUIRE(jita->position.has_value());
    CHECK(jita->position->x == doctest::Approx(-129.06));
    CHECK(jita->position->y == doctest::Approx(60.75));
    CHECK(jita->position->z == doctest::Approx(117.84));
    REQUIRE(jita->metadata.temperature.has_value());
    CHECK(*jita->metadata.temperature == doctest::Approx(24.5));
    REQUIRE(jita->metadata.region_name.has_value());
    CHECK(*jita->metadata.region_name == "The Forge");

    const Point* amarr = set.find(30002187);
    REQUIRE(amarr != nullptr);
    CHECK_FALSE(amarr->metadata.temperature.has_value());

    const Point* dodixie = set.find(30002659);
    REQUIRE(dodixie != nullptr);
    CHECK_FALSE(dodixie->metadata.region_name.has_value());
    CHECK(set.gates(30002187).size() == 2);
}

TEST_CASE("Systems without coordinates load without a position")
{
    const TempCsvFile systems("test_sl_nopos.csv",
        kSystemsHeader +
        "1,Known,0,0,0,,\n"
        "2,Unknown,,,,,\n");
    const TempCsvFile gates("test_sl_nopos_gates.csv", kGatesHeader + "1,2\n");

    const auto loaded = StarmapLoader::load_csv(systems.path(), gates.path());
    REQUIRE(loaded.has_value());
    CHECK((*loaded)->position_of(1).has_value());
    CHECK_FALSE((*loaded)->position_of(2).has_value());
    CHECK((*loaded)->gate_link_count() == 1);
}

TEST_CASE("Header-only gates file yields no links")
{
    const TempCsvFile systems("test_sl_solo.csv", kSystemsHeader + "1,Solo,0,0,0,,\n");
    const TempCsvFile gates("test_sl_solo_gates.csv", kGatesHeader);

    const auto loaded = StarmapLoader::load_csv(systems.path(), gates.path());
    REQUIRE(loaded.has_value());
    CHECK((*loaded)->size() == 1);
    CHECK((*loaded)->gate_link_count() == 0);
}

// =================================================================
// Malformed input
// =================================================================

TEST_CASE("Malformed system lines are skipped")
{
    const TempCsvFile systems("test_sl_bad.csv",
        kSystemsHeader +
        "1,Good,1.0,2.0,3.0,10,\n"
        "2,ShortLine,1.0\n"
        "x,BadId,0,0,0,,\n"
        "3,BadCoord,abc,0,0,,\n"
        "4,PartialCoord,1.0,,2.0,,\n"
        "5,BadTemp,0,0,0,hot,\n"
        "1,DuplicateId,0,0,0,,\n"
        "6,,0,0,0,,\n"
        "\n"
        "7,AlsoGood,4.0,5.0,6.0,,\n");
    const TempCsvFile gates("test_sl_bad_gates.csv",
        kGatesHeader +
        "1,7\n"
        "1\n"
        "a,b\n"
        "7,99\n");

    const auto loaded = StarmapLoader::load_csv(systems.path(), gates.path());
    REQUIRE(loaded.has_value());
    const auto& set = **loaded;

    CHECK(set.size() == 2);
    CHECK(set.name_of(1) == "Good");
    CHECK(set.name_of(7) == "AlsoGood");
    CHECK(set.gate_link_count() == 1);
}

TEST_CASE("Loader diagnostics go to the core logger")
{
    auto core_capture = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
    auto app_capture = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
    auto& core_sinks = core::Logger::get_core_logger()->sinks();
    auto& app_sinks = core::Logger::get_app_logger()->sinks();
    core_sinks.push_back(core_capture);
    app_sinks.push_back(app_capture);

    {
        const TempCsvFile systems("test_sl_log.csv", kSystemsHeader + "1,Good,0,0,0,,\n" + "2,ShortLine\n");
        const TempCsvFile gates("test_sl_log_gates.csv", kGatesHeader);
        CHECK(StarmapLoader::load_csv(systems.path(), gates.path()).has_value());
    }

    core_sinks.pop_back();
    app_sinks.pop_back();

    const std::vector<std::string> core_lines = core_capture->last_formatted();
    CHECK(std::any_of(core_lines.begin(), core_lines.end(), [](const std::string& line)
    {
        return line.find("StarmapLoader: Malformed line") != std::string::npos;
    }));
    CHECK(app_capture->last_formatted().empty());
}

TEST_CASE("No valid systems is an error")
{
    const TempCsvFile systems("test_sl_empty.csv", kSystemsHeader + "bad,line\n");
    const TempCsvFile gates("test_sl_empty_gates.csv", kGatesHeader);

    CHECK_FALSE(StarmapLoader::load_csv(systems.path(), gates.path()).has_value());
}

TEST_CASE("Empty systems file is an error")
{
    const TempCsvFile systems("test_sl_blank.csv", "");
    const TempCsvFile gates("test_sl_blank_gates.csv", kGatesHeader);

    CHECK_FALSE(StarmapLoader::load_csv(systems.path(), gates.path()).has_value());
}

TEST_CASE("Missing files are an error")
{
    const TempCsvFile systems("test_sl_present.csv", kSystemsHeader + "1,A,0,0,0,,\n");

    CHECK_FALSE(StarmapLoader::load_csv("/nonexistent/systems.csv", systems.path()).has_value());
    CHECK_FALSE(StarmapLoader::load_csv(systems.path(), "/nonexistent/gates.csv").has_value());
}
