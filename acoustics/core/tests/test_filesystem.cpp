#include <catch2/catch_test_macros.hpp>
#include <acoustics/core/filesystem.hpp>
#include <filesystem>

using namespace acoustics::core;

TEST_CASE("FileSystem text files", "[core][filesystem]") {
    auto dir = std::filesystem::temp_directory_path() / "acoustics_filesystem_test";
    std::filesystem::remove_all(dir);
    std::string path = (dir / "a" / "b" / "scene.phononscene").string();

    REQUIRE_FALSE(FileSystem::exists(path));
    REQUIRE(FileSystem::read_text(path).empty());

    REQUIRE(FileSystem::write_text(path, "{}"));
    REQUIRE(FileSystem::exists(path));
    REQUIRE(FileSystem::read_text(path) == "{}");

    SECTION("Directories are not files") {
        REQUIRE_FALSE(FileSystem::exists(dir.string()));
        REQUIRE_FALSE(FileSystem::exists(""));
    }

    std::filesystem::remove_all(dir);
}
