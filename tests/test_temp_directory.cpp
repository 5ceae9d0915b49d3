#include "catch2_custom.hpp"

#include "fakes.hpp"

#include <examforge/common/temp_directory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <utility>

using namespace examforge;
namespace fs = std::filesystem;

TEST_CASE("Temporary directories are unique and removed on destruction") {
    fs::path kept;

    {
        TempDirectory first{"examforge_test_tmp_"};
        TempDirectory second{"examforge_test_tmp_"};

        REQUIRE(fs::is_directory(first.path()));
        REQUIRE(first.path() != second.path());
        REQUIRE(first.path().filename().string().starts_with("examforge_test_tmp_"));

        examforge::test::write_file(first.path() / "nested" / "file.txt", "x");
        kept = first.path();
    }

    REQUIRE_FALSE(fs::exists(kept));
}

TEST_CASE("Released directories stay on disk") {
    fs::path released;

    {
        TempDirectory dir{"examforge_test_tmp_"};
        released = dir.release();
        REQUIRE(dir.path().empty());
    }

    REQUIRE(fs::is_directory(released));
    REQUIRE(remove_directory_tree(released));
    REQUIRE_FALSE(fs::exists(released));
}

TEST_CASE("Moving transfers ownership") {
    fs::path path;

    {
        TempDirectory outer = TempDirectory::adopt(make_temp_directory("examforge_test_tmp_"));
        path = outer.path();

        {
            TempDirectory inner{std::move(outer)};
            REQUIRE(inner.path() == path);
        }

        REQUIRE_FALSE(fs::exists(path));
    }
}

TEST_CASE("Read-only trees can still be removed") {
    fs::path dir = make_temp_directory("examforge_test_tmp_");
    examforge::test::write_file(dir / "sub" / "file.txt", "x");

    fs::permissions(dir / "sub" / "file.txt", fs::perms::owner_read);
    fs::permissions(dir / "sub", fs::perms::owner_read | fs::perms::owner_exec);

    REQUIRE(remove_directory_tree(dir));
    REQUIRE_FALSE(fs::exists(dir));
}

TEST_CASE("Removing a directory that does not exist is not an error") {
    TempDirectory parent{"examforge_test_tmp_"};

    REQUIRE(remove_directory_tree(parent.path() / "never_created"));
}
