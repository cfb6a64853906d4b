#include "test_common.hpp"
#include "ignore_utils.hpp"

TEST_CASE("read_ignore_file trims whitespace and skips comments") {
    fs::path dir = fs::temp_directory_path() / "ign_test_parse";
    fs::create_directories(dir);
    fs::path file = dir / "exclude.txt";
    std::ofstream ofs(file);
    ofs << "  foo  \n#comment\nbar\r\n   \n\t#another\n\tbaz  \n";
    ofs.close();
    auto entries = ignore::read_ignore_file(file);
    std::vector<std::string> expected{"foo", "bar", "baz"};
    REQUIRE(entries == expected);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("read_ignore_file on a missing file is empty") {
    REQUIRE(ignore::read_ignore_file("/nonexistent/exclude.txt").empty());
}

TEST_CASE("ignore pattern matching supports wildcards") {
    std::vector<std::string> patterns{"tmp-*", "*.bak", "repo?"};
    REQUIRE(ignore::matches("tmp-scratch", patterns));
    REQUIRE(ignore::matches("old.bak", patterns));
    REQUIRE(ignore::matches("repo1", patterns));
    REQUIRE_FALSE(ignore::matches("repo12", patterns));
    REQUIRE_FALSE(ignore::matches("service", patterns));
}

TEST_CASE("ignore plain patterns match whole names only") {
    std::vector<std::string> patterns{"vendor", ""};
    REQUIRE(ignore::matches("vendor", patterns));
    REQUIRE_FALSE(ignore::matches("vendor2", patterns));
    REQUIRE_FALSE(ignore::matches("my-vendor", patterns));
    REQUIRE_FALSE(ignore::matches("anything", {}));
}
