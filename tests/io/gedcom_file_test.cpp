/**
 * @file gedcom_file_test.cpp
 * @brief Unit tests for GEDCOM file reading and writing
 */

#include <catch2/catch_test_macros.hpp>

#include "gedanon/io/gedcom_file.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace gedanon;
using namespace gedanon::io;

namespace {

/**
 * @brief RAII temporary directory
 */
class temp_directory {
public:
    temp_directory()
        : path_(std::filesystem::temp_directory_path() / "gedanon_file_test") {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    temp_directory& operator=(const temp_directory&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

void write_raw(const std::filesystem::path& path, const std::string& bytes) {
    std::ofstream file(path, std::ios::binary);
    file << bytes;
}

auto read_raw(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

} // namespace

TEST_CASE("GedcomFile: Line Splitting", "[io][file]") {
    using lines = std::vector<std::string>;

    CHECK(split_lines("") == lines{});
    CHECK(split_lines("a\nb\n") == lines{"a", "b"});
    CHECK(split_lines("a\nb") == lines{"a", "b"});
    CHECK(split_lines("a\r\nb\r\n") == lines{"a", "b"});
    CHECK(split_lines("a\rb\r") == lines{"a", "b"});
    CHECK(split_lines("a\n\nb\n") == lines{"a", "", "b"});
    CHECK(split_lines("\n") == lines{""});
    CHECK(split_lines("a\r\n\r\nb") == lines{"a", "", "b"});
}

TEST_CASE("GedcomFile: From Text", "[io][file]") {
    SECTION("Byte-order marker is removed and remembered") {
        auto file = gedcom_file::from_text("\xEF\xBB\xBF" "0 HEAD\n0 TRLR\n");
        REQUIRE(file.had_bom());
        REQUIRE(file.line_count() == 2);
        CHECK(file.lines()[0] == "0 HEAD");
    }

    SECTION("Text without marker") {
        auto file = gedcom_file::from_text("0 HEAD\r\n0 TRLR");
        CHECK_FALSE(file.had_bom());
        CHECK(file.line_count() == 2);
        CHECK(file.to_text() == "0 HEAD\n0 TRLR\n");
    }
}

TEST_CASE("GedcomFile: Open", "[io][file]") {
    temp_directory dir;

    SECTION("Reads a CRLF file with BOM") {
        auto path = dir.path() / "family.ged";
        write_raw(path, "\xEF\xBB\xBF" "0 HEAD\r\n1 NAME John /Smith/\r\n\r\n0 TRLR\r\n");

        auto result = gedcom_file::open(path);
        REQUIRE(result.is_ok());

        const auto& file = result.value();
        REQUIRE(file.line_count() == 4);
        CHECK(file.lines()[0] == "0 HEAD");
        CHECK(file.lines()[1] == "1 NAME John /Smith/");
        CHECK(file.lines()[2].empty());
        CHECK(file.had_bom());
    }

    SECTION("Empty file has no lines") {
        auto path = dir.path() / "empty.ged";
        write_raw(path, "");

        auto result = gedcom_file::open(path);
        REQUIRE(result.is_ok());
        CHECK(result.value().line_count() == 0);
    }

    SECTION("Missing file is an error") {
        auto result = gedcom_file::open(dir.path() / "missing.ged");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::file_not_found);
        CHECK(result.error().message.find("missing.ged") != std::string::npos);
    }

    SECTION("Directory is not a regular file") {
        auto result = gedcom_file::open(dir.path());
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::not_a_regular_file);
    }
}

TEST_CASE("GedcomFile: Path Existence", "[io][file]") {
    temp_directory dir;

    SECTION("Existing file and directory") {
        write_raw(dir.path() / "present.ged", "0 HEAD\n");

        auto file = path_exists(dir.path() / "present.ged");
        REQUIRE(file.is_ok());
        CHECK(file.value());

        auto directory = path_exists(dir.path());
        REQUIRE(directory.is_ok());
        CHECK(directory.value());
    }

    SECTION("Absent path is not an error") {
        auto result = path_exists(dir.path() / "absent.ged");
        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value());
    }

    SECTION("Inaccessible path is reported instead of thrown") {
        // A component longer than NAME_MAX makes stat() fail with ENAMETOOLONG
        const auto too_long = dir.path() / std::string(300, 'x');

        auto result = path_exists(too_long);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::file_read_error);
        CHECK(result.error().message.find("Cannot access") != std::string::npos);

        auto opened = gedcom_file::open(too_long);
        REQUIRE(opened.is_err());
        CHECK(opened.error().code == error_codes::file_read_error);
    }
}

TEST_CASE("GedcomFile: Save", "[io][file]") {
    temp_directory dir;

    SECTION("Lines are LF-terminated without BOM") {
        auto path = dir.path() / "out.ged";
        auto file = gedcom_file::create({"0 HEAD", "", "0 TRLR"});

        auto saved = file.save(path);
        REQUIRE(saved.is_ok());
        CHECK(read_raw(path) == "0 HEAD\n\n0 TRLR\n");
    }

    SECTION("Missing parent directories are created") {
        auto path = dir.path() / "nested" / "deeper" / "out.ged";
        auto saved = gedcom_file::create({"0 HEAD"}).save(path);
        REQUIRE(saved.is_ok());
        CHECK(std::filesystem::exists(path));
    }

    SECTION("Existing file is overwritten") {
        auto path = dir.path() / "out.ged";
        write_raw(path, "old content that is longer\n");

        REQUIRE(gedcom_file::create({"0 TRLR"}).save(path).is_ok());
        CHECK(read_raw(path) == "0 TRLR\n");
    }

    SECTION("Writing to a directory path fails") {
        auto saved = gedcom_file::create({"0 HEAD"}).save(dir.path());
        REQUIRE(saved.is_err());
        CHECK(saved.error().code == error_codes::file_write_error);
    }

    SECTION("Round trip through disk") {
        auto path = dir.path() / "round.ged";
        std::vector<std::string> lines = {"0 HEAD", "1 CHAR UTF-8", "0 TRLR"};
        REQUIRE(gedcom_file::create(lines).save(path).is_ok());

        auto reopened = gedcom_file::open(path);
        REQUIRE(reopened.is_ok());
        CHECK(reopened.value().lines() == lines);
        CHECK_FALSE(reopened.value().had_bom());
    }
}
