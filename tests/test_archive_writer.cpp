/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <catch2/catch_test_macros.hpp>
#include <safetar/archive_reader.hpp>
#include <safetar/archive_writer.hpp>
#include "test_helpers.hpp"

using namespace safetar;
using namespace safetar::testing;

namespace {

struct read_back {
    std::string path;
    entry_type type;
    uint64_t size;
    std::optional<std::string> link_target;
    std::filesystem::perms permissions;
    std::string content;
};

std::vector<read_back> read_archive(const fs::path& path) {
    auto reader = archive_reader::from_file(path);
    REQUIRE(reader.has_value());

    std::vector<read_back> entries;
    while (true) {
        auto next = reader->next_entry();
        REQUIRE(next.has_value());
        if (!*next) {
            break;
        }
        const auto& entry = **next;
        std::string content;
        auto total = entry.for_each_chunk([&content](std::span<const std::byte> chunk) {
            for (auto b : chunk) {
                content.push_back(static_cast<char>(b));
            }
        });
        REQUIRE(total.has_value());
        entries.push_back({entry.path(), entry.type(), entry.size(), entry.link_target(), entry.permissions(), content});
    }
    return entries;
}

} // anonymous namespace

TEST_CASE("Write and read back every entry kind", "[writer]") {
    TempDirectory temp;
    write_file(temp.path() / "source.txt", "from disk");

    auto writer = archive_writer::to_file(temp.path() / "out.tar");
    REQUIRE(writer.has_value());
    REQUIRE(writer->append_directory("dir").has_value());
    REQUIRE(writer->append_file("dir/source.txt", temp.path() / "source.txt", 9, false).has_value());
    REQUIRE(writer->append_data("dir/tool.sh", to_bytes("#!/bin/sh\n"), true).has_value());
    REQUIRE(writer->append_symlink("dir/link", "source.txt").has_value());
    REQUIRE(writer->finish().has_value());

    CHECK(writer->entries_written() == 4);
    CHECK(writer->bytes_written() == fs::file_size(temp.path() / "out.tar"));
    CHECK(writer->bytes_written() % 512 == 0);

    auto entries = read_archive(temp.path() / "out.tar");
    REQUIRE(entries.size() == 4);

    CHECK(entries[0].path == "dir/");
    CHECK(entries[0].type == entry_type::directory);
    CHECK(entries[0].permissions == static_cast<fs::perms>(0755));

    CHECK(entries[1].path == "dir/source.txt");
    CHECK(entries[1].content == "from disk");
    CHECK(entries[1].permissions == static_cast<fs::perms>(0644));

    CHECK(entries[2].content == "#!/bin/sh\n");
    CHECK(entries[2].permissions == static_cast<fs::perms>(0755));

    CHECK(entries[3].type == entry_type::symbolic_link);
    CHECK(entries[3].link_target == "source.txt");
    CHECK(entries[3].size == 0);
}

TEST_CASE("Long names and targets are written as GNU records", "[writer][gnu]") {
    TempDirectory temp;
    const std::string long_name = std::string(130, 'n') + "/file";
    const std::string long_target = std::string(140, 't');

    auto writer = archive_writer::to_file(temp.path() / "out.tar");
    REQUIRE(writer.has_value());
    REQUIRE(writer->append_data(long_name, to_bytes("payload")).has_value());
    REQUIRE(writer->append_symlink(long_name + "-link", long_target).has_value());
    REQUIRE(writer->finish().has_value());

    // Pseudo-entries do not count as entries
    CHECK(writer->entries_written() == 2);

    auto entries = read_archive(temp.path() / "out.tar");
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].path == long_name);
    CHECK(entries[0].content == "payload");
    CHECK(entries[1].path == long_name + "-link");
    CHECK(entries[1].link_target == long_target);

    // The raw stream starts with the long name record
    const auto raw = read_file_content(temp.path() / "out.tar");
    CHECK(raw.starts_with("././@LongLink"));
    CHECK(raw[156] == 'L');
}

TEST_CASE("Writer errors", "[writer]") {
    TempDirectory temp;
    auto writer = archive_writer::to_file(temp.path() / "out.tar");
    REQUIRE(writer.has_value());

    SECTION("Empty name") {
        auto result = writer->append_data("", {});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::empty_path);
    }

    SECTION("Missing source") {
        auto result = writer->append_file("gone.txt", temp.path() / "gone.txt", 3, false);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::io_error);
    }

    SECTION("Source shrank") {
        write_file(temp.path() / "short.txt", "ab");
        auto result = writer->append_file("short.txt", temp.path() / "short.txt", 10, false);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message().find("shrank") != std::string::npos);
    }

    SECTION("Source grew") {
        write_file(temp.path() / "long.txt", "abcdef");
        auto result = writer->append_file("long.txt", temp.path() / "long.txt", 3, false);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().message().find("grew") != std::string::npos);
    }

    SECTION("Write after finish") {
        REQUIRE(writer->finish().has_value());
        auto result = writer->append_directory("late");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_operation);
    }
}

TEST_CASE("Unwritable destination", "[writer]") {
    TempDirectory temp;
    auto writer = archive_writer::to_file(temp.path() / "missing/dir/out.tar");
    REQUIRE_FALSE(writer.has_value());
    CHECK(writer.error().code() == error_code::io_error);
}
