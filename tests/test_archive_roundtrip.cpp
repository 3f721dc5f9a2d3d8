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
#include <catch2/generators/catch_generators.hpp>
#include <safetar/archive.hpp>
#include <safetar/digest.hpp>
#include "test_helpers.hpp"
#include <chrono>

using namespace safetar;
using namespace safetar::testing;

namespace {

std::string binary_payload(size_t size) {
    std::string data(size, '\0');
    uint32_t state = 0x12345678;
    for (auto& c : data) {
        state = state * 1103515245 + 12345;
        c = static_cast<char>(state >> 24);
    }
    return data;
}

create_options create_from(const TempDirectory& temp, const std::string& input, const std::string& archive) {
    create_options options;
    options.archive_path = temp.path() / archive;
    options.inputs = {input};
    options.work_dir = temp.path();
    return options;
}

extract_options extract_into(const TempDirectory& temp, const std::string& archive, const std::string& dest) {
    extract_options options;
    options.archive_path = temp.path() / archive;
    options.destination = temp.path() / dest;
    return options;
}

std::vector<std::string> manifest_paths(const std::vector<manifest_entry>& entries) {
    std::vector<std::string> paths;
    for (const auto& entry : entries) {
        paths.push_back(entry.path);
    }
    return paths;
}

} // anonymous namespace

TEST_CASE("Excluded files never reach the archive", "[archive][create]") {
    TempDirectory temp;
    write_file(temp.path() / "project/nested/keep.txt", "keep me");
    write_file(temp.path() / "project/nested/skip.log", "skip me");

    auto options = create_from(temp, "project", "out.tar");
    options.excludes = {"*.log"};

    auto created = create_archive(options, security_policy{});
    REQUIRE(created.has_value());
    CHECK(manifest_paths(created->manifest) == std::vector<std::string>{"nested", "nested/keep.txt"});

    auto extracted = extract_archive(extract_into(temp, "out.tar", "out"), security_policy{});
    REQUIRE(extracted.has_value());
    CHECK(read_file_content(temp.path() / "out/nested/keep.txt") == "keep me");
    CHECK_FALSE(fs::exists(temp.path() / "out/nested/skip.log"));
    CHECK(manifest_paths(*extracted) == manifest_paths(created->manifest));
}

TEST_CASE("Content survives every codec", "[archive][codec]") {
    const auto codec = GENERATE(compression::none, compression::gzip, compression::xz, compression::zstd);
    CAPTURE(to_string(codec));

    TempDirectory temp;
    const auto payload = binary_payload(200'000);
    write_file(temp.path() / "project/data.bin", payload);
    write_file(temp.path() / "project/empty.txt", "");
    write_file(temp.path() / "project/sub/small.txt", "small");

    auto options = create_from(temp, "project", "out.tar");
    options.codec = codec;
    auto created = create_archive(options, security_policy{});
    REQUIRE(created.has_value());

    // The reader sniffs the codec itself
    auto extracted = extract_archive(extract_into(temp, "out.tar", "out"), security_policy{});
    REQUIRE(extracted.has_value());

    CHECK(read_file_content(temp.path() / "out/data.bin") == payload);
    CHECK(fs::exists(temp.path() / "out/empty.txt"));
    CHECK(fs::file_size(temp.path() / "out/empty.txt") == 0);
    CHECK(read_file_content(temp.path() / "out/sub/small.txt") == "small");
    CHECK(verify_manifest(created->manifest, *extracted, false).has_value());
}

TEST_CASE("Print plan writes nothing", "[archive][create]") {
    TempDirectory temp;
    write_file(temp.path() / "project/a.txt", "a");
    write_file(temp.path() / "project/b/c.txt", "c");

    auto options = create_from(temp, "project", "out.tar");
    options.print_plan = true;
    options.manifest_out = temp.path() / "manifest.json";

    auto created = create_archive(options, security_policy{});
    REQUIRE(created.has_value());
    CHECK(created->plan.size() == 3);
    CHECK(created->manifest.size() == 3);
    CHECK_FALSE(fs::exists(temp.path() / "out.tar"));
    CHECK_FALSE(fs::exists(temp.path() / "manifest.json"));
}

TEST_CASE("Symlinks and executables are preserved", "[archive][links]") {
    TempDirectory temp;
    write_file(temp.path() / "project/top.txt", "top");
    write_file(temp.path() / "project/bin/run.sh", "#!/bin/sh\necho hi\n");
    fs::permissions(temp.path() / "project/bin/run.sh", fs::perms::owner_exec, fs::perm_options::add);
    fs::create_symlink("../top.txt", temp.path() / "project/bin/top-link");

    REQUIRE(create_archive(create_from(temp, "project", "out.tar"), security_policy{}).has_value());
    auto extracted = extract_archive(extract_into(temp, "out.tar", "out"), security_policy{});
    REQUIRE(extracted.has_value());

    const auto link = temp.path() / "out/bin/top-link";
    REQUIRE(fs::is_symlink(link));
    CHECK(fs::read_symlink(link) == fs::path{"../top.txt"});
    CHECK(read_file_content(link) == "top");

    const auto perms = fs::status(temp.path() / "out/bin/run.sh").permissions();
    CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
}

TEST_CASE("Manifest written at creation verifies extraction", "[archive][manifest]") {
    TempDirectory temp;
    write_file(temp.path() / "project/a.txt", "alpha");
    write_file(temp.path() / "project/b.txt", "beta");

    auto options = create_from(temp, "project", "first.tar");
    options.manifest_out = temp.path() / "manifest.json";
    REQUIRE(create_archive(options, security_policy{}).has_value());
    REQUIRE(fs::exists(temp.path() / "manifest.json"));

    SECTION("Matching archive") {
        auto extract = extract_into(temp, "first.tar", "out");
        extract.manifest = temp.path() / "manifest.json";
        CHECK(extract_archive(extract, security_policy{}).has_value());
    }

    SECTION("Changed content") {
        write_file(temp.path() / "project/b.txt", "gamma");
        REQUIRE(create_archive(create_from(temp, "project", "second.tar"), security_policy{}).has_value());

        auto extract = extract_into(temp, "second.tar", "out");
        extract.manifest = temp.path() / "manifest.json";
        auto result = extract_archive(extract, security_policy{});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::manifest_mismatch);
        CHECK(exit_code_for(result.error()) == 3);
    }

    SECTION("Extra entry") {
        write_file(temp.path() / "project/c.txt", "extra");
        REQUIRE(create_archive(create_from(temp, "project", "second.tar"), security_policy{}).has_value());

        auto extract = extract_into(temp, "second.tar", "out");
        extract.manifest = temp.path() / "manifest.json";
        auto strict = extract_archive(extract, security_policy{});
        REQUIRE_FALSE(strict.has_value());
        CHECK(strict.error().code() == error_code::unexpected_entry);

        extract.manifest_relaxed = true;
        CHECK(extract_archive(extract, security_policy{}).has_value());
    }
}

TEST_CASE("Listing fingerprints without extracting", "[archive][list]") {
    TempDirectory temp;
    write_file(temp.path() / "project/nested/keep.txt", "keep");
    write_file(temp.path() / "project/top.txt", "top");
    fs::create_symlink("top.txt", temp.path() / "project/zlink");

    auto options = create_from(temp, "project", "out.tar");
    options.codec = compression::gzip;
    auto created = create_archive(options, security_policy{});
    REQUIRE(created.has_value());

    auto listed = list_archive(list_options{temp.path() / "out.tar"});
    REQUIRE(listed.has_value());
    REQUIRE(listed->size() == 4);

    CHECK((*listed)[0].entry.path == "nested");
    CHECK((*listed)[0].entry.kind == manifest_kind::directory);
    CHECK((*listed)[1].entry.path == "nested/keep.txt");
    CHECK((*listed)[1].entry.sha256 == sha256_hex(std::string_view{"keep"}));
    CHECK((*listed)[1].entry.mtime == 1153704088);
    CHECK((*listed)[3].entry.kind == manifest_kind::symlink);
    CHECK((*listed)[3].entry.target == "top.txt");
    CHECK((*listed)[3].entry.mtime == std::nullopt);

    std::vector<manifest_entry> entries;
    for (const auto& item : *listed) {
        entries.push_back(item.entry);
        CHECK(item.pax.empty());
    }
    CHECK(verify_manifest(created->manifest, entries, false).has_value());
}

TEST_CASE("Long names use GNU long name records", "[archive][gnu]") {
    TempDirectory temp;
    const std::string long_dir(90, 'd');
    const std::string long_file(120, 'f');
    write_file(temp.path() / "project" / long_dir / long_file, "deep");
    fs::create_symlink(long_dir + "/" + long_file, temp.path() / "project/long-link");

    REQUIRE(create_archive(create_from(temp, "project", "out.tar"), security_policy{}).has_value());
    auto extracted = extract_archive(extract_into(temp, "out.tar", "out"), security_policy{});
    REQUIRE(extracted.has_value());

    CHECK(read_file_content(temp.path() / "out" / long_dir / long_file) == "deep");
    CHECK(fs::read_symlink(temp.path() / "out/long-link") == fs::path{long_dir + "/" + long_file});
}

TEST_CASE("Archives are byte-for-byte reproducible", "[archive][create]") {
    const auto codec = GENERATE(compression::none, compression::gzip);

    TempDirectory temp;
    write_file(temp.path() / "project/a.txt", "alpha");
    write_file(temp.path() / "project/dir/b.txt", "beta");

    auto first = create_from(temp, "project", "first.tar");
    first.codec = codec;
    REQUIRE(create_archive(first, security_policy{}).has_value());

    // Touch a file; metadata must not leak into headers
    fs::last_write_time(temp.path() / "project/a.txt", fs::file_time_type::clock::now() - std::chrono::hours{48});

    auto second = create_from(temp, "project", "second.tar");
    second.codec = codec;
    REQUIRE(create_archive(second, security_policy{}).has_value());

    const auto first_bytes = read_file_content(temp.path() / "first.tar");
    CHECK_FALSE(first_bytes.empty());
    CHECK(first_bytes == read_file_content(temp.path() / "second.tar"));
}

TEST_CASE("Several inputs share one archive", "[archive][create]") {
    TempDirectory temp;
    write_file(temp.path() / "one/a.txt", "a");
    write_file(temp.path() / "two/b.txt", "b");
    write_file(temp.path() / "loose.txt", "loose");

    create_options options;
    options.archive_path = temp.path() / "out.tar";
    options.inputs = {"one", "two", "loose.txt"};
    options.work_dir = temp.path();

    auto created = create_archive(options, security_policy{});
    REQUIRE(created.has_value());
    CHECK(manifest_paths(created->manifest) == std::vector<std::string>{"a.txt", "b.txt", "loose.txt"});
}

TEST_CASE("Create rejects bad inputs", "[archive][create][errors]") {
    TempDirectory temp;

    SECTION("Missing input") {
        auto created = create_archive(create_from(temp, "missing", "out.tar"), security_policy{});
        REQUIRE_FALSE(created.has_value());
        CHECK(created.error().code() == error_code::user_input);
        CHECK(exit_code_for(created.error()) == 2);
    }

    SECTION("Escaping symlink") {
        write_file(temp.path() / "project/a/b/file.txt", "x");
        fs::create_symlink("../../../../etc/passwd", temp.path() / "project/a/b/evil");
        auto created = create_archive(create_from(temp, "project", "out.tar"), security_policy{});
        REQUIRE_FALSE(created.has_value());
        CHECK(created.error().code() == error_code::link_outside_root);
        CHECK_FALSE(fs::exists(temp.path() / "out.tar"));
    }

    SECTION("Quota exceeded") {
        write_file(temp.path() / "project/big.bin", std::string(4096, 'x'));
        auto created = create_archive(create_from(temp, "project", "out.tar"),
                                      security_policy{}.with_max_total_bytes(1024));
        REQUIRE_FALSE(created.has_value());
        CHECK(created.error().code() == error_code::total_bytes_exceeded);
    }
}
