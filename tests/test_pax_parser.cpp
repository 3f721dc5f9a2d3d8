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
#include <safetar/pax_parser.hpp>
#include "test_helpers.hpp"

using namespace safetar;
using namespace safetar::testing;

TEST_CASE("Parse PAX records", "[pax]") {
    SECTION("Single record") {
        auto data = to_bytes("27 path=long/file/name.txt\n");
        auto result = pax::parse_pax_headers(data);
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 1);
        CHECK(result->at("path") == "long/file/name.txt");
    }

    SECTION("Several records") {
        auto data = to_bytes("30 mtime=1153704088.123456789\n19 linkpath=target\n");
        auto result = pax::parse_pax_headers(data);
        REQUIRE(result.has_value());
        CHECK(result->at("mtime") == "1153704088.123456789");
        CHECK(result->at("linkpath") == "target");
    }

    SECTION("Values may contain '=' and spaces") {
        auto data = to_bytes("27 comment=a = b and c = d\n");
        auto result = pax::parse_pax_headers(data);
        REQUIRE(result.has_value());
        CHECK(result->at("comment") == "a = b and c = d");
    }

    SECTION("Trailing NUL padding ends parsing") {
        auto data = to_bytes(std::string{"12 uid=1000\n"} + std::string(20, '\0'));
        auto result = pax::parse_pax_headers(data);
        REQUIRE(result.has_value());
        CHECK(result->at("uid") == "1000");
    }

    SECTION("Later records override earlier ones") {
        auto data = to_bytes("12 path=one\n12 path=two\n");
        auto result = pax::parse_pax_headers(data);
        REQUIRE(result.has_value());
        CHECK(result->at("path") == "two");
    }
}

TEST_CASE("Malformed PAX records", "[pax]") {
    SECTION("Missing length") {
        auto result = pax::parse_pax_headers(to_bytes("path=x\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_header);
    }

    SECTION("Length too small") {
        auto result = pax::parse_pax_headers(to_bytes("2 path=x\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_header);
    }

    SECTION("Length past the end") {
        auto result = pax::parse_pax_headers(to_bytes("99 path=x\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::corrupt_archive);
    }

    SECTION("Missing separator") {
        auto result = pax::parse_pax_headers(to_bytes("8 pathx\n"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_header);
    }
}

TEST_CASE("Apply PAX overrides", "[pax]") {
    file_metadata meta;
    meta.path = "short";
    meta.size = 10;

    SECTION("Path, link and size") {
        const pax_records records{{"path", "a/much/longer/name"}, {"linkpath", "other"}, {"size", "12345"}};
        REQUIRE(pax::apply_pax_records(meta, records).has_value());
        CHECK(meta.path == "a/much/longer/name");
        CHECK(meta.link_target == "other");
        CHECK(meta.size == 12345);
        CHECK(meta.pax == records);
    }

    SECTION("Fractional mtime") {
        REQUIRE(pax::apply_pax_records(meta, {{"mtime", "1153704088.5"}}).has_value());
        CHECK(meta.mtime_seconds() == 1153704088);
    }

    SECTION("Invalid size") {
        auto result = pax::apply_pax_records(meta, {{"size", "12abc"}});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::invalid_header);
    }

    SECTION("Unknown keys are kept but ignored") {
        REQUIRE(pax::apply_pax_records(meta, {{"SCHILY.xattr.user.test", "v"}}).has_value());
        CHECK(meta.path == "short");
        CHECK(meta.pax.at("SCHILY.xattr.user.test") == "v");
    }
}

TEST_CASE("Reader attaches PAX records to the next entry", "[pax][reader]") {
    const std::string longname = std::string(180, 'p') + ".txt";
    tar_builder archive;
    archive.pax({{"path", longname}, {"comment", "hello"}})
        .file("truncated", "data")
        .file("next.txt", "next")
        .end();

    auto reader = archive_reader::from_stream(std::make_unique<buffer_stream>(archive.bytes()));
    REQUIRE(reader.has_value());

    auto first = reader->next_entry();
    REQUIRE(first.has_value());
    REQUIRE(first->has_value());
    CHECK((*first)->path() == longname);
    CHECK((*first)->pax().at("comment") == "hello");

    auto second = reader->next_entry();
    REQUIRE(second.has_value());
    REQUIRE(second->has_value());
    CHECK((*second)->path() == "next.txt");
    CHECK((*second)->pax().empty());
}

TEST_CASE("Global PAX headers are skipped", "[pax][reader]") {
    tar_builder archive;
    const std::string body = "18 comment=global\n";
    archive.header("pax_global_header", 'g', body.size());
    auto bytes = archive.bytes();
    auto payload = to_bytes(body);
    payload.resize(512, std::byte{0});
    bytes.insert(bytes.end(), payload.begin(), payload.end());

    tar_builder rest;
    rest.file("only.txt", "x").end();
    bytes.insert(bytes.end(), rest.bytes().begin(), rest.bytes().end());

    auto reader = archive_reader::from_stream(std::make_unique<buffer_stream>(std::move(bytes)));
    REQUIRE(reader.has_value());

    auto entry = reader->next_entry();
    REQUIRE(entry.has_value());
    REQUIRE(entry->has_value());
    CHECK((*entry)->path() == "only.txt");
    CHECK((*entry)->pax().empty());
}
