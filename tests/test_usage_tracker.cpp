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
#include <safetar/policy.hpp>

using namespace safetar;
namespace fs = std::filesystem;

namespace {

const fs::path root{"/srv/archive-root"};

validated_path validate(const security_policy& policy, std::string_view path) {
    auto result = policy.normalize_and_validate(path, root);
    REQUIRE(result.has_value());
    return *result;
}

} // anonymous namespace

TEST_CASE("Second entry trips a one-file limit", "[usage]") {
    const auto policy = security_policy{}.with_max_files(1);
    auto usage = policy.usage();

    REQUIRE(usage.observe(validate(policy, "item"), 4).has_value());

    auto second = usage.observe(validate(policy, "other"), 0);
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code() == error_code::file_count_exceeded);
    CHECK(usage.files_seen() == 1);
    CHECK(usage.total_bytes() == 4);
}

TEST_CASE("Limits are checked in a fixed order", "[usage]") {
    const auto policy = security_policy{}.with_limits(policy_limits{1, 10, 8, 1});

    SECTION("Single file size comes before depth") {
        auto usage = policy.usage();
        auto result = usage.observe(validate(policy, "a/b/c"), 9);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::single_file_too_large);
    }

    SECTION("Depth comes before the file count") {
        auto usage = policy.usage();
        REQUIRE(usage.observe(validate(policy, "a"), 1).has_value());
        auto result = usage.observe(validate(policy, "a/b"), 1);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::depth_exceeded);
    }

    SECTION("File count comes before total bytes") {
        auto usage = policy.usage();
        REQUIRE(usage.observe(validate(policy, "a"), 8).has_value());
        auto result = usage.observe(validate(policy, "b"), 8);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::file_count_exceeded);
    }
}

TEST_CASE("Total bytes accumulate across entries", "[usage]") {
    const auto policy = security_policy{}.with_limits(policy_limits{100, 10, 8, 8});
    auto usage = policy.usage();

    REQUIRE(usage.observe(validate(policy, "a"), 6).has_value());
    auto result = usage.observe(validate(policy, "b"), 6);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::total_bytes_exceeded);

    // The rejected entry is not counted, earlier ones are kept
    CHECK(usage.files_seen() == 1);
    CHECK(usage.total_bytes() == 6);

    REQUIRE(usage.observe(validate(policy, "c"), 4).has_value());
    CHECK(usage.files_seen() == 2);
    CHECK(usage.total_bytes() == 10);
}

TEST_CASE("Counters never decrease", "[usage]") {
    const auto policy = security_policy{}.with_limits(policy_limits{5, 1000, 100, 3});
    auto usage = policy.usage();

    uint64_t last_files = 0;
    uint64_t last_bytes = 0;
    const char* paths[] = {"a", "a/b", "a/b/c", "a/b/c/d", "x", "y", "z", "w"};
    for (const auto* path : paths) {
        (void)usage.observe(validate(policy, path), 50);
        CHECK(usage.files_seen() >= last_files);
        CHECK(usage.total_bytes() >= last_bytes);
        last_files = usage.files_seen();
        last_bytes = usage.total_bytes();
    }
    CHECK(usage.files_seen() == 5);
    CHECK(usage.max_depth_observed() == 3);
}

TEST_CASE("Depth counts normal components only", "[usage]") {
    const auto policy = security_policy{}.with_max_depth(2);
    auto usage = policy.usage();

    CHECK(usage.observe(validate(policy, "./a/./b/"), 0).has_value());
    CHECK(usage.max_depth_observed() == 2);
    CHECK_FALSE(usage.observe(validate(policy, "a/b/c"), 0).has_value());
}

TEST_CASE("Root entry has depth zero", "[usage]") {
    const auto policy = security_policy{}.with_max_depth(0);
    auto usage = policy.usage();
    CHECK(usage.observe(validate(policy, "."), 0).has_value());
}
