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

#pragma once

#include <safetar/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>

namespace safetar {

struct policy_limits {
    uint64_t max_files = 200'000;
    uint64_t max_total_bytes = 8ULL << 30;
    uint64_t max_single_file = 2ULL << 30;
    uint32_t max_depth = 64;

    bool operator==(const policy_limits&) const = default;
};

enum class link_kind {
    symlink,
    hardlink
};

// A path confined to an operation root. `abs` always starts with the root
// and `rel` is `abs` with the root stripped (empty for the root itself).
// Only security_policy::normalize_and_validate creates these.
class validated_path {
public:
    [[nodiscard]] const std::filesystem::path& rel() const noexcept { return rel_; }
    [[nodiscard]] const std::filesystem::path& abs() const noexcept { return abs_; }

    bool operator==(const validated_path&) const = default;

private:
    friend class security_policy;

    validated_path(std::filesystem::path rel, std::filesystem::path abs)
        : rel_(std::move(rel)), abs_(std::move(abs)) {}

    std::filesystem::path rel_;
    std::filesystem::path abs_;
};

class usage_tracker;

// Immutable policy value. The with_* setters return modified copies.
class security_policy {
public:
    security_policy() = default;

    [[nodiscard]] security_policy with_limits(const policy_limits& limits) const;
    [[nodiscard]] security_policy with_max_files(std::optional<uint64_t> value) const;
    [[nodiscard]] security_policy with_max_total_bytes(std::optional<uint64_t> value) const;
    [[nodiscard]] security_policy with_max_single_file(std::optional<uint64_t> value) const;
    [[nodiscard]] security_policy with_max_depth(std::optional<uint32_t> value) const;
    [[nodiscard]] security_policy with_allow_absolute(bool allow) const;
    [[nodiscard]] security_policy with_allow_parent_components(bool allow) const;
    [[nodiscard]] security_policy with_follow_symlinks(bool follow) const;
    [[nodiscard]] security_policy with_allow_symlink_outside_root(bool allow) const;
    [[nodiscard]] security_policy with_allow_hardlink_outside_root(bool allow) const;

    [[nodiscard]] const policy_limits& limits() const noexcept { return limits_; }
    [[nodiscard]] bool follow_symlinks() const noexcept { return follow_symlinks_; }
    [[nodiscard]] bool allows_outside_root(const link_kind kind) const noexcept {
        return kind == link_kind::symlink ? allow_symlink_outside_root_ : allow_hardlink_outside_root_;
    }

    // Lexically confine an untrusted path (raw bytes from an archive or the
    // filesystem) to `root`. Never touches the filesystem. `root` must be
    // absolute.
    [[nodiscard]] std::expected<validated_path, error>
    normalize_and_validate(std::string_view path, const std::filesystem::path& root) const;

    [[nodiscard]] std::expected<validated_path, error>
    normalize_and_validate(const std::filesystem::path& path, const std::filesystem::path& root) const {
        return normalize_and_validate(std::string_view{path.native()}, root);
    }

    // Require a link target to stay inside `root`. Relative targets are
    // checked against `root` as given, so callers join them to the link's
    // parent directory first.
    [[nodiscard]] std::expected<void, error>
    enforce_link_policy(const std::filesystem::path& target, const std::filesystem::path& root, link_kind kind) const;

    // Fresh per-operation quota counters seeded with these limits
    [[nodiscard]] usage_tracker usage() const;

private:
    policy_limits limits_;
    bool allow_absolute_ = false;
    bool allow_parent_components_ = false;
    bool follow_symlinks_ = false;
    bool allow_symlink_outside_root_ = false;
    bool allow_hardlink_outside_root_ = false;
};

// Per-operation quota accounting. Counters only grow; an entry that trips a
// limit is not counted and earlier entries stay counted. Not thread-safe.
class usage_tracker {
public:
    explicit usage_tracker(const policy_limits& limits) : limits_(limits) {}

    [[nodiscard]] std::expected<void, error> observe(const validated_path& path, uint64_t size);

    [[nodiscard]] uint64_t files_seen() const noexcept { return files_seen_; }
    [[nodiscard]] uint64_t total_bytes() const noexcept { return total_bytes_; }
    [[nodiscard]] uint32_t max_depth_observed() const noexcept { return max_depth_observed_; }

private:
    policy_limits limits_;
    uint64_t files_seen_ = 0;
    uint64_t total_bytes_ = 0;
    uint32_t max_depth_observed_ = 0;
};

// Collapse "." and ".." components and redundant separators without
// consulting the filesystem. ".." at the root of an absolute path is
// dropped; leading ".." of a relative path is kept.
[[nodiscard]] std::filesystem::path lexical_clean(const std::filesystem::path& path);

// Component-wise prefix test on cleaned paths
[[nodiscard]] bool path_starts_with(const std::filesystem::path& path, const std::filesystem::path& prefix);

[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

} // namespace safetar
