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
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace safetar {

enum class manifest_kind {
    file,
    directory,
    symlink
};

// "File", "Directory" or "Symlink", as stored in manifest JSON
[[nodiscard]] std::string_view to_string(manifest_kind kind) noexcept;
[[nodiscard]] std::optional<manifest_kind> manifest_kind_from_string(std::string_view text) noexcept;

// Something on disk waiting to be fingerprinted
struct manifest_item {
    std::filesystem::path relative;
    std::filesystem::path absolute;
    manifest_kind kind = manifest_kind::file;
    std::optional<std::string> link_target;
    uint64_t size = 0;
    std::optional<uint64_t> mtime;
};

struct manifest_entry {
    std::string path;
    uint64_t size = 0;
    std::string sha256;
    manifest_kind kind = manifest_kind::file;
    std::optional<std::string> target;
    std::optional<uint64_t> mtime;

    bool operator==(const manifest_entry&) const = default;

    [[nodiscard]] static manifest_entry for_directory(std::string path, std::optional<uint64_t> mtime);
    [[nodiscard]] static manifest_entry for_symlink(std::string path, std::string target, std::optional<uint64_t> mtime);
};

// Fingerprint every item on up to `max_workers` threads (the caller
// included, 0 means one per hardware thread), then sort by path. Files are
// hashed from `absolute`; directories hash the empty input and symlinks
// hash their target string.
[[nodiscard]] std::expected<std::vector<manifest_entry>, error>
collect_manifest(std::span<const manifest_item> items, size_t max_workers = 0);

// Every expected path must be present with the same digest and kind. Unless
// `relaxed`, `actual` may not contain anything else.
[[nodiscard]] std::expected<void, error>
verify_manifest(std::span<const manifest_entry> expected, std::span<const manifest_entry> actual, bool relaxed);

// Pretty-printed JSON array, stable for a given entry list
[[nodiscard]] std::string manifest_to_json(std::span<const manifest_entry> entries);
[[nodiscard]] std::expected<std::vector<manifest_entry>, error> manifest_from_json(std::string_view json);

[[nodiscard]] std::expected<void, error>
write_manifest_json(std::span<const manifest_entry> entries, const std::filesystem::path& path);

[[nodiscard]] std::expected<std::vector<manifest_entry>, error>
read_manifest_json(const std::filesystem::path& path);

} // namespace safetar
