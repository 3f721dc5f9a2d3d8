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

#include <safetar/archive_reader.hpp>
#include <safetar/compression.hpp>
#include <safetar/error.hpp>
#include <safetar/manifest.hpp>
#include <safetar/metadata.hpp>
#include <safetar/policy.hpp>
#include <safetar/walker.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace safetar {

struct create_options {
    std::filesystem::path archive_path;
    std::vector<std::filesystem::path> inputs;
    // Root for relative inputs; the current directory when unset
    std::optional<std::filesystem::path> work_dir;
    compression codec = compression::none;
    // Walk and fingerprint only, write no archive
    bool print_plan = false;
    std::vector<std::string> excludes;
    std::vector<std::filesystem::path> exclude_from;
    std::optional<std::filesystem::path> manifest_out;
    // Headers never carry ownership, these are accepted for tar compatibility
    bool numeric_owner = false;
    bool no_same_owner = false;
};

struct create_result {
    std::vector<planned_entry> plan;
    std::vector<manifest_entry> manifest;
};

struct extract_options {
    std::filesystem::path archive_path;
    std::filesystem::path destination = ".";
    bool strict = false;
    // Verify the extracted tree against this manifest
    std::optional<std::filesystem::path> manifest;
    bool manifest_relaxed = false;
    bool numeric_owner = false;
    bool no_same_owner = false;
};

struct list_options {
    std::filesystem::path archive_path;
};

struct listed_entry {
    manifest_entry entry;
    // PAX records attached to the entry, empty for plain ustar/GNU headers
    pax_records pax;
};

// File, Directory or Symlink. Hard links, contiguous and sparse files and
// unknown types all count as files.
[[nodiscard]] manifest_kind classify_entry(entry_type type) noexcept;

// Open an archive file, transparently decoding gzip, xz or zstd
[[nodiscard]] std::expected<archive_reader, error> open_archive(const std::filesystem::path& path);
[[nodiscard]] std::expected<archive_reader, error> open_archive(std::unique_ptr<input_stream> stream);

[[nodiscard]] std::expected<create_result, error>
create_archive(const create_options& options, const security_policy& policy);

// Returns the manifest of everything materialized. Entries written before a
// failure are left on disk.
[[nodiscard]] std::expected<std::vector<manifest_entry>, error>
extract_archive(const extract_options& options, const security_policy& policy);

// Fingerprint every entry by streaming its content; nothing touches disk
[[nodiscard]] std::expected<std::vector<listed_entry>, error>
list_archive(const list_options& options);

} // namespace safetar
