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
#include <safetar/header_parser.hpp>
#include <safetar/metadata.hpp>
#include <array>
#include <expected>
#include <span>
#include <string_view>

namespace safetar::detail {

// Fixed timestamp stamped on every written header so that identical inputs
// produce identical archives
inline constexpr uint64_t deterministic_mtime = 1153704088;

inline constexpr uint32_t directory_mode = 0755;
inline constexpr uint32_t executable_mode = 0755;
inline constexpr uint32_t file_mode = 0644;
inline constexpr uint32_t symlink_mode = 0777;

using header_block = std::array<std::byte, BLOCK_SIZE>;

// Write `value` as zero-padded octal followed by a NUL. Fails if the value
// does not fit the field.
[[nodiscard]] bool format_octal(std::span<char> field, uint64_t value) noexcept;

// Octal when it fits, GNU base-256 otherwise
void format_numeric(std::span<char> field, uint64_t value) noexcept;

// Compute and store the header checksum
void seal_checksum(header_block& block) noexcept;

// Build a GNU-format header. `name` and `link_name` are truncated to their
// fields; callers emit long-name records first when they do not fit.
[[nodiscard]] header_block build_header(
    std::string_view name,
    entry_type type,
    uint32_t mode,
    uint64_t size,
    std::string_view link_name = {}
);

// Whether `value` needs a ././@LongLink record to be stored intact
[[nodiscard]] constexpr bool needs_long_record(std::string_view value) noexcept {
    return value.size() > sizeof(ustar_header::name);
}

} // namespace safetar::detail
