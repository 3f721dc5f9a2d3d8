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
#include <safetar/metadata.hpp>
#include <expected>
#include <span>

namespace safetar::pax {

// Parse PAX extended header format
// : "length key=value\n"
// Example: "25 path=long/file/name.txt\n"
[[nodiscard]] std::expected<pax_records, error>
parse_pax_headers(std::span<const std::byte> data);

// Apply the standard overrides (path, linkpath, size) to a header's metadata
// and remember every record on it
[[nodiscard]] std::expected<void, error>
apply_pax_records(file_metadata& metadata, const pax_records& records);

} // namespace safetar::pax
