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

#include <safetar/pax_parser.hpp>
#include <charconv>
#include <algorithm>
#include <format>

namespace safetar::pax {

auto parse_pax_headers(
    const std::span<const std::byte> data) -> std::expected<pax_records, error> {
    pax_records result;

    const auto start = reinterpret_cast<const char*>(data.data());
    const char* end = start + data.size();
    const char* pos = start;

    while (pos < end && *pos != '\0') {
        // Parse length field
        const char* length_start = pos;
        while (pos < end && *pos >= '0' && *pos <= '9') {
            ++pos;
        }

        if (pos == length_start || pos >= end || *pos != ' ') {
            const std::string debug_str(length_start, std::min(pos, end));
            return std::unexpected(error{error_code::invalid_header,
                std::format("Invalid PAX header length field, found: '{}'", debug_str)});
        }

        size_t length;
        auto result_code = std::from_chars(length_start, pos, length);
        if (result_code.ec != std::errc{}) {
            return std::unexpected(error{error_code::invalid_header, "Failed to parse PAX header length"});
        }

        // The record must at least hold its own length field and the space
        const auto header_length = static_cast<size_t>(pos - length_start) + 1;
        if (length <= header_length) {
            return std::unexpected(error{error_code::invalid_header, "PAX header record length too small"});
        }

        ++pos; // Skip space

        const char* record_start = length_start;
        if (length > static_cast<size_t>(end - record_start)) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header record extends beyond data"});
        }
        const char* record_end = record_start + length;

        const char* key_start = pos;

        // Skip the newline at the end when looking for '='
        const char* value_end = record_end;
        if (value_end > key_start && *(value_end - 1) == '\n') {
            --value_end;
        }

        const char* equals_pos = std::find(key_start, value_end, '=');

        if (equals_pos == value_end) {
            return std::unexpected(error{error_code::invalid_header, "PAX header missing '=' separator"});
        }

        result[std::string(key_start, equals_pos)] = std::string(equals_pos + 1, value_end);

        pos = record_end;
    }

    return result;
}

auto apply_pax_records(file_metadata& metadata, const pax_records& records) -> std::expected<void, error> {
    if (auto path_it = records.find("path"); path_it != records.end()) {
        metadata.path = path_it->second;
    }
    if (auto link_it = records.find("linkpath"); link_it != records.end()) {
        metadata.link_target = link_it->second;
    }
    if (auto size_it = records.find("size"); size_it != records.end()) {
        uint64_t pax_size = 0;
        const auto& text = size_it->second;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pax_size);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::unexpected(error{error_code::invalid_header,
                std::format("Invalid PAX size value: '{}'", text)});
        }
        metadata.size = pax_size;
    }
    if (auto mtime_it = records.find("mtime"); mtime_it != records.end()) {
        // Fractional seconds are dropped
        int64_t seconds = 0;
        const auto& text = mtime_it->second;
        if (std::from_chars(text.data(), text.data() + text.size(), seconds).ec == std::errc{}) {
            metadata.modification_time = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(seconds));
        }
    }

    metadata.pax = records;
    return {};
}

} // namespace safetar::pax
