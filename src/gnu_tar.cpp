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

#include <safetar/gnu_tar.hpp>
#include <safetar/header_parser.hpp>
#include <span>
#include <string>

namespace safetar::gnu {

// Long names are capped well above PATH_MAX; anything bigger is hostile
constexpr size_t max_extension_size = 1024 * 1024;

auto read_gnu_extension_data(
    input_stream &stream,
    const size_t data_size
) -> std::expected<std::string, error> {
    if (data_size == 0) {
        return std::string{};
    }
    if (data_size > max_extension_size) {
        return std::unexpected(error{error_code::corrupt_archive,
            "GNU long name record too large"});
    }

    // The record is stored NUL-terminated and padded to a whole block
    std::string record(data_size + detail::padding_for(data_size), '\0');
    auto bytes = std::as_writable_bytes(std::span{record});
    auto read_result = read_fully(stream, bytes);
    if (!read_result) {
        return std::unexpected(read_result.error());
    }
    if (*read_result != bytes.size()) {
        return std::unexpected(error{error_code::corrupt_archive,
            "truncated GNU long name record"});
    }

    record.resize(data_size);
    if (const auto nul = record.find('\0'); nul != std::string::npos) {
        record.resize(nul);
    }
    return record;
}

void apply_gnu_extensions(file_metadata& metadata, const gnu_extension_data& extensions) {
    if (extensions.has_longname()) {
        metadata.path = extensions.longname;
    }

    if (extensions.has_longlink()) {
        metadata.link_target = extensions.longlink;
    }
}

bool is_gnu_tar_magic(std::string_view magic) {
    // GNU tar writes "ustar " followed by a " \0" version
    return magic == "ustar ";
}

} // namespace safetar::gnu
