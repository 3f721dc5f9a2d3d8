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

#include <safetar/header_parser.hpp>
#include <safetar/gnu_tar.hpp>
#include <algorithm>
#include <array>
#include <cstring>
#include <ranges>

namespace safetar::detail {

uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block) {
    uint32_t sum = 0;

    // Create a copy to zero out the checksum field
    std::array<std::byte, BLOCK_SIZE> temp_block{};
    std::ranges::copy(block, temp_block.begin());

    // The checksum field (bytes 148-155) counts as spaces
    auto* header = std::bit_cast<ustar_header*>(temp_block.data());
    std::ranges::fill(std::span{header->checksum}, ' ');

    for (auto byte : temp_block) {
        sum += static_cast<uint8_t>(byte);
    }

    return sum;
}

std::string_view extract_string(std::span<const char> field) {
    const auto null_pos = std::ranges::find(field, '\0');
    const size_t length = null_pos != field.end() ?
        static_cast<size_t>(std::distance(field.begin(), null_pos)) :
        field.size();
    return std::string_view{field.data(), length};
}

bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block) {
    return std::ranges::all_of(block, [](auto b) { return b == std::byte{0}; });
}

auto parse_header(std::span<const std::byte, BLOCK_SIZE> block) -> std::expected<file_metadata, error> {
    const auto* header = std::bit_cast<const ustar_header*>(block.data());

    // Verify magic number for POSIX ustar or GNU tar format
    std::string_view magic = extract_string(std::span{header->magic, 6});
    bool is_ustar = (magic == "ustar");
    bool is_gnu = gnu::is_gnu_tar_magic(magic);

    if (!is_ustar && !is_gnu) {
        return std::unexpected(error{error_code::invalid_header,
            "Not a POSIX ustar or GNU tar archive (magic: '" + std::string{magic} + "')"});
    }

    // Verify version
    std::string_view version = extract_string(std::span{header->version, 2});
    if (version != "00" && version != " ") {  // GNU writes " \0"
        return std::unexpected(error{error_code::invalid_header, "Unsupported tar version"});
    }

    auto stored_checksum = parse_octal(std::span{header->checksum});
    if (!stored_checksum) {
        return std::unexpected(stored_checksum.error());
    }

    uint32_t calculated_checksum = calculate_checksum(block);
    if (calculated_checksum != *stored_checksum) {
        return std::unexpected(error{error_code::corrupt_archive, "Header checksum mismatch"});
    }

    auto mode = parse_octal(std::span{header->mode});
    auto uid = parse_numeric(std::span{header->uid});
    auto gid = parse_numeric(std::span{header->gid});
    auto size = parse_numeric(std::span{header->size});
    auto mtime = parse_numeric(std::span{header->mtime});

    if (!mode || !uid || !gid || !size || !mtime) {
        return std::unexpected(error{error_code::invalid_header, "Failed to parse numeric fields"});
    }

    file_metadata meta;

    // ustar splits long names into prefix + name; GNU uses the prefix
    // area for other fields, so only honour it for ustar
    std::string_view name = extract_string(std::span{header->name});
    std::string_view prefix = is_ustar ? extract_string(std::span{header->prefix}) : std::string_view{};

    if (!prefix.empty()) {
        meta.path = std::string{prefix} + "/" + std::string{name};
    } else {
        meta.path = std::string{name};
    }

    meta.type = static_cast<entry_type>(header->typeflag);
    meta.permissions = static_cast<std::filesystem::perms>(*mode & 07777);
    meta.owner_id = static_cast<uint32_t>(*uid);
    meta.group_id = static_cast<uint32_t>(*gid);
    meta.size = *size;
    meta.modification_time = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(*mtime));

    meta.owner_name = std::string{extract_string(std::span{header->uname})};
    meta.group_name = std::string{extract_string(std::span{header->gname})};

    // Handle links
    if (meta.type == entry_type::symbolic_link || meta.type == entry_type::hard_link) {
        std::string_view linkname = extract_string(std::span{header->linkname});
        if (!linkname.empty()) {
            meta.link_target = std::string{linkname};
        }
    }

    // Unknown type flags are kept as-is; the extraction driver treats
    // them as regular files

    return meta;
}

} // namespace safetar::detail
