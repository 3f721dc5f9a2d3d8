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

#include <safetar/header_writer.hpp>
#include <algorithm>
#include <bit>

namespace safetar::detail {

namespace {

void copy_field(std::span<char> field, std::string_view value) noexcept {
    const size_t length = std::min(field.size(), value.size());
    std::ranges::copy(value.substr(0, length), field.begin());
}

} // anonymous namespace

bool format_octal(std::span<char> field, uint64_t value) noexcept {
    if (field.empty()) {
        return false;
    }

    // Last byte is the terminator
    const size_t digits = field.size() - 1;
    field[digits] = '\0';
    for (size_t i = digits; i-- > 0;) {
        field[i] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
    return value == 0;
}

void format_numeric(std::span<char> field, uint64_t value) noexcept {
    if (format_octal(field, value)) {
        return;
    }

    std::ranges::fill(field, '\0');
    for (size_t i = field.size(); i-- > 1;) {
        field[i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
    field[0] = static_cast<char>(0x80);
}

void seal_checksum(header_block& block) noexcept {
    auto* header = std::bit_cast<ustar_header*>(block.data());
    const uint32_t sum = calculate_checksum(block);

    // Six octal digits, a NUL and a space, as GNU tar writes it
    std::span<char> field{header->checksum};
    format_numeric(field.first(7), sum);
    field[7] = ' ';
}

header_block build_header(
    const std::string_view name,
    const entry_type type,
    const uint32_t mode,
    const uint64_t size,
    const std::string_view link_name
) {
    header_block block{};
    auto* header = std::bit_cast<ustar_header*>(block.data());

    copy_field(header->name, name);
    format_numeric(header->mode, mode);
    format_numeric(header->uid, 0);
    format_numeric(header->gid, 0);
    format_numeric(header->size, size);
    format_numeric(header->mtime, deterministic_mtime);
    header->typeflag = static_cast<char>(type);
    copy_field(header->linkname, link_name);

    // GNU magic: "ustar " followed by " \0"
    copy_field(header->magic, "ustar ");
    header->version[0] = ' ';
    header->version[1] = '\0';

    seal_checksum(block);
    return block;
}

} // namespace safetar::detail
