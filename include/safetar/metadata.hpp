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

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace safetar {

// Typeflag byte of a header block
enum class entry_type : char {
    // Materialized on extraction
    regular_file = '0',
    regular_file_old = '\0',
    contiguous_file = '7',
    hard_link = '1',
    symbolic_link = '2',
    directory = '5',
    // Never materialized
    character_device = '3',
    block_device = '4',
    fifo = '6',
    // Records that describe the next entry or the whole archive
    pax_extended_header = 'x',
    pax_global_header = 'g',
    gnu_longname = 'L',
    gnu_longlink = 'K',
    // Stored bytes extracted as-is
    gnu_sparse = 'S',
    // Skipped with their data
    gnu_volhdr = 'V',
    gnu_multivol = 'M'
};

using pax_records = std::map<std::string, std::string>;

// One decoded header, after GNU and PAX overrides were applied.
// `path` and `link_target` are untrusted archive bytes until normalized.
struct file_metadata {
    std::string path;
    entry_type type = entry_type::regular_file;
    uint64_t size = 0;
    std::filesystem::perms permissions = std::filesystem::perms::owner_read;
    std::optional<std::string> link_target;

    // Ownership is reported but never restored
    uint32_t owner_id = 0;
    uint32_t group_id = 0;
    std::string owner_name;
    std::string group_name;

    std::chrono::system_clock::time_point modification_time;

    pax_records pax;

    [[nodiscard]] bool is_regular_file() const noexcept {
        switch (type) {
        case entry_type::regular_file:
        case entry_type::regular_file_old:
        case entry_type::contiguous_file:
            return true;
        default:
            return false;
        }
    }

    [[nodiscard]] bool is_directory() const noexcept { return type == entry_type::directory; }
    [[nodiscard]] bool is_symbolic_link() const noexcept { return type == entry_type::symbolic_link; }
    [[nodiscard]] bool is_hard_link() const noexcept { return type == entry_type::hard_link; }
    [[nodiscard]] bool is_gnu_longname() const noexcept { return type == entry_type::gnu_longname; }
    [[nodiscard]] bool is_gnu_longlink() const noexcept { return type == entry_type::gnu_longlink; }

    // GNU records that are not archive members of their own
    [[nodiscard]] bool is_gnu_pseudo_entry() const noexcept {
        switch (type) {
        case entry_type::gnu_longname:
        case entry_type::gnu_longlink:
        case entry_type::gnu_volhdr:
        case entry_type::gnu_multivol:
            return true;
        default:
            return false;
        }
    }

    [[nodiscard]] bool is_pax_record() const noexcept {
        return type == entry_type::pax_extended_header || type == entry_type::pax_global_header;
    }

    [[nodiscard]] int64_t mtime_seconds() const noexcept {
        using std::chrono::seconds;
        return std::chrono::duration_cast<seconds>(modification_time.time_since_epoch()).count();
    }
};

// On-disk header block. GNU archives store "ustar " and " \0" in magic and
// version, POSIX ones "ustar\0" and "00".
struct ustar_header {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char checksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};

static_assert(sizeof(ustar_header) == 512);

} // namespace safetar
