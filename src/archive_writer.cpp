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

#include <safetar/archive_writer.hpp>
#include <safetar/gnu_tar.hpp>
#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace safetar {

namespace {

constexpr std::array<std::byte, detail::BLOCK_SIZE> zero_block{};

} // anonymous namespace

auto archive_writer::to_file(const std::filesystem::path &path) -> std::expected<archive_writer, error> {
    auto stream = file_output_stream::create(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    return archive_writer{std::make_unique<file_output_stream>(std::move(*stream))};
}

auto archive_writer::write_block(std::span<const std::byte> block) -> std::expected<void, error> {
    if (finished_) {
        return std::unexpected(error{error_code::invalid_operation, "Archive already finished"});
    }
    auto result = sink_->write(block);
    if (result) {
        bytes_written_ += block.size();
    }
    return result;
}

auto archive_writer::write_padding(const uint64_t data_size) -> std::expected<void, error> {
    if (const size_t padding = detail::padding_for(data_size); padding > 0) {
        return write_block(std::span{zero_block}.first(padding));
    }
    return {};
}

auto archive_writer::write_long_record(const entry_type type, const std::string_view value) -> std::expected<void, error> {
    // GNU stores the value NUL-terminated, the size counts the terminator
    std::string data{value};
    data.push_back('\0');

    const auto header = detail::build_header(gnu::longlink_name, type, detail::file_mode, data.size());
    if (auto result = write_block(header); !result) {
        return result;
    }
    if (auto result = write_block(std::as_bytes(std::span{data})); !result) {
        return result;
    }
    return write_padding(data.size());
}

auto archive_writer::write_header(
    const std::string_view name,
    const entry_type type,
    const uint32_t mode,
    const uint64_t size,
    const std::string_view link_name
) -> std::expected<void, error> {
    if (name.empty()) {
        return std::unexpected(error{error_code::empty_path, "Refusing to write an entry with an empty name"});
    }
    if (detail::needs_long_record(link_name)) {
        if (auto result = write_long_record(entry_type::gnu_longlink, link_name); !result) {
            return result;
        }
    }
    if (detail::needs_long_record(name)) {
        if (auto result = write_long_record(entry_type::gnu_longname, name); !result) {
            return result;
        }
    }

    const auto header = detail::build_header(name, type, mode, size, link_name);
    if (auto result = write_block(header); !result) {
        return result;
    }
    ++entries_written_;
    return {};
}

auto archive_writer::append_directory(const std::string_view name) -> std::expected<void, error> {
    std::string dir_name{name};
    if (!dir_name.ends_with('/')) {
        dir_name.push_back('/');
    }
    return write_header(dir_name, entry_type::directory, detail::directory_mode, 0);
}

auto archive_writer::append_file(
    const std::string_view name,
    const std::filesystem::path &source,
    const uint64_t size,
    const bool executable
) -> std::expected<void, error> {
    auto input = file_stream::open(source);
    if (!input) {
        return std::unexpected(input.error());
    }

    const uint32_t mode = executable ? detail::executable_mode : detail::file_mode;
    if (auto result = write_header(name, entry_type::regular_file, mode, size); !result) {
        return result;
    }

    std::vector<std::byte> buffer(64 * 1024);
    uint64_t copied = 0;
    while (copied < size) {
        const auto want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), size - copied));
        auto got = read_fully(*input, std::span{buffer.data(), want});
        if (!got) {
            return std::unexpected(got.error().with_context(source.string()));
        }
        if (*got != want) {
            return std::unexpected(error{error_code::io_error,
                "File shrank while being archived: " + source.string()});
        }
        if (auto result = write_block(std::span{buffer.data(), *got}); !result) {
            return result;
        }
        copied += *got;
    }

    std::array<std::byte, 1> probe{};
    auto extra = input->read(probe);
    if (!extra) {
        return std::unexpected(extra.error().with_context(source.string()));
    }
    if (*extra != 0) {
        return std::unexpected(error{error_code::io_error,
            "File grew while being archived: " + source.string()});
    }

    return write_padding(size);
}

auto archive_writer::append_data(
    const std::string_view name,
    const std::span<const std::byte> data,
    const bool executable
) -> std::expected<void, error> {
    const uint32_t mode = executable ? detail::executable_mode : detail::file_mode;
    if (auto result = write_header(name, entry_type::regular_file, mode, data.size()); !result) {
        return result;
    }
    if (auto result = write_block(data); !result) {
        return result;
    }
    return write_padding(data.size());
}

auto archive_writer::append_symlink(const std::string_view name, const std::string_view target) -> std::expected<void, error> {
    return write_header(name, entry_type::symbolic_link, detail::symlink_mode, 0, target);
}

auto archive_writer::finish() -> std::expected<void, error> {
    // Two zero blocks mark the end of the archive
    for (int i = 0; i < 2; ++i) {
        if (auto result = write_block(zero_block); !result) {
            return result;
        }
    }
    finished_ = true;
    return sink_->finish();
}

} // namespace safetar
