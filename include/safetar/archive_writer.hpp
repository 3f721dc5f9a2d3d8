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
#include <safetar/stream.hpp>
#include <safetar/header_writer.hpp>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>

namespace safetar {

// Sequential tar writer producing GNU-format headers with deterministic
// metadata (see detail::build_header). Entry names are archive-relative
// and are written exactly as given.
class archive_writer {
private:
    std::unique_ptr<output_stream> sink_;
    uint64_t entries_written_ = 0;
    uint64_t bytes_written_ = 0;
    bool finished_ = false;

    [[nodiscard]] std::expected<void, error> write_block(std::span<const std::byte> block);
    [[nodiscard]] std::expected<void, error> write_padding(uint64_t data_size);
    [[nodiscard]] std::expected<void, error> write_long_record(entry_type type, std::string_view value);
    [[nodiscard]] std::expected<void, error> write_header(
        std::string_view name, entry_type type, uint32_t mode, uint64_t size, std::string_view link_name = {});

public:
    explicit archive_writer(std::unique_ptr<output_stream> sink)
        : sink_(std::move(sink)) {}

    [[nodiscard]] static std::expected<archive_writer, error> to_file(const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, error> append_directory(std::string_view name);

    // Stream `source` into the archive. The file must still be `size` bytes
    // long; a file that changed since it was measured is an error.
    [[nodiscard]] std::expected<void, error> append_file(
        std::string_view name, const std::filesystem::path& source, uint64_t size, bool executable);

    [[nodiscard]] std::expected<void, error> append_data(
        std::string_view name, std::span<const std::byte> data, bool executable = false);

    [[nodiscard]] std::expected<void, error> append_symlink(std::string_view name, std::string_view target);

    // Write the end-of-archive marker and finish the sink
    [[nodiscard]] std::expected<void, error> finish();

    [[nodiscard]] uint64_t entries_written() const noexcept { return entries_written_; }
    [[nodiscard]] uint64_t bytes_written() const noexcept { return bytes_written_; }
};

} // namespace safetar
