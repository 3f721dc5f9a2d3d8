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

#include <safetar/stream.hpp>
#include <array>
#include <cstdio>
#include <cerrno>
#include <cstring>

namespace safetar {

auto read_fully(input_stream& stream, std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t total = 0;
    while (total < buffer.size()) {
        auto result = stream.read(buffer.subspan(total));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        total += *result;
    }
    return total;
}

auto skip_by_reading(input_stream& stream, size_t bytes) -> std::expected<void, error> {
    std::array<std::byte, 8192> scratch{};
    while (bytes > 0) {
        const size_t chunk = std::min(bytes, scratch.size());
        auto result = stream.read(std::span{scratch.data(), chunk});
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
        }
        bytes -= *result;
    }
    return {};
}

// file_stream implementation
file_stream::file_stream(std::FILE* file, const std::optional<size_t> size)
    : file_(file), file_size_(size) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file " + path.string() + ": " + std::string{std::strerror(errno)}});
    }

    // Try to get file size
    std::optional<size_t> file_size;
    if (std::fseek(file, 0, SEEK_END) == 0) {
        if (const long pos = std::ftell(file); pos >= 0) {
            file_size = static_cast<size_t>(pos);
        }
        std::fseek(file, 0, SEEK_SET);
    }

    return file_stream{file, file_size};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (bytes_read == 0 && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::io_error,
            "File read error: " + std::string{std::strerror(errno)}});
    }

    return bytes_read;
}

auto file_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (file_size_ && position() + bytes > *file_size_) {
        return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
    }
    if (std::fseek(file_.get(), static_cast<long>(bytes), SEEK_CUR) != 0) {
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

bool file_stream::at_end() const {
    // If we know the file size, check if position equals size
    if (file_size_.has_value()) {
        long pos = std::ftell(file_.get());
        if (pos >= 0) {
            return static_cast<size_t>(pos) >= file_size_.value();
        }
    }

    // Fall back to checking EOF flag
    return std::feof(file_.get()) != 0;
}

size_t file_stream::position() const {
    long pos = std::ftell(file_.get());
    return pos >= 0 ? static_cast<size_t>(pos) : 0;
}

auto file_stream::size() const -> std::optional<size_t> {
    return file_size_;
}

// file_output_stream implementation
file_output_stream::file_output_stream(std::FILE* file, std::filesystem::path path)
    : file_(file), path_(std::move(path)) {}

auto file_output_stream::create(const std::filesystem::path &path) -> std::expected<file_output_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to create file " + path.string() + ": " + std::string{std::strerror(errno)}});
    }
    return file_output_stream{file, path};
}

auto file_output_stream::write(std::span<const std::byte> data) -> std::expected<void, error> {
    if (!file_) {
        return std::unexpected(error{error_code::invalid_operation, "Write after finish"});
    }
    if (data.empty()) {
        return {};
    }
    if (std::fwrite(data.data(), 1, data.size(), file_.get()) != data.size()) {
        return std::unexpected(error{error_code::io_error,
            "File write error on " + path_.string() + ": " + std::string{std::strerror(errno)}});
    }
    return {};
}

auto file_output_stream::finish() -> std::expected<void, error> {
    if (!file_) {
        return {};
    }
    // fclose flushes; report its failure instead of letting the deleter drop it
    std::FILE* file = file_.release();
    if (std::fclose(file) != 0) {
        return std::unexpected(error{error_code::io_error,
            "Failed to close " + path_.string() + ": " + std::string{std::strerror(errno)}});
    }
    return {};
}

} // namespace safetar
