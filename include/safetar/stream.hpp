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
#include <expected>
#include <span>
#include <memory>
#include <filesystem>
#include <algorithm>
#include <ranges>
#include <optional>
#include <vector>
#include <cstdio>

namespace safetar {

// Base interface for reading data streams
class input_stream {
public:
    virtual ~input_stream() = default;

    // Read up to buffer.size() bytes into buffer, returns actual bytes read
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    // Skip n bytes in the stream
    [[nodiscard]] virtual std::expected<void, error> skip(size_t bytes) = 0;

    // Check if at end of stream
    [[nodiscard]] virtual bool at_end() const = 0;
};

// Base interface for writing data streams
class output_stream {
public:
    virtual ~output_stream() = default;

    [[nodiscard]] virtual std::expected<void, error> write(std::span<const std::byte> data) = 0;

    // Flush everything buffered (and any codec trailer) to the underlying sink
    [[nodiscard]] virtual std::expected<void, error> finish() = 0;
};

// Keep reading until the buffer is full or the stream is exhausted.
// Decoding streams may return short reads in the middle of the data.
[[nodiscard]] std::expected<size_t, error> read_fully(input_stream& stream, std::span<std::byte> buffer);

// Skip by reading and discarding, for streams that cannot seek
[[nodiscard]] std::expected<void, error> skip_by_reading(input_stream& stream, size_t bytes);

// In-memory stream over borrowed bytes
class memory_stream : public input_stream {
private:
    std::span<const std::byte> data_;
    size_t position_ = 0;

public:
    explicit memory_stream(std::span<const std::byte> data)
        : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        size_t available = data_.size() - position_;
        size_t to_read = std::min(buffer.size(), available);

        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                           static_cast<std::ptrdiff_t>(to_read), buffer.begin());
        position_ += to_read;

        return to_read;
    }

    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override {
        if (position_ + bytes > data_.size()) {
            return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
        }
        position_ += bytes;
        return {};
    }

    [[nodiscard]] bool at_end() const override {
        return position_ >= data_.size();
    }

    [[nodiscard]] size_t position() const noexcept { return position_; }
};

// Owning variant of memory_stream, used when the bytes must outlive the caller
class buffer_stream : public input_stream {
private:
    std::vector<std::byte> data_;
    memory_stream view_;

public:
    explicit buffer_stream(std::vector<std::byte> data)
        : data_(std::move(data)), view_(std::span<const std::byte>{data_}) {}

    buffer_stream(const buffer_stream&) = delete;
    buffer_stream& operator=(const buffer_stream&) = delete;

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        return view_.read(buffer);
    }
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override { return view_.skip(bytes); }
    [[nodiscard]] bool at_end() const override { return view_.at_end(); }
};

// File-based input stream
class file_stream : public input_stream {
private:
    struct file_deleter {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, file_deleter> file_;
    std::optional<size_t> file_size_;

public:
    [[nodiscard]] static std::expected<file_stream, error> open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override;
    [[nodiscard]] bool at_end() const override;
    [[nodiscard]] size_t position() const;
    [[nodiscard]] std::optional<size_t> size() const;

private:
    explicit file_stream(std::FILE* file, std::optional<size_t> size);
};

// File-based output stream; the file is created or truncated
class file_output_stream : public output_stream {
private:
    struct file_deleter {
        void operator()(std::FILE* f) const {
            if (f) std::fclose(f);
        }
    };

    std::unique_ptr<std::FILE, file_deleter> file_;
    std::filesystem::path path_;

public:
    [[nodiscard]] static std::expected<file_output_stream, error> create(const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, error> write(std::span<const std::byte> data) override;
    [[nodiscard]] std::expected<void, error> finish() override;

private:
    file_output_stream(std::FILE* file, std::filesystem::path path);
};

// Growable in-memory sink
class memory_output_stream : public output_stream {
private:
    std::vector<std::byte> data_;

public:
    [[nodiscard]] std::expected<void, error> write(std::span<const std::byte> data) override {
        data_.insert(data_.end(), data.begin(), data.end());
        return {};
    }

    [[nodiscard]] std::expected<void, error> finish() override { return {}; }

    [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return data_; }
    [[nodiscard]] std::vector<std::byte> take() noexcept { return std::move(data_); }
};

} // namespace safetar
