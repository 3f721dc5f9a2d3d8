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

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <safetar/compression.hpp>
#include <safetar/stream.hpp>
#include "test_helpers.hpp"

using namespace safetar;
using namespace safetar::testing;

namespace {

std::vector<std::byte> create_test_data(size_t size) {
    std::vector<std::byte> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>(i % 256);
    }
    return data;
}

// Sink that leaves its bytes with the test after the codec finishes it
class shared_sink : public output_stream {
    std::vector<std::byte>& out_;

public:
    explicit shared_sink(std::vector<std::byte>& out) : out_(out) {}

    std::expected<void, error> write(std::span<const std::byte> data) override {
        out_.insert(out_.end(), data.begin(), data.end());
        return {};
    }

    std::expected<void, error> finish() override { return {}; }
};

// Hands out at most `step` bytes per read, like a pipe or decoder would
class trickle_stream : public input_stream {
    std::vector<std::byte> data_;
    size_t position_ = 0;
    size_t step_;

public:
    trickle_stream(std::vector<std::byte> data, size_t step) : data_(std::move(data)), step_(step) {}

    std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        const size_t n = std::min({buffer.size(), step_, data_.size() - position_});
        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                            static_cast<std::ptrdiff_t>(n), buffer.begin());
        position_ += n;
        return n;
    }

    std::expected<void, error> skip(size_t bytes) override {
        return skip_by_reading(*this, bytes);
    }

    bool at_end() const override { return position_ >= data_.size(); }
};

std::vector<std::byte> drain(input_stream& stream) {
    std::vector<std::byte> out;
    std::array<std::byte, 4096> buffer{};
    while (true) {
        auto n = stream.read(buffer);
        REQUIRE(n.has_value());
        if (*n == 0) {
            break;
        }
        out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(*n));
    }
    return out;
}

} // anonymous namespace

TEST_CASE("memory_stream basic operations", "[unit][stream]") {
    auto data = create_test_data(1000);
    memory_stream stream{data};

    SECTION("Initial state") {
        CHECK_FALSE(stream.at_end());
        CHECK(stream.position() == 0);
    }

    SECTION("Read beyond available data") {
        std::vector<std::byte> buffer(2000);
        auto result = stream.read(buffer);
        REQUIRE(result.has_value());
        CHECK(*result == 1000);
        CHECK(stream.at_end());

        auto again = stream.read(buffer);
        REQUIRE(again.has_value());
        CHECK(*again == 0);
    }

    SECTION("Skip") {
        REQUIRE(stream.skip(600).has_value());
        CHECK(stream.position() == 600);

        std::array<std::byte, 1> one{};
        auto result = stream.read(one);
        REQUIRE(result.has_value());
        CHECK(one[0] == static_cast<std::byte>(600 % 256));

        auto past = stream.skip(1000);
        REQUIRE_FALSE(past.has_value());
        CHECK(past.error().code() == error_code::io_error);
    }
}

TEST_CASE("read_fully gathers short reads", "[unit][stream]") {
    trickle_stream stream{create_test_data(1000), 7};

    std::vector<std::byte> buffer(512);
    auto first = read_fully(stream, buffer);
    REQUIRE(first.has_value());
    CHECK(*first == 512);
    CHECK(buffer[511] == static_cast<std::byte>(511 % 256));

    auto second = read_fully(stream, buffer);
    REQUIRE(second.has_value());
    CHECK(*second == 488);

    auto third = read_fully(stream, buffer);
    REQUIRE(third.has_value());
    CHECK(*third == 0);
}

TEST_CASE("skip_by_reading", "[unit][stream]") {
    trickle_stream stream{create_test_data(100), 3};
    REQUIRE(skip_by_reading(stream, 50).has_value());

    std::array<std::byte, 1> one{};
    REQUIRE(stream.read(one).has_value());
    CHECK(one[0] == std::byte{50});

    auto past = skip_by_reading(stream, 100);
    REQUIRE_FALSE(past.has_value());
    CHECK(past.error().code() == error_code::io_error);
}

TEST_CASE("file_stream operations", "[unit][stream]") {
    TempDirectory temp;
    const auto path = temp.path() / "data.bin";
    const auto data = create_test_data(3000);
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    auto stream = file_stream::open(path);
    REQUIRE(stream.has_value());
    CHECK(stream->size() == 3000);
    CHECK_FALSE(stream->at_end());

    REQUIRE(stream->skip(1000).has_value());
    CHECK(stream->position() == 1000);

    std::vector<std::byte> buffer(5000);
    auto result = stream->read(buffer);
    REQUIRE(result.has_value());
    CHECK(*result == 2000);
    CHECK(buffer[0] == static_cast<std::byte>(1000 % 256));
    CHECK(stream->at_end());

    CHECK_FALSE(stream->skip(1).has_value());
}

TEST_CASE("file_stream error handling", "[unit][stream]") {
    TempDirectory temp;

    auto missing = file_stream::open(temp.path() / "missing.bin");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == error_code::io_error);
    CHECK(missing.error().message().find("missing.bin") != std::string::npos);
}

TEST_CASE("file_output_stream", "[unit][stream]") {
    TempDirectory temp;
    const auto path = temp.path() / "out.bin";

    auto sink = file_output_stream::create(path);
    REQUIRE(sink.has_value());
    REQUIRE(sink->write(to_bytes("hello ")).has_value());
    REQUIRE(sink->write(to_bytes("world")).has_value());
    REQUIRE(sink->finish().has_value());

    CHECK(read_file_content(path) == "hello world");

    auto after = sink->write(to_bytes("!"));
    REQUIRE_FALSE(after.has_value());
    CHECK(after.error().code() == error_code::invalid_operation);

    auto bad = file_output_stream::create(temp.path() / "no/such/dir/out.bin");
    CHECK_FALSE(bad.has_value());
}

TEST_CASE("memory_output_stream", "[unit][stream]") {
    memory_output_stream sink;
    REQUIRE(sink.write(to_bytes("abc")).has_value());
    REQUIRE(sink.write(to_bytes("def")).has_value());
    REQUIRE(sink.finish().has_value());
    CHECK(sink.data().size() == 6);

    auto bytes = sink.take();
    CHECK(bytes == to_bytes("abcdef"));
}

TEST_CASE("Compression detection", "[unit][compression]") {
    CHECK(detect_compression(to_bytes("\x1f\x8b\x08\x00")) == compression::gzip);
    CHECK(detect_compression(to_bytes(std::string{"\xfd" "7zXZ", 5} + '\0')) == compression::xz);
    CHECK(detect_compression(to_bytes("\x28\xb5\x2f\xfd")) == compression::zstd);
    CHECK(detect_compression(to_bytes("ustar")) == compression::none);
    CHECK(detect_compression(to_bytes("\x1f")) == compression::none);
    CHECK(detect_compression({}) == compression::none);
}

TEST_CASE("Codec flag resolution", "[unit][compression]") {
    CHECK(compression_flags{}.resolve() == compression::none);
    CHECK(compression_flags{true, false, false}.resolve() == compression::gzip);
    CHECK(compression_flags{false, true, false}.resolve() == compression::xz);
    CHECK(compression_flags{false, false, true}.resolve() == compression::zstd);
    CHECK(compression_flags{true, true, false}.resolve() == compression::zstd);
    CHECK(compression_flags{true, true, true}.resolve() == compression::zstd);
}

TEST_CASE("Codecs round trip through the stream wrappers", "[unit][compression]") {
    const auto codec = GENERATE(compression::none, compression::gzip, compression::xz, compression::zstd);
    CAPTURE(to_string(codec));

    const auto data = create_test_data(300'000);
    std::vector<std::byte> encoded;

    auto writer = wrap_writer(std::make_unique<shared_sink>(encoded), codec);
    REQUIRE(writer.has_value());
    // Uneven writes exercise the encoder's buffering
    REQUIRE((*writer)->write(std::span{data}.first(1)).has_value());
    REQUIRE((*writer)->write(std::span{data}.subspan(1, 70'000)).has_value());
    REQUIRE((*writer)->write(std::span{data}.subspan(70'001)).has_value());
    REQUIRE((*writer)->finish().has_value());

    if (codec == compression::none) {
        CHECK(encoded == data);
    } else {
        CHECK(encoded.size() < data.size());
    }

    compression detected = compression::none;
    auto reader = wrap_reader(std::make_unique<trickle_stream>(encoded, 4093), detected);
    REQUIRE(reader.has_value());
    CHECK(detected == codec);
    CHECK(drain(**reader) == data);
}

TEST_CASE("Corrupt compressed input is an error", "[unit][compression]") {
    const auto codec = GENERATE(compression::gzip, compression::xz, compression::zstd);
    CAPTURE(to_string(codec));

    const auto data = create_test_data(50'000);
    std::vector<std::byte> encoded;
    auto writer = wrap_writer(std::make_unique<shared_sink>(encoded), codec);
    REQUIRE(writer.has_value());
    REQUIRE((*writer)->write(data).has_value());
    REQUIRE((*writer)->finish().has_value());

    // Drop the tail so the stream ends mid-frame
    encoded.resize(encoded.size() / 2);

    auto reader = wrap_reader(std::make_unique<buffer_stream>(encoded));
    REQUIRE(reader.has_value());

    std::array<std::byte, 4096> buffer{};
    std::expected<size_t, error> result = size_t{0};
    do {
        result = (*reader)->read(buffer);
    } while (result && *result > 0);
    REQUIRE_FALSE(result.has_value());
}

TEST_CASE("Null streams are rejected", "[unit][compression]") {
    CHECK_FALSE(wrap_reader(nullptr).has_value());
    CHECK_FALSE(wrap_writer(nullptr, compression::gzip).has_value());
}
