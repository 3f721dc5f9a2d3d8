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

#include <safetar/compression.hpp>
#include <spdlog/spdlog.h>
#include <lzma.h>
#include <zlib.h>
#include <zstd.h>
#include <algorithm>
#include <array>
#include <format>
#include <vector>

namespace safetar {

namespace {

constexpr size_t io_chunk_size = 64 * 1024;

constexpr std::array<unsigned char, 2> gzip_magic{0x1F, 0x8B};
constexpr std::array<unsigned char, 6> xz_magic{0xFD, '7', 'z', 'X', 'Z', 0x00};
constexpr std::array<unsigned char, 4> zstd_magic{0x28, 0xB5, 0x2F, 0xFD};

constexpr int gzip_level = Z_DEFAULT_COMPRESSION;
constexpr uint32_t xz_preset = 6;
constexpr int zstd_level = 3;

template<size_t N>
bool starts_with(std::span<const std::byte> data, const std::array<unsigned char, N>& magic) {
    if (data.size() < N) {
        return false;
    }
    return std::ranges::equal(data.first(N), magic,
        [](std::byte b, unsigned char m) { return static_cast<unsigned char>(b) == m; });
}

// Replays the sniffed prefix before handing over to the source
class prefixed_stream : public input_stream {
private:
    std::vector<std::byte> prefix_;
    size_t prefix_pos_ = 0;
    std::unique_ptr<input_stream> source_;

public:
    prefixed_stream(std::vector<std::byte> prefix, std::unique_ptr<input_stream> source)
        : prefix_(std::move(prefix)), source_(std::move(source)) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        if (prefix_pos_ < prefix_.size()) {
            const size_t n = std::min(buffer.size(), prefix_.size() - prefix_pos_);
            std::ranges::copy_n(prefix_.begin() + static_cast<std::ptrdiff_t>(prefix_pos_),
                                static_cast<std::ptrdiff_t>(n), buffer.begin());
            prefix_pos_ += n;
            return n;
        }
        return source_->read(buffer);
    }

    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override {
        const size_t from_prefix = std::min(bytes, prefix_.size() - prefix_pos_);
        prefix_pos_ += from_prefix;
        if (bytes > from_prefix) {
            return source_->skip(bytes - from_prefix);
        }
        return {};
    }

    [[nodiscard]] bool at_end() const override {
        return prefix_pos_ >= prefix_.size() && source_->at_end();
    }
};

// Shared input buffering for the decoders. Subclasses consume
// in_buf_[in_pos_, in_len_) and set done_ when the compressed stream ends.
class decoding_stream : public input_stream {
protected:
    std::unique_ptr<input_stream> source_;
    std::vector<std::byte> in_buf_;
    size_t in_pos_ = 0;
    size_t in_len_ = 0;
    bool source_eof_ = false;
    bool done_ = false;

    [[nodiscard]] size_t in_available() const noexcept { return in_len_ - in_pos_; }

    [[nodiscard]] std::expected<void, error> refill() {
        if (in_available() > 0 || source_eof_) {
            return {};
        }
        auto result = source_->read(in_buf_);
        if (!result) {
            return std::unexpected(result.error());
        }
        in_pos_ = 0;
        in_len_ = *result;
        if (*result == 0) {
            source_eof_ = true;
        }
        return {};
    }

    [[nodiscard]] virtual std::expected<size_t, error> decode(std::span<std::byte> out) = 0;

public:
    explicit decoding_stream(std::unique_ptr<input_stream> source)
        : source_(std::move(source)), in_buf_(io_chunk_size) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        size_t produced = 0;
        while (produced == 0 && !done_ && !buffer.empty()) {
            if (auto filled = refill(); !filled) {
                return std::unexpected(filled.error());
            }
            auto result = decode(buffer);
            if (!result) {
                return std::unexpected(result.error());
            }
            produced = *result;
        }
        return produced;
    }

    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override {
        return skip_by_reading(*this, bytes);
    }

    [[nodiscard]] bool at_end() const override { return done_; }
};

class gzip_decoder : public decoding_stream {
private:
    z_stream strm_{};
    bool member_started_ = false;

public:
    explicit gzip_decoder(std::unique_ptr<input_stream> source)
        : decoding_stream(std::move(source)) {}

    ~gzip_decoder() override { inflateEnd(&strm_); }

    gzip_decoder(const gzip_decoder&) = delete;
    gzip_decoder& operator=(const gzip_decoder&) = delete;

    [[nodiscard]] std::expected<void, error> init() {
        // 16 + MAX_WBITS: expect gzip framing
        if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
            return std::unexpected(error{error_code::io_error, "failed to initialise gzip decoder"});
        }
        return {};
    }

protected:
    [[nodiscard]] std::expected<size_t, error> decode(std::span<std::byte> out) override {
        if (in_available() == 0 && source_eof_) {
            if (member_started_) {
                return std::unexpected(error{error_code::corrupt_archive, "truncated gzip stream"});
            }
            done_ = true;
            return 0;
        }

        strm_.next_in = reinterpret_cast<Bytef*>(in_buf_.data() + in_pos_);
        strm_.avail_in = static_cast<uInt>(in_available());
        strm_.next_out = reinterpret_cast<Bytef*>(out.data());
        strm_.avail_out = static_cast<uInt>(std::min(out.size(), io_chunk_size));
        const uInt out_capacity = strm_.avail_out;

        const int ret = inflate(&strm_, Z_NO_FLUSH);
        in_pos_ = in_len_ - strm_.avail_in;
        const size_t produced = out_capacity - strm_.avail_out;

        switch (ret) {
            case Z_OK:
                member_started_ = true;
                break;
            case Z_STREAM_END:
                // Concatenated members are decoded back to back
                member_started_ = false;
                inflateReset(&strm_);
                break;
            case Z_BUF_ERROR:
                break;
            default:
                return std::unexpected(error{error_code::corrupt_archive,
                    std::format("gzip decode error: {}", strm_.msg ? strm_.msg : "unknown")});
        }
        return produced;
    }
};

class xz_decoder : public decoding_stream {
private:
    lzma_stream strm_ = LZMA_STREAM_INIT;

public:
    explicit xz_decoder(std::unique_ptr<input_stream> source)
        : decoding_stream(std::move(source)) {}

    ~xz_decoder() override { lzma_end(&strm_); }

    xz_decoder(const xz_decoder&) = delete;
    xz_decoder& operator=(const xz_decoder&) = delete;

    [[nodiscard]] std::expected<void, error> init() {
        if (lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
            return std::unexpected(error{error_code::io_error, "failed to initialise xz decoder"});
        }
        return {};
    }

protected:
    [[nodiscard]] std::expected<size_t, error> decode(std::span<std::byte> out) override {
        strm_.next_in = reinterpret_cast<const uint8_t*>(in_buf_.data() + in_pos_);
        strm_.avail_in = in_available();
        strm_.next_out = reinterpret_cast<uint8_t*>(out.data());
        strm_.avail_out = out.size();

        const lzma_action action = source_eof_ ? LZMA_FINISH : LZMA_RUN;
        const lzma_ret ret = lzma_code(&strm_, action);
        in_pos_ = in_len_ - strm_.avail_in;
        const size_t produced = out.size() - strm_.avail_out;

        if (ret == LZMA_STREAM_END) {
            done_ = true;
        } else if (ret == LZMA_BUF_ERROR && source_eof_) {
            return std::unexpected(error{error_code::corrupt_archive, "truncated xz stream"});
        } else if (ret != LZMA_OK && ret != LZMA_BUF_ERROR) {
            return std::unexpected(error{error_code::corrupt_archive,
                std::format("xz decode error (code {})", static_cast<int>(ret))});
        }
        return produced;
    }
};

class zstd_decoder : public decoding_stream {
private:
    struct dctx_deleter {
        void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
    };

    std::unique_ptr<ZSTD_DCtx, dctx_deleter> ctx_;
    size_t last_hint_ = 1;  // 0 once a frame is fully decoded and flushed

public:
    explicit zstd_decoder(std::unique_ptr<input_stream> source)
        : decoding_stream(std::move(source)), ctx_(ZSTD_createDCtx()) {}

    [[nodiscard]] std::expected<void, error> init() const {
        if (!ctx_) {
            return std::unexpected(error{error_code::io_error, "failed to initialise zstd decoder"});
        }
        return {};
    }

protected:
    [[nodiscard]] std::expected<size_t, error> decode(std::span<std::byte> out) override {
        ZSTD_inBuffer in{in_buf_.data() + in_pos_, in_available(), 0};
        ZSTD_outBuffer output{out.data(), out.size(), 0};

        const size_t ret = ZSTD_decompressStream(ctx_.get(), &output, &in);
        if (ZSTD_isError(ret)) {
            return std::unexpected(error{error_code::corrupt_archive,
                std::format("zstd decode error: {}", ZSTD_getErrorName(ret))});
        }
        in_pos_ += in.pos;
        last_hint_ = ret;

        if (output.pos == 0 && in_available() == 0 && source_eof_) {
            if (last_hint_ != 0) {
                return std::unexpected(error{error_code::corrupt_archive, "truncated zstd stream"});
            }
            done_ = true;
        }
        return output.pos;
    }
};

// Shared output buffering for the encoders
class encoding_stream : public output_stream {
protected:
    std::unique_ptr<output_stream> sink_;
    std::vector<std::byte> out_buf_;
    bool finished_ = false;

    [[nodiscard]] std::expected<void, error> flush_out(size_t produced) {
        if (produced == 0) {
            return {};
        }
        return sink_->write(std::span{out_buf_.data(), produced});
    }

    [[nodiscard]] virtual std::expected<void, error> encode(std::span<const std::byte> data, bool final) = 0;

public:
    explicit encoding_stream(std::unique_ptr<output_stream> sink)
        : sink_(std::move(sink)), out_buf_(io_chunk_size) {}

    [[nodiscard]] std::expected<void, error> write(std::span<const std::byte> data) override {
        if (finished_) {
            return std::unexpected(error{error_code::invalid_operation, "Write after finish"});
        }
        if (data.empty()) {
            return {};
        }
        return encode(data, false);
    }

    [[nodiscard]] std::expected<void, error> finish() override {
        if (finished_) {
            return {};
        }
        finished_ = true;
        if (auto result = encode({}, true); !result) {
            return std::unexpected(result.error());
        }
        return sink_->finish();
    }
};

class gzip_encoder : public encoding_stream {
private:
    z_stream strm_{};

public:
    explicit gzip_encoder(std::unique_ptr<output_stream> sink)
        : encoding_stream(std::move(sink)) {}

    ~gzip_encoder() override { deflateEnd(&strm_); }

    gzip_encoder(const gzip_encoder&) = delete;
    gzip_encoder& operator=(const gzip_encoder&) = delete;

    [[nodiscard]] std::expected<void, error> init() {
        if (deflateInit2(&strm_, gzip_level, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            return std::unexpected(error{error_code::io_error, "failed to initialise gzip encoder"});
        }
        return {};
    }

protected:
    [[nodiscard]] std::expected<void, error> encode(std::span<const std::byte> data, const bool final) override {
        strm_.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(data.data()));
        strm_.avail_in = static_cast<uInt>(data.size());
        const int flush = final ? Z_FINISH : Z_NO_FLUSH;

        int ret = Z_OK;
        do {
            strm_.next_out = reinterpret_cast<Bytef*>(out_buf_.data());
            strm_.avail_out = static_cast<uInt>(out_buf_.size());
            ret = deflate(&strm_, flush);
            if (ret == Z_STREAM_ERROR) {
                return std::unexpected(error{error_code::io_error, "gzip encode error"});
            }
            if (auto written = flush_out(out_buf_.size() - strm_.avail_out); !written) {
                return std::unexpected(written.error());
            }
        } while (strm_.avail_out == 0 || (final && ret != Z_STREAM_END));
        return {};
    }
};

class xz_encoder : public encoding_stream {
private:
    lzma_stream strm_ = LZMA_STREAM_INIT;

public:
    explicit xz_encoder(std::unique_ptr<output_stream> sink)
        : encoding_stream(std::move(sink)) {}

    ~xz_encoder() override { lzma_end(&strm_); }

    xz_encoder(const xz_encoder&) = delete;
    xz_encoder& operator=(const xz_encoder&) = delete;

    [[nodiscard]] std::expected<void, error> init() {
        if (lzma_easy_encoder(&strm_, xz_preset, LZMA_CHECK_CRC64) != LZMA_OK) {
            return std::unexpected(error{error_code::io_error, "failed to initialise xz encoder"});
        }
        return {};
    }

protected:
    [[nodiscard]] std::expected<void, error> encode(std::span<const std::byte> data, const bool final) override {
        strm_.next_in = reinterpret_cast<const uint8_t*>(data.data());
        strm_.avail_in = data.size();
        const lzma_action action = final ? LZMA_FINISH : LZMA_RUN;

        while (true) {
            strm_.next_out = reinterpret_cast<uint8_t*>(out_buf_.data());
            strm_.avail_out = out_buf_.size();
            const lzma_ret ret = lzma_code(&strm_, action);
            if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
                return std::unexpected(error{error_code::io_error,
                    std::format("xz encode error (code {})", static_cast<int>(ret))});
            }
            if (auto written = flush_out(out_buf_.size() - strm_.avail_out); !written) {
                return std::unexpected(written.error());
            }
            if (final ? ret == LZMA_STREAM_END : (strm_.avail_in == 0 && strm_.avail_out != 0)) {
                break;
            }
        }
        return {};
    }
};

class zstd_encoder : public encoding_stream {
private:
    struct cctx_deleter {
        void operator()(ZSTD_CCtx* ctx) const { ZSTD_freeCCtx(ctx); }
    };

    std::unique_ptr<ZSTD_CCtx, cctx_deleter> ctx_;

public:
    explicit zstd_encoder(std::unique_ptr<output_stream> sink)
        : encoding_stream(std::move(sink)), ctx_(ZSTD_createCCtx()) {}

    [[nodiscard]] std::expected<void, error> init() {
        if (!ctx_ || ZSTD_isError(ZSTD_CCtx_setParameter(ctx_.get(), ZSTD_c_compressionLevel, zstd_level))) {
            return std::unexpected(error{error_code::io_error, "failed to initialise zstd encoder"});
        }
        return {};
    }

protected:
    [[nodiscard]] std::expected<void, error> encode(std::span<const std::byte> data, const bool final) override {
        ZSTD_inBuffer in{data.data(), data.size(), 0};
        const ZSTD_EndDirective mode = final ? ZSTD_e_end : ZSTD_e_continue;

        bool done = false;
        while (!done) {
            ZSTD_outBuffer out{out_buf_.data(), out_buf_.size(), 0};
            const size_t remaining = ZSTD_compressStream2(ctx_.get(), &out, &in, mode);
            if (ZSTD_isError(remaining)) {
                return std::unexpected(error{error_code::io_error,
                    std::format("zstd encode error: {}", ZSTD_getErrorName(remaining))});
            }
            if (auto written = flush_out(out.pos); !written) {
                return std::unexpected(written.error());
            }
            done = final ? remaining == 0 : in.pos == in.size;
        }
        return {};
    }
};

template<typename Codec, typename Inner>
auto make_codec(Inner inner) -> std::expected<std::unique_ptr<Codec>, error> {
    auto codec = std::make_unique<Codec>(std::move(inner));
    if (auto ready = codec->init(); !ready) {
        return std::unexpected(ready.error());
    }
    return codec;
}

} // anonymous namespace

compression detect_compression(std::span<const std::byte> header) noexcept {
    if (starts_with(header, gzip_magic)) {
        return compression::gzip;
    }
    if (starts_with(header, xz_magic)) {
        return compression::xz;
    }
    if (starts_with(header, zstd_magic)) {
        return compression::zstd;
    }
    return compression::none;
}

std::string_view to_string(const compression codec) noexcept {
    switch (codec) {
        case compression::none: return "none";
        case compression::gzip: return "gzip";
        case compression::xz: return "xz";
        case compression::zstd: return "zstd";
    }
    return "none";
}

compression compression_flags::resolve() const noexcept {
    const int selected = static_cast<int>(gzip) + static_cast<int>(xz) + static_cast<int>(zstd);
    if (selected == 0) {
        return compression::none;
    }
    if (selected > 1) {
        return compression::zstd;
    }
    if (gzip) return compression::gzip;
    if (xz) return compression::xz;
    return compression::zstd;
}

auto wrap_reader(std::unique_ptr<input_stream> source) -> std::expected<std::unique_ptr<input_stream>, error> {
    compression detected = compression::none;
    return wrap_reader(std::move(source), detected);
}

auto wrap_reader(std::unique_ptr<input_stream> source, compression& detected)
    -> std::expected<std::unique_ptr<input_stream>, error> {
    if (!source) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }

    std::vector<std::byte> prefix(compression_magic_size);
    auto sniffed = read_fully(*source, prefix);
    if (!sniffed) {
        return std::unexpected(sniffed.error().with_context("failed to detect archive compression"));
    }
    prefix.resize(*sniffed);
    detected = detect_compression(prefix);
    spdlog::debug("detected {} compression", to_string(detected));

    auto replay = std::make_unique<prefixed_stream>(std::move(prefix), std::move(source));

    switch (detected) {
        case compression::none:
            return replay;
        case compression::gzip:
            return make_codec<gzip_decoder>(std::move(replay));
        case compression::xz:
            return make_codec<xz_decoder>(std::move(replay));
        case compression::zstd:
            return make_codec<zstd_decoder>(std::move(replay));
    }
    return replay;
}

auto wrap_writer(std::unique_ptr<output_stream> sink, const compression codec)
    -> std::expected<std::unique_ptr<output_stream>, error> {
    if (!sink) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }

    switch (codec) {
        case compression::none:
            return sink;
        case compression::gzip:
            return make_codec<gzip_encoder>(std::move(sink));
        case compression::xz:
            return make_codec<xz_encoder>(std::move(sink));
        case compression::zstd:
            return make_codec<zstd_encoder>(std::move(sink));
    }
    return sink;
}

} // namespace safetar
