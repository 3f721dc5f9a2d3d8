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

#include <safetar/manifest.hpp>
#include <safetar/digest.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <format>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <system_error>
#include <thread>

namespace safetar {

namespace {

std::expected<manifest_entry, error> fingerprint(const manifest_item& item) {
    const auto path = item.relative.string();

    switch (item.kind) {
        case manifest_kind::file: {
            auto digest = sha256_file(item.absolute);
            if (!digest) {
                return std::unexpected(digest.error());
            }
            return manifest_entry{path, item.size, std::move(*digest), manifest_kind::file, std::nullopt, item.mtime};
        }
        case manifest_kind::directory:
            return manifest_entry::for_directory(path, item.mtime);
        case manifest_kind::symlink: {
            manifest_entry entry = manifest_entry::for_symlink(path, item.link_target.value_or(""), item.mtime);
            entry.target = item.link_target;
            return entry;
        }
    }
    return std::unexpected(error{error_code::invalid_operation, "Unknown manifest kind"});
}

std::map<std::string_view, const manifest_entry*> index_by_path(std::span<const manifest_entry> entries) {
    std::map<std::string_view, const manifest_entry*> index;
    for (const auto& entry : entries) {
        index[entry.path] = &entry;
    }
    return index;
}

Json::Value to_json(const manifest_entry& entry) {
    Json::Value value{Json::objectValue};
    value["path"] = entry.path;
    value["size"] = Json::UInt64{entry.size};
    value["sha256"] = entry.sha256;
    value["kind"] = std::string{to_string(entry.kind)};
    value["target"] = entry.target ? Json::Value{*entry.target} : Json::Value{Json::nullValue};
    value["mtime"] = entry.mtime ? Json::Value{Json::UInt64{*entry.mtime}} : Json::Value{Json::nullValue};
    return value;
}

std::expected<manifest_entry, error> from_json(const Json::Value& value, const Json::ArrayIndex index) {
    const auto invalid = [index](std::string_view what) {
        return std::unexpected(error{error_code::io_error,
            std::format("failed to decode manifest entry {}: {}", index, what)});
    };

    if (!value.isObject()) {
        return invalid("not an object");
    }

    const auto& path = value["path"];
    const auto& size = value["size"];
    const auto& sha256 = value["sha256"];
    const auto& kind = value["kind"];
    if (!path.isString() || !size.isUInt64() || !sha256.isString() || !kind.isString()) {
        return invalid("missing or mistyped field");
    }

    manifest_entry entry;
    entry.path = path.asString();
    entry.size = size.asUInt64();
    entry.sha256 = sha256.asString();

    auto parsed_kind = manifest_kind_from_string(kind.asString());
    if (!parsed_kind) {
        return invalid("unknown kind " + kind.asString());
    }
    entry.kind = *parsed_kind;

    if (const auto& target = value["target"]; target.isString()) {
        entry.target = target.asString();
    } else if (!target.isNull()) {
        return invalid("target must be a string or null");
    }

    if (const auto& mtime = value["mtime"]; mtime.isUInt64()) {
        entry.mtime = mtime.asUInt64();
    } else if (!mtime.isNull()) {
        return invalid("mtime must be an unsigned integer or null");
    }

    return entry;
}

} // anonymous namespace

std::string_view to_string(const manifest_kind kind) noexcept {
    switch (kind) {
        case manifest_kind::file: return "File";
        case manifest_kind::directory: return "Directory";
        case manifest_kind::symlink: return "Symlink";
    }
    return "File";
}

std::optional<manifest_kind> manifest_kind_from_string(const std::string_view text) noexcept {
    if (text == "File") return manifest_kind::file;
    if (text == "Directory") return manifest_kind::directory;
    if (text == "Symlink") return manifest_kind::symlink;
    return std::nullopt;
}

manifest_entry manifest_entry::for_directory(std::string path, std::optional<uint64_t> mtime) {
    return manifest_entry{std::move(path), 0, sha256_hex(std::string_view{}), manifest_kind::directory, std::nullopt, mtime};
}

manifest_entry manifest_entry::for_symlink(std::string path, std::string target, std::optional<uint64_t> mtime) {
    auto digest = sha256_hex(std::string_view{target});
    return manifest_entry{std::move(path), 0, std::move(digest), manifest_kind::symlink, std::move(target), mtime};
}

auto collect_manifest(
    std::span<const manifest_item> items,
    const size_t max_workers
) -> std::expected<std::vector<manifest_entry>, error> {
    // Each slot is written by exactly one worker
    std::vector<std::optional<std::expected<manifest_entry, error>>> results(items.size());
    std::atomic<size_t> next_index{0};

    const auto worker = [&] {
        for (size_t i = next_index++; i < items.size(); i = next_index++) {
            results[i] = fingerprint(items[i]);
        }
    };

    const size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    const size_t wanted = std::min(max_workers == 0 ? hardware : max_workers, items.size());

    // The calling thread is one of the workers, so running out of threads
    // only slows fingerprinting down
    std::vector<std::thread> helpers;
    if (wanted > 1) {
        helpers.reserve(wanted - 1);
    }
    while (helpers.size() + 1 < wanted) {
        try {
            helpers.emplace_back(worker);
        } catch (const std::system_error& e) {
            spdlog::warn("fingerprinting with {} threads: {}", helpers.size() + 1, e.what());
            break;
        }
    }
    worker();
    for (auto& thread : helpers) {
        thread.join();
    }
    const size_t worker_count = helpers.size() + 1;

    std::vector<manifest_entry> entries;
    entries.reserve(items.size());
    for (auto& result : results) {
        if (!*result) {
            return std::unexpected(result->error());
        }
        entries.push_back(std::move(**result));
    }

    std::ranges::sort(entries, {}, &manifest_entry::path);
    spdlog::debug("fingerprinted {} entries on {} workers", entries.size(), worker_count);
    return entries;
}

auto verify_manifest(
    std::span<const manifest_entry> expected,
    std::span<const manifest_entry> actual,
    const bool relaxed
) -> std::expected<void, error> {
    const auto expected_index = index_by_path(expected);
    const auto actual_index = index_by_path(actual);

    for (const auto& [path, entry] : expected_index) {
        const auto found = actual_index.find(path);
        if (found == actual_index.end()) {
            return std::unexpected(error{error_code::missing_entry,
                std::format("manifest missing entry: {}", path)});
        }
        if (entry->sha256 != found->second->sha256 || entry->kind != found->second->kind) {
            return std::unexpected(error{error_code::manifest_mismatch,
                std::format("manifest entry mismatch for {}: expected {}, actual {}",
                            path, entry->sha256, found->second->sha256)});
        }
    }

    if (!relaxed) {
        for (const auto& [path, entry] : actual_index) {
            if (!expected_index.contains(path)) {
                return std::unexpected(error{error_code::unexpected_entry,
                    std::format("manifest contains unexpected entry: {}", path)});
            }
        }
    }

    return {};
}

std::string manifest_to_json(std::span<const manifest_entry> entries) {
    Json::Value array{Json::arrayValue};
    for (const auto& entry : entries) {
        array.append(to_json(entry));
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, array);
}

auto manifest_from_json(std::string_view json) -> std::expected<std::vector<manifest_entry>, error> {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        return std::unexpected(error{error_code::io_error, "failed to decode manifest: " + errors});
    }
    if (!root.isArray()) {
        return std::unexpected(error{error_code::io_error, "failed to decode manifest: expected a JSON array"});
    }

    std::vector<manifest_entry> entries;
    entries.reserve(root.size());
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        auto entry = from_json(root[i], i);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}

auto write_manifest_json(
    std::span<const manifest_entry> entries,
    const std::filesystem::path &path
) -> std::expected<void, error> {
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    if (!out) {
        return std::unexpected(error{error_code::io_error, "failed to create manifest " + path.string()});
    }
    out << manifest_to_json(entries);
    out.close();
    if (!out) {
        return std::unexpected(error{error_code::io_error, "failed to write manifest " + path.string()});
    }
    return {};
}

auto read_manifest_json(const std::filesystem::path &path) -> std::expected<std::vector<manifest_entry>, error> {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        return std::unexpected(error{error_code::io_error, "failed to open manifest " + path.string()});
    }
    std::ostringstream content;
    content << in.rdbuf();

    auto entries = manifest_from_json(content.str());
    if (!entries) {
        return std::unexpected(entries.error().with_context(path.string()));
    }
    return entries;
}

} // namespace safetar
