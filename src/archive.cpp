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

#include <safetar/archive.hpp>
#include <safetar/archive_writer.hpp>
#include <safetar/digest.hpp>
#include <spdlog/spdlog.h>

namespace safetar {

namespace {

std::optional<uint64_t> header_mtime(const file_metadata& meta) {
    const auto seconds = meta.mtime_seconds();
    if (seconds < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(seconds);
}

std::expected<std::filesystem::path, error> resolve_base(const std::optional<std::filesystem::path>& work_dir) {
    std::error_code ec;
    const auto base = work_dir ? *work_dir : std::filesystem::current_path(ec);
    if (ec) {
        return std::unexpected(io_failure("failed to read current directory", ec));
    }
    auto canonical = std::filesystem::canonical(base, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to canonicalize " + base.string(), ec));
    }
    return canonical;
}

std::expected<std::filesystem::path, error> canonicalize_input(
    const std::filesystem::path& base, const std::filesystem::path& input) {
    const auto joined = input.is_absolute() ? input : base / input;
    std::error_code ec;
    auto canonical = std::filesystem::canonical(joined, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        return std::unexpected(error{error_code::user_input,
            "input path does not exist: " + joined.string()});
    }
    if (ec) {
        return std::unexpected(io_failure("failed to canonicalize " + joined.string(), ec));
    }
    return canonical;
}

std::expected<std::filesystem::path, error> resolve_destination(const std::filesystem::path& dir) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(dir, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to prepare destination " + dir.string(), ec));
    }
    std::filesystem::create_directories(absolute, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to prepare destination " + absolute.string(), ec));
    }
    auto canonical = std::filesystem::canonical(absolute, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to prepare destination " + absolute.string(), ec));
    }
    return canonical;
}

// Validation is lexical, so a symlink extracted earlier could still redirect
// a later path. Resolve the deepest existing ancestor of `path` and require
// it to stay inside `root`.
std::expected<void, error> confine_existing(const std::filesystem::path& path, const std::filesystem::path& root) {
    std::error_code ec;
    auto existing = path;
    while (!std::filesystem::exists(std::filesystem::symlink_status(existing, ec)) && existing.has_relative_path()) {
        existing = existing.parent_path();
    }

    // A dangling symlink resolves through its parent
    const auto resolved = std::filesystem::weakly_canonical(existing, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to resolve " + existing.string(), ec));
    }
    if (!path_starts_with(resolved, root)) {
        return std::unexpected(error{error_code::root_escape,
            "path escapes archive root through a symlink: " + path.string()});
    }
    return {};
}

std::expected<void, error> ensure_parent_exists(const validated_path& validated, const std::filesystem::path& root) {
    const auto parent = validated.abs().parent_path();
    if (auto confined = confine_existing(parent, root); !confined) {
        return confined;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(io_failure("failed to create parent " + parent.string(), ec));
    }
    return {};
}

std::expected<std::string, error> decode_link_target(const archive_entry& entry, std::string_view rel) {
    if (!entry.link_target() || entry.link_target()->empty()) {
        return std::unexpected(error{error_code::invalid_header,
            std::string{"missing link target for "} + std::string{rel}});
    }
    if (!is_valid_utf8(*entry.link_target())) {
        return std::unexpected(error{error_code::invalid_header,
            std::string{"link target not UTF-8: "} + std::string{rel}});
    }
    return *entry.link_target();
}

std::expected<void, error> extract_hard_link(
    const archive_entry& entry,
    const validated_path& validated,
    const std::filesystem::path& root,
    const security_policy& policy
) {
    const auto rel = validated.rel().string();
    auto target = decode_link_target(entry, rel);
    if (!target) {
        return std::unexpected(target.error());
    }

    // Hard link targets name another archive member, relative to the root
    const std::filesystem::path target_path{*target};
    const auto resolved = lexical_clean(target_path.is_absolute() ? target_path : root / target_path);
    if (auto allowed = policy.enforce_link_policy(resolved, root, link_kind::hardlink); !allowed) {
        return allowed;
    }
    // A target inside the root may still reach outside through an extracted symlink
    if (!policy.allows_outside_root(link_kind::hardlink)) {
        if (auto confined = confine_existing(resolved, root); !confined) {
            return std::unexpected(error{error_code::link_outside_root,
                "link target escapes root: " + *target});
        }
    }

    std::error_code ec;
    if (const auto status = std::filesystem::symlink_status(validated.abs(), ec);
        std::filesystem::exists(status) && !std::filesystem::is_directory(status)) {
        std::filesystem::remove(validated.abs(), ec);
        if (ec) {
            return std::unexpected(io_failure("failed to replace " + validated.abs().string(), ec));
        }
    }
    std::filesystem::create_hard_link(resolved, validated.abs(), ec);
    if (ec) {
        return std::unexpected(io_failure("failed to link " + rel + " to " + *target, ec));
    }
    return {};
}

std::expected<void, error> add_planned_entry(archive_writer& writer, const planned_entry& entry) {
    const auto name = entry.relative.generic_string();
    std::expected<void, error> result;
    switch (entry.kind) {
        case manifest_kind::directory:
            result = writer.append_directory(name);
            break;
        case manifest_kind::file:
            result = writer.append_file(name, entry.absolute, entry.size, entry.executable);
            break;
        case manifest_kind::symlink:
            if (!entry.link_target) {
                return std::unexpected(error{error_code::invalid_operation,
                    "missing symlink target for " + name});
            }
            result = writer.append_symlink(name, *entry.link_target);
            break;
    }
    if (!result) {
        return std::unexpected(result.error().with_context("failed to append " + name));
    }
    return {};
}

} // anonymous namespace

manifest_kind classify_entry(const entry_type type) noexcept {
    switch (type) {
        case entry_type::directory:
            return manifest_kind::directory;
        case entry_type::symbolic_link:
            return manifest_kind::symlink;
        default:
            return manifest_kind::file;
    }
}

auto open_archive(const std::filesystem::path &path) -> std::expected<archive_reader, error> {
    auto file = file_stream::open(path);
    if (!file) {
        return std::unexpected(file.error().with_context("failed to open archive " + path.string()));
    }
    return open_archive(std::make_unique<file_stream>(std::move(*file)));
}

auto open_archive(std::unique_ptr<input_stream> stream) -> std::expected<archive_reader, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }
    auto decoded = wrap_reader(std::move(stream));
    if (!decoded) {
        return std::unexpected(decoded.error().with_context("failed to detect archive compression"));
    }
    return archive_reader::from_stream(std::move(*decoded));
}

auto create_archive(const create_options &options, const security_policy &policy) -> std::expected<create_result, error> {
    auto base = resolve_base(options.work_dir);
    if (!base) {
        return std::unexpected(base.error());
    }

    auto excludes = compile_excludes(options.excludes, options.exclude_from);
    if (!excludes) {
        return std::unexpected(excludes.error());
    }

    auto usage = policy.usage();
    create_result result;

    for (const auto& input : options.inputs) {
        auto canonical = canonicalize_input(*base, input);
        if (!canonical) {
            return std::unexpected(canonical.error());
        }
        if (auto walked = walk_input(*base, *canonical, *excludes, policy, usage, result.plan); !walked) {
            return std::unexpected(walked.error());
        }
    }

    std::vector<manifest_item> items;
    items.reserve(result.plan.size());
    for (const auto& entry : result.plan) {
        items.push_back(entry.to_manifest_item());
    }

    auto manifest = collect_manifest(items);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }
    result.manifest = std::move(*manifest);

    if (options.print_plan) {
        spdlog::info("planned {} entries, nothing written", result.plan.size());
        return result;
    }

    auto file = file_output_stream::create(options.archive_path);
    if (!file) {
        return std::unexpected(file.error().with_context("failed to create archive " + options.archive_path.string()));
    }
    auto sink = wrap_writer(std::make_unique<file_output_stream>(std::move(*file)), options.codec);
    if (!sink) {
        return std::unexpected(sink.error().with_context(
            std::string{"failed to initialise "} + std::string{to_string(options.codec)} + " compressor"));
    }

    archive_writer writer{std::move(*sink)};
    for (const auto& entry : result.plan) {
        spdlog::debug("adding {} ({})", entry.relative.generic_string(), entry.kind_label());
        if (auto added = add_planned_entry(writer, entry); !added) {
            return std::unexpected(added.error());
        }
    }

    if (auto finished = writer.finish(); !finished) {
        return std::unexpected(finished.error().with_context("failed to finalise tar archive"));
    }

    if (options.manifest_out) {
        if (auto written = write_manifest_json(result.manifest, *options.manifest_out); !written) {
            return std::unexpected(written.error());
        }
    }

    spdlog::info("created {} with {} entries ({} bytes, {})", options.archive_path.string(),
                 writer.entries_written(), usage.total_bytes(), to_string(options.codec));
    return result;
}

auto extract_archive(const extract_options &options, const security_policy &policy)
    -> std::expected<std::vector<manifest_entry>, error> {
    auto reader = open_archive(options.archive_path);
    if (!reader) {
        return std::unexpected(reader.error());
    }

    auto destination = resolve_destination(options.destination);
    if (!destination) {
        return std::unexpected(destination.error());
    }
    const auto& root = *destination;

    auto usage = policy.usage();
    std::vector<manifest_item> items;

    while (true) {
        auto next = reader->next_entry();
        if (!next) {
            return std::unexpected(next.error());
        }
        if (!*next) {
            break;
        }
        const archive_entry& entry = **next;
        const auto kind = classify_entry(entry.type());

        if (!is_valid_utf8(entry.path())) {
            return std::unexpected(error{error_code::invalid_header, "entry path not UTF-8"});
        }

        auto validated = policy.normalize_and_validate(std::string_view{entry.path()}, root);
        if (!validated) {
            return std::unexpected(validated.error());
        }
        if (auto observed = usage.observe(*validated, entry.size()); !observed) {
            return std::unexpected(observed.error());
        }

        const auto rel = validated->rel().string();
        spdlog::debug("extracting {} ({})", rel, to_string(kind));

        manifest_item item{validated->rel(), validated->abs(), kind, std::nullopt, 0, header_mtime(entry.metadata())};

        switch (kind) {
            case manifest_kind::directory: {
                if (auto confined = confine_existing(validated->abs(), root); !confined) {
                    return std::unexpected(confined.error());
                }
                std::error_code ec;
                std::filesystem::create_directories(validated->abs(), ec);
                if (ec) {
                    return std::unexpected(io_failure("failed to create directory " + validated->abs().string(), ec));
                }
                break;
            }

            case manifest_kind::file: {
                if (auto parent = ensure_parent_exists(*validated, root); !parent) {
                    return std::unexpected(parent.error());
                }
                if (entry.is_hard_link()) {
                    if (auto linked = extract_hard_link(entry, *validated, root, policy); !linked) {
                        return std::unexpected(linked.error());
                    }
                } else if (auto written = entry.extract_to_path(validated->abs()); !written) {
                    return std::unexpected(written.error().with_context("failed to extract " + rel));
                }
                item.size = entry.size();
                break;
            }

            case manifest_kind::symlink: {
                if (auto parent = ensure_parent_exists(*validated, root); !parent) {
                    return std::unexpected(parent.error());
                }
                auto target = decode_link_target(entry, rel);
                if (!target) {
                    return std::unexpected(target.error());
                }

                // Relative targets resolve against the link's own directory
                const std::filesystem::path target_path{*target};
                const auto resolved = target_path.is_absolute()
                    ? target_path
                    : validated->abs().parent_path() / target_path;
                if (auto allowed = policy.enforce_link_policy(resolved, root, link_kind::symlink); !allowed) {
                    return std::unexpected(allowed.error());
                }

                if (auto written = entry.extract_to_path(validated->abs()); !written) {
                    return std::unexpected(written.error().with_context("failed to extract " + rel));
                }
                item.link_target = std::move(*target);
                break;
            }
        }

        // An explicit "./" entry is the destination itself, not content
        if (!item.relative.empty()) {
            items.push_back(std::move(item));
        }
    }

    auto manifest = collect_manifest(items);
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    spdlog::info("extracted {} entries ({} bytes) into {}", usage.files_seen(), usage.total_bytes(), root.string());

    if (options.manifest) {
        auto expected = read_manifest_json(*options.manifest);
        if (!expected) {
            return std::unexpected(expected.error());
        }
        if (auto verified = verify_manifest(*expected, *manifest, options.manifest_relaxed); !verified) {
            return std::unexpected(verified.error());
        }
        spdlog::info("manifest {} verified", options.manifest->string());
    }

    return manifest;
}

auto list_archive(const list_options &options) -> std::expected<std::vector<listed_entry>, error> {
    auto reader = open_archive(options.archive_path);
    if (!reader) {
        return std::unexpected(reader.error());
    }

    std::vector<listed_entry> listed;
    while (true) {
        auto next = reader->next_entry();
        if (!next) {
            return std::unexpected(next.error());
        }
        if (!*next) {
            break;
        }
        const archive_entry& entry = **next;

        if (!is_valid_utf8(entry.path())) {
            return std::unexpected(error{error_code::invalid_header, "entry path not UTF-8"});
        }

        // Directory names carry a trailing '/' in the header
        auto path = entry.path();
        while (path.size() > 1 && path.ends_with('/')) {
            path.pop_back();
        }

        const auto mtime = header_mtime(entry.metadata());
        manifest_entry result;
        switch (classify_entry(entry.type())) {
            case manifest_kind::file: {
                sha256_hasher hasher;
                auto streamed = entry.for_each_chunk([&hasher](std::span<const std::byte> chunk) {
                    hasher.update(chunk);
                });
                if (!streamed) {
                    return std::unexpected(streamed.error().with_context("failed to read " + path));
                }
                result = manifest_entry{path, entry.size(), hasher.finish_hex(), manifest_kind::file, std::nullopt, mtime};
                break;
            }
            case manifest_kind::directory:
                result = manifest_entry::for_directory(path, mtime);
                break;
            case manifest_kind::symlink: {
                if (entry.link_target() && !is_valid_utf8(*entry.link_target())) {
                    return std::unexpected(error{error_code::invalid_header,
                        "symlink target not UTF-8: " + path});
                }
                result = manifest_entry::for_symlink(path, entry.link_target().value_or(""), std::nullopt);
                break;
            }
        }

        listed.push_back(listed_entry{std::move(result), entry.pax()});
    }

    return listed;
}

} // namespace safetar
