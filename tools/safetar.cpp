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

/**
 * safetar - tar archiver that validates every path and bounds every resource.
 *
 * Usage: safetar <create|c|extract|x|list|t> --file=ARCHIVE [flags] [PATH...]
 *
 * Policy and manifest violations exit with 3, usage errors with 2 and any
 * other failure with 1. Flags may also be read from --flagfile.
 */

#include <safetar/safetar.hpp>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdint>
#include <cstdlib>
#include <print>
#include <string>
#include <vector>

ABSL_FLAG(std::string, file, "", "Archive to create, extract or list");
ABSL_FLAG(std::string, f, "", "Short form of --file");
ABSL_FLAG(std::string, directory, "", "Working directory (create) or destination (extract)");
ABSL_FLAG(std::string, C, "", "Short form of --directory");
ABSL_FLAG(bool, verbose, false, "Print per-entry progress and debug logs");
ABSL_FLAG(bool, quiet, false, "Only print errors");
ABSL_FLAG(bool, strict, false, "Abort extraction on the first policy violation");
ABSL_FLAG(bool, gzip, false, "Compress with gzip");
ABSL_FLAG(bool, xz, false, "Compress with xz");
ABSL_FLAG(bool, zstd, false, "Compress with zstd");
ABSL_FLAG(bool, print_plan, false, "List what create would archive without writing it");
ABSL_FLAG(std::vector<std::string>, exclude, {}, "Comma-separated globs to leave out");
ABSL_FLAG(std::vector<std::string>, exclude_from, {}, "Comma-separated files with one exclude glob per line");
ABSL_FLAG(std::string, manifest, "", "Verify the extracted tree against this manifest");
ABSL_FLAG(bool, manifest_relaxed, false, "Allow entries missing from the manifest");
ABSL_FLAG(std::string, manifest_out, "", "Write the manifest of the created archive here");
ABSL_FLAG(bool, json, false, "List as a JSON manifest");
ABSL_FLAG(bool, numeric_owner, false, "Accepted for tar compatibility");
ABSL_FLAG(bool, no_same_owner, false, "Accepted for tar compatibility");
ABSL_FLAG(uint64_t, max_files, safetar::policy_limits{}.max_files, "Maximum number of entries");
ABSL_FLAG(uint64_t, max_total_bytes, safetar::policy_limits{}.max_total_bytes, "Maximum total entry bytes");
ABSL_FLAG(uint64_t, max_single_file, safetar::policy_limits{}.max_single_file, "Maximum size of one entry");
ABSL_FLAG(uint32_t, max_depth, safetar::policy_limits{}.max_depth, "Maximum directory depth");

namespace {

enum class command {
    create,
    extract,
    list
};

std::expected<command, safetar::error> parse_command(std::string_view name) {
    if (name == "create" || name == "c") return command::create;
    if (name == "extract" || name == "x") return command::extract;
    if (name == "list" || name == "t") return command::list;
    return std::unexpected(safetar::error{safetar::error_code::user_input,
        "unknown command '" + std::string{name} + "', expected create, extract or list"});
}

std::string flag_or_alias(const absl::Flag<std::string>& flag, const absl::Flag<std::string>& alias) {
    auto value = absl::GetFlag(flag);
    return value.empty() ? absl::GetFlag(alias) : value;
}

std::optional<std::filesystem::path> optional_path(const absl::Flag<std::string>& flag) {
    auto value = absl::GetFlag(flag);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path{value};
}

safetar::security_policy policy_from_flags() {
    return safetar::security_policy{}
        .with_max_files(absl::GetFlag(FLAGS_max_files))
        .with_max_total_bytes(absl::GetFlag(FLAGS_max_total_bytes))
        .with_max_single_file(absl::GetFlag(FLAGS_max_single_file))
        .with_max_depth(absl::GetFlag(FLAGS_max_depth));
}

std::string format_pax(const safetar::pax_records& pax) {
    std::string out = "{";
    for (const auto& [key, value] : pax) {
        if (out.size() > 1) {
            out += ", ";
        }
        out += key + "=" + value;
    }
    out += "}";
    return out;
}

std::expected<void, safetar::error> run_create(const std::string& archive, const std::vector<std::string>& inputs) {
    const bool verbose = absl::GetFlag(FLAGS_verbose);
    const bool quiet = absl::GetFlag(FLAGS_quiet);

    if (inputs.empty()) {
        return std::unexpected(safetar::error{safetar::error_code::user_input, "create needs at least one input path"});
    }

    safetar::create_options options;
    options.archive_path = archive;
    options.inputs.assign(inputs.begin(), inputs.end());
    options.work_dir = optional_path(FLAGS_directory);
    if (!options.work_dir) {
        options.work_dir = optional_path(FLAGS_C);
    }
    options.codec = safetar::compression_flags{
        absl::GetFlag(FLAGS_gzip), absl::GetFlag(FLAGS_xz), absl::GetFlag(FLAGS_zstd)}.resolve();
    options.print_plan = absl::GetFlag(FLAGS_print_plan);
    options.excludes = absl::GetFlag(FLAGS_exclude);
    for (const auto& file : absl::GetFlag(FLAGS_exclude_from)) {
        options.exclude_from.emplace_back(file);
    }
    options.manifest_out = optional_path(FLAGS_manifest_out);
    options.numeric_owner = absl::GetFlag(FLAGS_numeric_owner);
    options.no_same_owner = absl::GetFlag(FLAGS_no_same_owner);

    auto result = safetar::create_archive(options, policy_from_flags());
    if (!result) {
        return std::unexpected(result.error());
    }

    if (options.print_plan && !quiet) {
        for (const auto& entry : result->plan) {
            std::println("{}\t{}", entry.kind_label(), entry.relative.generic_string());
        }
    }
    if (verbose && !quiet) {
        for (const auto& entry : result->manifest) {
            std::println("added {} ({} bytes)", entry.path, entry.size);
        }
    }
    return {};
}

std::expected<void, safetar::error> run_extract(const std::string& archive) {
    safetar::extract_options options;
    options.archive_path = archive;
    if (auto dir = flag_or_alias(FLAGS_directory, FLAGS_C); !dir.empty()) {
        options.destination = dir;
    }
    options.strict = absl::GetFlag(FLAGS_strict);
    options.manifest = optional_path(FLAGS_manifest);
    options.manifest_relaxed = absl::GetFlag(FLAGS_manifest_relaxed);
    options.numeric_owner = absl::GetFlag(FLAGS_numeric_owner);
    options.no_same_owner = absl::GetFlag(FLAGS_no_same_owner);

    auto manifest = safetar::extract_archive(options, policy_from_flags());
    if (!manifest) {
        return std::unexpected(manifest.error());
    }

    if (absl::GetFlag(FLAGS_verbose) && !absl::GetFlag(FLAGS_quiet)) {
        for (const auto& entry : *manifest) {
            std::println("extracted {} ({} bytes)", entry.path, entry.size);
        }
    }
    return {};
}

std::expected<void, safetar::error> run_list(const std::string& archive) {
    const bool verbose = absl::GetFlag(FLAGS_verbose);
    const bool quiet = absl::GetFlag(FLAGS_quiet);
    const bool json = absl::GetFlag(FLAGS_json);

    auto listed = safetar::list_archive(safetar::list_options{archive});
    if (!listed) {
        return std::unexpected(listed.error());
    }
    if (quiet) {
        return {};
    }

    if (json) {
        std::vector<safetar::manifest_entry> entries;
        entries.reserve(listed->size());
        for (const auto& item : *listed) {
            entries.push_back(item.entry);
        }
        std::println("{}", safetar::manifest_to_json(entries));
        return {};
    }

    for (const auto& [entry, pax] : *listed) {
        if (!verbose) {
            std::println("{}", entry.path);
        } else if (pax.empty()) {
            std::println("{}\t{}\t{}", safetar::to_string(entry.kind), entry.size, entry.path);
        } else {
            std::println("{}\t{}\t{}\t{}", safetar::to_string(entry.kind), entry.size, entry.path, format_pax(pax));
        }
    }
    if (verbose) {
        std::println("total entries: {}", listed->size());
    }
    return {};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    absl::SetProgramUsageMessage(
        "safetar <create|c|extract|x|list|t> --file=ARCHIVE [flags] [PATH...]");
    std::vector<char*> args = absl::ParseCommandLine(argc, argv);

    // Diagnostics go to stderr, stdout carries listings and JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("safetar"));
    spdlog::set_pattern("safetar: [%l] %v");
    if (absl::GetFlag(FLAGS_quiet)) {
        spdlog::set_level(spdlog::level::err);
    } else if (absl::GetFlag(FLAGS_verbose)) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    const auto fail = [](const safetar::error& err) {
        std::println(stderr, "safetar: {}", err.message());
        return safetar::exit_code_for(err);
    };

    if (args.size() < 2) {
        return fail(safetar::error{safetar::error_code::user_input,
            "missing command, expected create, extract or list"});
    }

    auto cmd = parse_command(args[1]);
    if (!cmd) {
        return fail(cmd.error());
    }

    const auto archive = flag_or_alias(FLAGS_file, FLAGS_f);
    if (archive.empty()) {
        return fail(safetar::error{safetar::error_code::user_input, "--file is required"});
    }

    const std::vector<std::string> operands(args.begin() + 2, args.end());

    std::expected<void, safetar::error> result;
    switch (*cmd) {
        case command::create:
            result = run_create(archive, operands);
            break;
        case command::extract:
            result = run_extract(archive);
            break;
        case command::list:
            result = run_list(archive);
            break;
    }

    if (!result) {
        return fail(result.error());
    }
    return EXIT_SUCCESS;
}
