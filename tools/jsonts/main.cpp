/**
 * @file main.cpp
 * @brief jsonts CLI entry point
 *
 * Reads a JSON document, infers TypeScript type declarations for it and
 * writes them to a file or stdout.
 */

#include "jsonts/require_cpp23.hpp"

#include "jsonts/canonical_json.hpp"
#include "jsonts/common.hpp"
#include "jsonts/engine.hpp"
#include "jsonts/render.hpp"
#include "jsonts/schema_validate.hpp"
#include "jsonts/version.hpp"

#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

namespace {

enum class OutputFormat { kTypeScript, kJson };

constexpr std::string_view kLocalSchemaDir = "schemas";

struct CliOptions
{
    std::string input;
    std::optional<std::string> output;
    bool squash;
    std::string root_name;
    OutputFormat format;
    std::optional<std::string> schema_dir;
    bool verbose;
    bool show_help;
    bool show_version;
};

void print_version()
{
    std::println("jsonts {} ({})", jsonts::kVersion, jsonts::kBuildId);
    std::println("  manifest schema: {}", jsonts::kManifestSchemaVersion);
}

void print_help()
{
    std::print(R"(jsonts - infer TypeScript type declarations from a JSON document

Usage: jsonts --input FILE [options]

Options:
  --input FILE, -i          JSON document to describe (required)
  --output FILE, -o         Output file (default: stdout)
  --squash true|false, -s   Share one declaration per repeated object shape (default: true)
  --root-name NAME          Name of the root declaration (default: DefaultType)
  --format ts|json          Output TypeScript or a JSON manifest (default: ts)
  --schema-dir DIR          Path to schema directory (default: ./schemas if present,
                            else <prefix>/share/jsonts/schemas next to the binary)
  --verbose                 Report progress on stderr
  --help, -h                Show this help
  --version, -v             Show version information
)");
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> jsonts::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(jsonts::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] jsonts::Result<bool> parse_bool_value(std::string_view option, std::string_view value)
{
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    return std::unexpected(jsonts::Error::make(
        "InvalidArgument",
        std::format("Invalid {} value: {} (expected true or false)", option, value)));
}

[[nodiscard]] jsonts::Result<OutputFormat> parse_format_value(std::string_view value)
{
    if (value == "ts" || value == "typescript") {
        return OutputFormat::kTypeScript;
    }
    if (value == "json") {
        return OutputFormat::kJson;
    }
    return std::unexpected(
        jsonts::Error::make("InvalidArgument", std::format("Invalid --format value: {}", value)));
}

[[nodiscard]] auto set_value_option(std::string_view arg,
                                    std::string_view value,
                                    CliOptions& options) -> jsonts::Result<bool>
{
    if (arg == "--input" || arg == "-i") {
        options.input = std::string(value);
        return true;
    }
    if (arg == "--output" || arg == "-o") {
        options.output = std::string(value);
        return true;
    }
    if (arg == "--squash" || arg == "-s") {
        auto squash = parse_bool_value(arg, value);
        if (!squash) {
            return std::unexpected(squash.error());
        }
        options.squash = *squash;
        return true;
    }
    if (arg == "--root-name") {
        options.root_name = std::string(value);
        return true;
    }
    if (arg == "--format") {
        auto format = parse_format_value(value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
        return true;
    }
    if (arg == "--schema-dir") {
        options.schema_dir = std::string(value);
        return true;
    }
    return false;
}

[[nodiscard]] jsonts::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options{.input = std::string{},
                       .output = std::nullopt,
                       .squash = true,
                       .root_name = jsonts::kDefaultRootName,
                       .format = OutputFormat::kTypeScript,
                       .schema_dir = std::nullopt,
                       .verbose = false,
                       .show_help = false,
                       .show_version = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            options.show_version = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (!arg.starts_with("-")) {
            return std::unexpected(
                jsonts::Error::make("InvalidArgument", std::format("Unexpected argument: {}", arg)));
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto handled = set_value_option(arg, *value, options);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                jsonts::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        skip_next = true;
    }
    return options;
}

/// Schema directory: the option, then ./schemas, then the install layout.
[[nodiscard]] std::filesystem::path resolve_schema_dir(const std::optional<std::string>& option)
{
    namespace fs = std::filesystem;
    if (option) {
        return *option;
    }
    const fs::path local = kLocalSchemaDir;
    std::error_code ec;
    if (fs::is_directory(local, ec)) {
        return local;
    }
    const fs::path executable = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        fs::path installed = executable.parent_path().parent_path() / "share" / "jsonts" / "schemas";
        if (fs::is_directory(installed, ec)) {
            return installed;
        }
    }
    return local;
}

[[nodiscard]] jsonts::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            jsonts::Error::make("IOError", "Failed to open input file: " + path.string()));
    }
    std::string text{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(
            jsonts::Error::make("IOError", "Failed to read input file: " + path.string()));
    }
    return text;
}

[[nodiscard]] jsonts::Result<jsonts::JsonValue> parse_document(const std::string& text,
                                                               const std::string& source)
{
    try {
        return jsonts::JsonValue::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(jsonts::Error::make(
            "ParseError", std::format("Failed to parse JSON file: {}: {}", source, ex.what())));
    }
}

[[nodiscard]] jsonts::Result<std::string> render_manifest(const jsonts::declare::DeclarationSet& declarations,
                                                          const std::filesystem::path& schema_dir)
{
    const nlohmann::json manifest = jsonts::render::to_manifest(declarations);
    const std::filesystem::path schema_path = schema_dir / "declarations.v1.schema.json";
    if (auto validation = jsonts::common::validate_json(manifest, schema_path.string()); !validation) {
        return std::unexpected(jsonts::Error::make(
            "SchemaInvalid",
            std::string("declarations schema validation failed: ") + validation.error().message));
    }
    auto canonical = jsonts::canonical::canonicalize(manifest);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return *canonical + "\n";
}

[[nodiscard]] jsonts::VoidResult write_text_file(const std::filesystem::path& path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(
            jsonts::Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << text;
    if (!out) {
        return std::unexpected(
            jsonts::Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

int run(const CliOptions& options)
{
    auto text = read_text_file(options.input);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return 1;
    }
    if (options.verbose) {
        std::println(stderr, "[jsonts] read {} ({} bytes)", options.input, text->size());
    }

    auto document = parse_document(*text, options.input);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return 1;
    }

    const jsonts::EngineConfig config{.squash = options.squash, .root_name = options.root_name};
    auto inferred = jsonts::infer_declarations(*document, config);
    if (!inferred) {
        std::println(stderr, "Error: {}", inferred.error().message);
        return 1;
    }
    if (options.verbose) {
        const auto& stats = inferred->stats;
        std::println(stderr,
                     "[jsonts] nodes={} fingerprints={} repeated={} shared_declarations={} squash={}",
                     stats.node_count,
                     stats.distinct_fingerprints,
                     stats.repeated_fingerprints,
                     stats.shared_declarations,
                     options.squash);
    }

    std::string rendered;
    if (options.format == OutputFormat::kJson) {
        const std::filesystem::path schema_dir = resolve_schema_dir(options.schema_dir);
        if (options.verbose) {
            std::println(stderr, "[jsonts] schema directory {}", schema_dir.string());
        }
        auto manifest = render_manifest(inferred->declarations, schema_dir);
        if (!manifest) {
            std::println(stderr, "Error: {}", manifest.error().message);
            return 1;
        }
        rendered = std::move(*manifest);
    } else {
        rendered = jsonts::render::render_typescript(inferred->declarations);
    }

    if (!options.output) {
        std::print("{}", rendered);
        return 0;
    }
    if (auto written = write_text_file(*options.output, rendered); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }
    if (options.verbose) {
        std::println(stderr, "[jsonts] wrote {} declarations to {}",
                     inferred->declarations.declarations.size(), *options.output);
    }
    return 0;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
        if (!args.empty()) {
            args = args.subspan(1);
        }
        auto options = parse_args(args);
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            print_help();
            return 1;
        }
        if (options->show_help) {
            print_help();
            return 0;
        }
        if (options->show_version) {
            print_version();
            return 0;
        }
        if (options->input.empty()) {
            std::println(stderr, "Error: --input is required");
            print_help();
            return 1;
        }
        return run(*options);
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
