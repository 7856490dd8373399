/**
 * @file main.cpp
 * @brief canonjson CLI entry point
 *
 * Commands:
 *   canonicalize - Print the canonical form of a JSON document
 *   hash         - Print the digest of the canonical form
 *   equal        - Compare two documents by canonical form
 *   check        - Test whether a document is already canonical
 *   size         - Print the canonical form size in bytes
 *   version      - Show version information
 */

#include "canonjson/canonical_json.hpp"
#include "canonjson/common.hpp"
#include "canonjson/json_reader.hpp"
#include "canonjson/require_cpp23.hpp"
#include "canonjson/version.hpp"

#include <charconv>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <print>
#include <ranges>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_version()
{
    std::println("canonjson {} ({})", canonjson::kVersion, canonjson::kBuildId);
    std::println("  scheme: {}", canonjson::kSchemeVersion);
}

void print_help()
{
    std::print(R"(canonjson - JSON Canonicalization Scheme (RFC 8785)

Usage: canonjson <command> [options]

Commands:
  canonicalize  Print the canonical form of a JSON document
  hash          Print the digest of the canonical form
  equal         Compare two JSON documents by canonical form
  check         Test whether a document is already in canonical form
  size          Print the size in bytes of the canonical form
  version       Show version information

Options:
  --input FILE, -i        Input document (default: stdin)
  --output FILE, -o       Output file (canonicalize only, default: stdout)
  --algorithm NAME, -a    Digest algorithm: sha-256, sha-384, sha-512 (default: sha-256)
  --max-depth N           Maximum nesting depth (default: 512)
  --help, -h              Show this help message

Usage of equal:
  canonjson equal FILE_A FILE_B [--max-depth N]

Exit status: 0 on success, 1 on failure or a negative equal/check, 2 on usage errors.
)");
}

struct CommandOptions
{
    std::string input;
    std::string output;
    std::string algorithm;
    std::size_t max_depth;
    std::vector<std::string> positional;
    bool show_help;
};

void report(const canonjson::Error& error)
{
    std::println(stderr, "Error: {}: {}", canonjson::to_string(error.code), error.message);
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> canonjson::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            canonjson::Error::make(canonjson::ErrorCode::kInvalidArgument,
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] canonjson::Result<std::size_t> parse_depth_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(
            canonjson::Error::make(canonjson::ErrorCode::kInvalidArgument,
                                   std::string("Invalid --max-depth value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] canonjson::Result<CommandOptions> parse_args(std::span<char*> args)
{
    CommandOptions options{.input = std::string{},
                           .output = std::string{},
                           .algorithm = "sha-256",
                           .max_depth = canonjson::canonical::kDefaultMaxDepth,
                           .positional = {},
                           .show_help = false};
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
        if (arg == "--input" || arg == "-i" || arg == "--output" || arg == "-o"
            || arg == "--algorithm" || arg == "-a" || arg == "--max-depth") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            skip_next = true;
            if (arg == "--input" || arg == "-i") {
                options.input = *value;
            } else if (arg == "--output" || arg == "-o") {
                options.output = *value;
            } else if (arg == "--algorithm" || arg == "-a") {
                options.algorithm = *value;
            } else {
                auto depth = parse_depth_value(*value);
                if (!depth) {
                    return std::unexpected(depth.error());
                }
                options.max_depth = *depth;
            }
            continue;
        }
        if (arg.starts_with("-") && arg != "-") {
            return std::unexpected(canonjson::Error::make(
                canonjson::ErrorCode::kInvalidArgument,
                std::string("Unknown option: ") + std::string(arg)));
        }
        options.positional.emplace_back(arg);
    }
    return options;
}

[[nodiscard]] canonjson::Result<std::string> read_text(const std::string& input)
{
    if (input.empty() || input == "-") {
        std::string text{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
        if (std::cin.bad()) {
            return std::unexpected(
                canonjson::Error::make(canonjson::ErrorCode::kIoError, "Failed to read stdin"));
        }
        return text;
    }
    std::ifstream in(std::filesystem::path(input), std::ios::binary);
    if (!in) {
        return std::unexpected(canonjson::Error::make(canonjson::ErrorCode::kIoError,
                                                      "Failed to open input file: " + input));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

[[nodiscard]] canonjson::Result<canonjson::Value> read_document(const std::string& input,
                                                                std::size_t max_depth)
{
    auto text = read_text(input);
    if (!text) {
        return std::unexpected(text.error());
    }
    return canonjson::reader::parse_json(*text, canonjson::reader::ReaderOptions{.max_depth = max_depth});
}

[[nodiscard]] canonjson::VoidResult write_text(const std::string& output, std::string_view text)
{
    if (output.empty() || output == "-") {
        std::cout << text << '\n';
        if (!std::cout) {
            return std::unexpected(
                canonjson::Error::make(canonjson::ErrorCode::kIoError, "Failed to write stdout"));
        }
        return {};
    }
    std::ofstream out(std::filesystem::path(output), std::ios::binary);
    if (!out) {
        return std::unexpected(canonjson::Error::make(canonjson::ErrorCode::kIoError,
                                                      "Failed to open output file: " + output));
    }
    // File output is the exact canonical byte sequence, no trailing newline
    out << text;
    if (!out) {
        return std::unexpected(canonjson::Error::make(canonjson::ErrorCode::kIoError,
                                                      "Failed to write output file: " + output));
    }
    return {};
}

[[nodiscard]] int run_canonicalize(const CommandOptions& options)
{
    auto value = read_document(options.input, options.max_depth);
    if (!value) {
        report(value.error());
        return kExitFailure;
    }
    auto canonical = canonjson::canonical::canonicalize(
        *value, canonjson::canonical::CanonicalOptions{.max_depth = options.max_depth});
    if (!canonical) {
        report(canonical.error());
        return kExitFailure;
    }
    if (auto result = write_text(options.output, *canonical); !result) {
        report(result.error());
        return kExitFailure;
    }
    return kExitOk;
}

[[nodiscard]] int run_hash(const CommandOptions& options)
{
    // An unknown algorithm name is a usage error, reported before any input is read
    auto hash = canonjson::canonical::find_hash_function(options.algorithm);
    if (!hash) {
        report(hash.error());
        return kExitUsage;
    }
    auto value = read_document(options.input, options.max_depth);
    if (!value) {
        report(value.error());
        return kExitFailure;
    }
    auto digest = canonjson::canonical::canonical_hash(
        *value,
        *hash,
        canonjson::canonical::CanonicalOptions{.max_depth = options.max_depth});
    if (!digest) {
        report(digest.error());
        return kExitFailure;
    }
    std::println("{}", *digest);
    return kExitOk;
}

[[nodiscard]] int run_equal(const CommandOptions& options)
{
    if (options.positional.size() != 2) {
        report(canonjson::Error::make(canonjson::ErrorCode::kInvalidArgument,
                                      std::format("equal expects exactly two input files, got {}",
                                                  options.positional.size())));
        return kExitUsage;
    }
    auto lhs = read_document(options.positional[0], options.max_depth);
    if (!lhs) {
        report(lhs.error());
        return kExitFailure;
    }
    auto rhs = read_document(options.positional[1], options.max_depth);
    if (!rhs) {
        report(rhs.error());
        return kExitFailure;
    }
    auto equal = canonjson::canonical::canonically_equal(
        *lhs, *rhs, canonjson::canonical::CanonicalOptions{.max_depth = options.max_depth});
    if (!equal) {
        report(equal.error());
        return kExitFailure;
    }
    std::println("{}", *equal);
    return *equal ? kExitOk : kExitFailure;
}

[[nodiscard]] int run_check(const CommandOptions& options)
{
    auto text = read_text(options.input);
    if (!text) {
        report(text.error());
        return kExitFailure;
    }
    const bool canonical = canonjson::reader::is_canonical_json(*text);
    std::println("{}", canonical ? "canonical" : "not canonical");
    return canonical ? kExitOk : kExitFailure;
}

[[nodiscard]] int run_size(const CommandOptions& options)
{
    auto value = read_document(options.input, options.max_depth);
    if (!value) {
        report(value.error());
        return kExitFailure;
    }
    auto size = canonjson::canonical::canonical_size(
        *value, canonjson::canonical::CanonicalOptions{.max_depth = options.max_depth});
    if (!size) {
        report(size.error());
        return kExitFailure;
    }
    std::println("{}", *size);
    return kExitOk;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitUsage;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h" || cmd == "help") {
            print_help();
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        auto options = parse_args(std::span<char*>(argv + 2, static_cast<std::size_t>(argc - 2)));
        if (!options) {
            report(options.error());
            return kExitUsage;
        }
        if (options->show_help) {
            print_help();
            return kExitOk;
        }

        if (cmd == "canonicalize") {
            return run_canonicalize(*options);
        }
        if (cmd == "hash") {
            return run_hash(*options);
        }
        if (cmd == "equal") {
            return run_equal(*options);
        }
        if (cmd == "check") {
            return run_check(*options);
        }
        if (cmd == "size") {
            return run_size(*options);
        }

        report(canonjson::Error::make(canonjson::ErrorCode::kInvalidArgument,
                                      std::format("Unknown command: {}", cmd)));
        print_help();
        return kExitUsage;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
