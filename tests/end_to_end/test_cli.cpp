/**
 * @file test_cli.cpp
 * @brief End-to-end tests for the canonjson command line tool
 *
 * Runs the built binary through std::system and checks exit codes,
 * stdout, stderr and output files.
 */

#include "canonjson/common.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sys/wait.h>

#include <gtest/gtest.h>

namespace canonjson::end_to_end::tests {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kCanonjsonBinary = CANONJSON_TEST_BIN;

constexpr std::string_view kDocument = R"({ "b": [true, null], "a": 1.0 })";
constexpr std::string_view kCanonical = R"({"a":1,"b":[true,null]})";

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

struct RunResult
{
    int exit_code;
    std::string out;
    std::string err;
};

[[nodiscard]] std::string quote_arg(std::string_view value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return std::format("\"{}\"", escaped);
}

[[nodiscard]] std::string read_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void write_file(const fs::path& path, std::string_view content)
{
    std::ofstream out(path, std::ios::binary);
    out << content;
}

class CliTest : public ::testing::Test
{
protected:
    CliTest()
        : m_dir(std::format("canonjson_cli_{}",
                            ::testing::UnitTest::GetInstance()->current_test_info()->name()))
    {}

    [[nodiscard]] fs::path file(std::string_view name, std::string_view content) const
    {
        fs::path path = m_dir.path() / name;
        write_file(path, content);
        return path;
    }

    [[nodiscard]] fs::path path(std::string_view name) const { return m_dir.path() / name; }

    [[nodiscard]] RunResult run(const std::vector<std::string>& args) const
    {
        std::string command = quote_arg(kCanonjsonBinary);
        for (const auto& arg : args) {
            command.push_back(' ');
            command += quote_arg(arg);
        }
        const fs::path out_path = m_dir.path() / "stdout.txt";
        const fs::path err_path = m_dir.path() / "stderr.txt";
        command += std::format(" < /dev/null > {} 2> {}",
                               quote_arg(out_path.string()),
                               quote_arg(err_path.string()));

        const int status = std::system(command.c_str());
        const int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return RunResult{.exit_code = exit_code, .out = read_file(out_path), .err = read_file(err_path)};
    }

private:
    TempDir m_dir;
};

}  // namespace

TEST_F(CliTest, CanonicalizeWritesLineToStdout)
{
    const auto input = file("doc.json", kDocument);
    const auto result = run({"canonicalize", "--input", input.string()});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, std::string(kCanonical) + "\n");
    EXPECT_TRUE(result.err.empty());
}

TEST_F(CliTest, CanonicalizeOutputFileHasNoTrailingNewline)
{
    const auto input = file("doc.json", kDocument);
    const auto output = path("canonical.json");
    const auto result = run({"canonicalize", "-i", input.string(), "-o", output.string()});
    ASSERT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(read_file(output), kCanonical);
    EXPECT_TRUE(result.out.empty());
}

TEST_F(CliTest, HashDefaultsToSha256)
{
    const auto input = file("doc.json", kDocument);
    const auto result = run({"hash", "--input", input.string()});
    ASSERT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, "1cc69c7fa23616ca2ec3ee70d24390a6225c8832db8a4c814c7e0e7f942f8668\n");
    EXPECT_EQ(result.out, common::to_hex(common::sha256(kCanonical)) + "\n");
}

TEST_F(CliTest, HashWithNamedAlgorithm)
{
    const auto input = file("doc.json", kDocument);
    const auto result = run({"hash", "-i", input.string(), "--algorithm", "SHA-512"});
    ASSERT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, common::to_hex(common::sha512(kCanonical)) + "\n");
}

TEST_F(CliTest, UnknownAlgorithmIsUsageError)
{
    const auto input = file("doc.json", kDocument);
    const auto result = run({"hash", "-i", input.string(), "-a", "md5"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_TRUE(result.err.starts_with("Error: UnsupportedAlgorithm: ")) << result.err;
    EXPECT_TRUE(result.out.empty());
}

TEST_F(CliTest, EqualAcceptsReorderedDocuments)
{
    const auto lhs = file("lhs.json", kDocument);
    const auto rhs = file("rhs.json", R"({"b":[true,null],"a":1e0})");
    const auto result = run({"equal", lhs.string(), rhs.string()});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, "true\n");
}

TEST_F(CliTest, EqualFalseExitsOne)
{
    const auto lhs = file("lhs.json", R"([1,2])");
    const auto rhs = file("rhs.json", R"([2,1])");
    const auto result = run({"equal", lhs.string(), rhs.string()});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.out, "false\n");
    EXPECT_TRUE(result.err.empty());
}

TEST_F(CliTest, EqualNeedsTwoFiles)
{
    const auto lhs = file("lhs.json", R"([1])");
    const auto result = run({"equal", lhs.string()});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_TRUE(result.err.starts_with("Error: InvalidArgument: ")) << result.err;
}

TEST_F(CliTest, ParseErrorExitsOne)
{
    const auto input = file("broken.json", R"({"a": })");
    const auto result = run({"canonicalize", "--input", input.string()});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.err.starts_with("Error: ParseError: ")) << result.err;
    EXPECT_TRUE(result.out.empty());
}

TEST_F(CliTest, MissingInputFileExitsOne)
{
    const auto result = run({"canonicalize", "--input", path("absent.json").string()});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.err.starts_with("Error: IOError: ")) << result.err;
}

TEST_F(CliTest, UnknownOptionIsUsageError)
{
    const auto result = run({"canonicalize", "--bogus"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.err, "Error: InvalidArgument: Unknown option: --bogus\n");
}

TEST_F(CliTest, MissingOptionValueIsUsageError)
{
    const auto result = run({"hash", "--algorithm"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_TRUE(result.err.starts_with("Error: InvalidArgument: ")) << result.err;
}

TEST_F(CliTest, UnknownCommandIsUsageError)
{
    const auto result = run({"frobnicate"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_TRUE(result.err.starts_with("Error: InvalidArgument: Unknown command: frobnicate"))
        << result.err;
}

TEST_F(CliTest, CheckCanonicalDocument)
{
    const auto input = file("canonical.json", kCanonical);
    const auto result = run({"check", "--input", input.string()});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, "canonical\n");
}

TEST_F(CliTest, CheckNonCanonicalDocument)
{
    const auto input = file("doc.json", kDocument);
    const auto result = run({"check", "--input", input.string()});
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.out, "not canonical\n");
}

TEST_F(CliTest, MaxDepthZeroAcceptsOnlyScalars)
{
    const auto scalar = file("scalar.json", "42.0");
    const auto scalar_result = run({"canonicalize", "-i", scalar.string(), "--max-depth", "0"});
    EXPECT_EQ(scalar_result.exit_code, 0) << scalar_result.err;
    EXPECT_EQ(scalar_result.out, "42\n");

    const auto array = file("array.json", "[]");
    const auto array_result = run({"canonicalize", "-i", array.string(), "--max-depth", "0"});
    EXPECT_EQ(array_result.exit_code, 1);
    EXPECT_TRUE(array_result.err.starts_with("Error: DepthExceeded: ")) << array_result.err;
}

TEST_F(CliTest, MalformedMaxDepthIsUsageError)
{
    const auto result = run({"canonicalize", "--max-depth", "-1"});
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_TRUE(result.err.starts_with("Error: InvalidArgument: Invalid --max-depth value: -1"))
        << result.err;
}

TEST_F(CliTest, SizeCountsCanonicalBytes)
{
    const auto input = file("doc.json", kDocument);
    const auto result = run({"size", "--input", input.string()});
    EXPECT_EQ(result.exit_code, 0) << result.err;
    EXPECT_EQ(result.out, std::format("{}\n", kCanonical.size()));
}

}  // namespace canonjson::end_to_end::tests
