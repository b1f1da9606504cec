/**
 * @file test_cli_e2e.cpp
 * @brief End-to-end tests driving the jsonts executable
 */

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sys/wait.h>

namespace {

namespace fs = std::filesystem;

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

[[nodiscard]] std::string quote_path(const fs::path& path)
{
    return std::format("\"{}\"", path.string());
}

[[nodiscard]] fs::path jsonts_bin()
{
    return fs::path(JSONTS_BIN_DIR) / "jsonts";
}

/// Exit status of the command, or -1 when it did not exit normally.
[[nodiscard]] int run_command(const std::string& command)
{
    const int status = std::system(command.c_str());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

void write_text(const fs::path& path, const std::string& text)
{
    std::ofstream out(path, std::ios::binary);
    out << text;
}

[[nodiscard]] std::string read_text(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open " + path.string());
    }
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

constexpr const char* kPaymentsDocument =
    R"({"payments":[{"amount":1337,"currency":"USD"},{"amount":420,"currency":"GBP"}]})";

constexpr const char* kPaymentsTypeScript =
    "type DefaultType_0 = {\n"
    "  amount: number;\n"
    "  currency: string;\n"
    "};\n"
    "\n"
    "type DefaultType = {\n"
    "  payments: DefaultType_0[];\n"
    "};\n";

}  // namespace

TEST(CliE2E, WritesTypeScriptFile)
{
    TempDir temp("jsonts_cli_ts");
    const fs::path input = temp.path() / "payments.json";
    const fs::path output = temp.path() / "payments.ts";
    write_text(input, kPaymentsDocument);

    const std::string cmd = std::format("{} --input {} --output {}",
                                        quote_path(jsonts_bin()),
                                        quote_path(input),
                                        quote_path(output));
    ASSERT_EQ(run_command(cmd), 0) << cmd;
    EXPECT_EQ(read_text(output), kPaymentsTypeScript);
}

TEST(CliE2E, WritesToStdoutWithoutOutputOption)
{
    TempDir temp("jsonts_cli_stdout");
    const fs::path input = temp.path() / "payments.json";
    const fs::path captured = temp.path() / "stdout.txt";
    write_text(input, kPaymentsDocument);

    const std::string cmd =
        std::format("{} -i {} > {}", quote_path(jsonts_bin()), quote_path(input), quote_path(captured));
    ASSERT_EQ(run_command(cmd), 0) << cmd;
    EXPECT_EQ(read_text(captured), kPaymentsTypeScript);
}

TEST(CliE2E, SquashDisabledAndRootName)
{
    TempDir temp("jsonts_cli_nosquash");
    const fs::path input = temp.path() / "payments.json";
    const fs::path output = temp.path() / "payments.ts";
    write_text(input, R"({"paymentOne":{"amount":1337,"status":"paid"},"paymentTwo":{"amount":420,"status":"unpaid"}})");

    const std::string cmd = std::format("{} -i {} -o {} --squash false --root-name Payments",
                                        quote_path(jsonts_bin()),
                                        quote_path(input),
                                        quote_path(output));
    ASSERT_EQ(run_command(cmd), 0) << cmd;
    EXPECT_EQ(read_text(output),
              "type Payments = {\n"
              "  paymentOne: {\n"
              "    amount: number;\n"
              "    status: string;\n"
              "  };\n"
              "  paymentTwo: {\n"
              "    amount: number;\n"
              "    status: string;\n"
              "  };\n"
              "};\n");
}

TEST(CliE2E, JsonManifest)
{
    TempDir temp("jsonts_cli_manifest");
    const fs::path input = temp.path() / "payments.json";
    const fs::path output = temp.path() / "payments.json.out";
    write_text(input, kPaymentsDocument);

    const std::string cmd = std::format("{} -i {} -o {} --format json --schema-dir {}",
                                        quote_path(jsonts_bin()),
                                        quote_path(input),
                                        quote_path(output),
                                        quote_path(JSONTS_SCHEMA_DIR));
    ASSERT_EQ(run_command(cmd), 0) << cmd;

    const std::string text = read_text(output);
    ASSERT_TRUE(text.ends_with("\n"));
    const nlohmann::json manifest = nlohmann::json::parse(text);
    EXPECT_EQ(manifest.at("schema_version"), "declarations.v1");
    EXPECT_EQ(manifest.at("root"), "DefaultType");
    EXPECT_EQ(manifest.at("squash"), true);
    ASSERT_EQ(manifest.at("declarations").size(), 2U);
    EXPECT_EQ(manifest.at("declarations").at(0).at("name"), "DefaultType_0");
    EXPECT_EQ(manifest.at("declarations").at(0).at("references"), 1);
    // Canonical form: compact, keys sorted
    EXPECT_EQ(text.find(' '), std::string::npos);
    EXPECT_TRUE(text.starts_with(R"({"declarations":)"));
}

TEST(CliE2E, JsonManifestFindsInstalledSchemas)
{
    // bin/jsonts with its schemas under share/jsonts/schemas, run from a
    // directory that has no ./schemas.
    TempDir prefix("jsonts_cli_installed");
    const fs::path bin = prefix.path() / "bin" / "jsonts";
    const fs::path schemas = prefix.path() / "share" / "jsonts" / "schemas";
    fs::create_directories(bin.parent_path());
    fs::create_directories(schemas);
    fs::copy_file(jsonts_bin(), bin);
    fs::permissions(bin, fs::perms::owner_all, fs::perm_options::add);
    fs::copy_file(fs::path(JSONTS_SCHEMA_DIR) / "declarations.v1.schema.json",
                  schemas / "declarations.v1.schema.json");

    const fs::path work = prefix.path() / "work";
    fs::create_directories(work);
    write_text(work / "payments.json", kPaymentsDocument);

    const std::string cmd = std::format("cd {} && {} -i payments.json -o manifest.json --format json",
                                        quote_path(work),
                                        quote_path(bin));
    ASSERT_EQ(run_command(cmd), 0) << cmd;
    const nlohmann::json manifest = nlohmann::json::parse(read_text(work / "manifest.json"));
    EXPECT_EQ(manifest.at("schema_version"), "declarations.v1");
}

TEST(CliE2E, JsonManifestWithoutSchemasFails)
{
    TempDir prefix("jsonts_cli_no_schemas");
    const fs::path bin = prefix.path() / "bin" / "jsonts";
    fs::create_directories(bin.parent_path());
    fs::copy_file(jsonts_bin(), bin);
    fs::permissions(bin, fs::perms::owner_all, fs::perm_options::add);
    write_text(prefix.path() / "payments.json", kPaymentsDocument);

    const std::string cmd = std::format("cd {} && {} -i payments.json -o manifest.json --format json 2> stderr.txt",
                                        quote_path(prefix.path()),
                                        quote_path(bin));
    EXPECT_EQ(run_command(cmd), 1) << cmd;
    EXPECT_FALSE(fs::exists(prefix.path() / "manifest.json"));
    EXPECT_NE(read_text(prefix.path() / "stderr.txt").find("declarations schema validation failed"),
              std::string::npos);
}

TEST(CliE2E, MissingInputFileFails)
{
    TempDir temp("jsonts_cli_missing");
    const fs::path output = temp.path() / "out.ts";
    const std::string cmd = std::format("{} -i {} -o {} 2> {}",
                                        quote_path(jsonts_bin()),
                                        quote_path(temp.path() / "does-not-exist.json"),
                                        quote_path(output),
                                        quote_path(temp.path() / "stderr.txt"));
    EXPECT_EQ(run_command(cmd), 1) << cmd;
    EXPECT_FALSE(fs::exists(output));
    EXPECT_NE(read_text(temp.path() / "stderr.txt").find("Failed to open input file"), std::string::npos);
}

TEST(CliE2E, MalformedJsonFails)
{
    TempDir temp("jsonts_cli_malformed");
    const fs::path input = temp.path() / "broken.json";
    const fs::path output = temp.path() / "out.ts";
    write_text(input, R"({"payments": [1, 2,)");

    const std::string cmd = std::format("{} -i {} -o {} 2> {}",
                                        quote_path(jsonts_bin()),
                                        quote_path(input),
                                        quote_path(output),
                                        quote_path(temp.path() / "stderr.txt"));
    EXPECT_EQ(run_command(cmd), 1) << cmd;
    EXPECT_FALSE(fs::exists(output));
    EXPECT_NE(read_text(temp.path() / "stderr.txt").find("Failed to parse JSON file"), std::string::npos);
}

TEST(CliE2E, InvalidArgumentsFail)
{
    TempDir temp("jsonts_cli_args");
    const fs::path input = temp.path() / "doc.json";
    write_text(input, "{}");
    const std::string bin = quote_path(jsonts_bin());
    const std::string quiet = " > /dev/null 2>&1";

    EXPECT_EQ(run_command(bin + quiet), 1);
    EXPECT_EQ(run_command(bin + " -i " + quote_path(input) + " --squash maybe" + quiet), 1);
    EXPECT_EQ(run_command(bin + " -i " + quote_path(input) + " --format yaml" + quiet), 1);
    EXPECT_EQ(run_command(bin + " -i " + quote_path(input) + " --root-name 9lives" + quiet), 1);
    EXPECT_EQ(run_command(bin + " -i " + quote_path(input) + " --bogus x" + quiet), 1);
    EXPECT_EQ(run_command(bin + " -i" + quiet), 1);
}

TEST(CliE2E, HelpAndVersion)
{
    const std::string bin = quote_path(jsonts_bin());
    EXPECT_EQ(run_command(bin + " --help > /dev/null"), 0);
    EXPECT_EQ(run_command(bin + " --version > /dev/null"), 0);
}
