// ═══════════════════════════════════════════════════════════════════
//  test_cli.cpp — Tests for the s2dm-rdf command line
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <s2dm/cli.h>
#include <s2dm/console.h>
#include <s2dm/fs.h>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace s2dm;

namespace {

const std::string NS = "https://covesa.org/s2dm/mydomain#";

struct RunResult {
    int code = -1;
    std::string out;
    std::string err;
};

class CliTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        console::setColors(false);
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() / (std::string("s2dm_cli_") + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
        console::setColors(true);
        console::setLevel(console::Level::Info);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto file = dir / name;
        fs::writeFileSync(file.string(), content);
        return file.string();
    }

    std::string output() const { return (dir / "out").string(); }

    RunResult run(std::vector<std::string> args) {
        args.insert(args.begin(), "s2dm-rdf");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);

        RunResult result;
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        result.code = cli::run(static_cast<int>(args.size()), argv.data());
        result.out = testing::internal::GetCapturedStdout();
        result.err = testing::internal::GetCapturedStderr();
        return result;
    }
};

} // namespace

TEST_F(CliTest, WritesBothArtifacts) {
    auto schema = write("cabin.graphql", "type Cabin { doors: [Door] } type Door { isOpen: Boolean }");
    auto r = run({"-s", schema, "-o", output(), "--namespace", NS});

    EXPECT_EQ(r.code, cli::kExitOk) << r.err;
    auto nt = fs::readFileSync(output() + "/schema.nt");
    EXPECT_NE(nt.find("<" + NS + "Cabin.doors>"), std::string::npos);
    EXPECT_TRUE(fs::existsSync(output() + "/schema.ttl"));
    EXPECT_NE(r.out.find("schema.nt"), std::string::npos);
}

TEST_F(CliTest, NestedListExitsWithFailureNamingTheField) {
    auto schema = write("grid.graphql", "type Grid { cells: [[Int]] }");
    auto r = run({"-s", schema, "-o", output(), "--namespace", NS});

    EXPECT_EQ(r.code, cli::kExitFailure);
    EXPECT_NE(r.err.find("UnsupportedShape"), std::string::npos) << r.err;
    EXPECT_NE(r.err.find("Grid.cells"), std::string::npos) << r.err;
    EXPECT_FALSE(fs::existsSync(output() + "/schema.nt"));
}

TEST_F(CliTest, MissingOutputIsUsageError) {
    auto schema = write("cabin.graphql", "type Cabin { id: ID }");
    auto r = run({"-s", schema, "--namespace", NS});

    EXPECT_EQ(r.code, cli::kExitUsage);
    EXPECT_NE(r.err.find("Usage:"), std::string::npos);
}

TEST_F(CliTest, UnknownOptionIsUsageError) {
    auto r = run({"--frobnicate"});
    EXPECT_EQ(r.code, cli::kExitUsage);
    EXPECT_NE(r.err.find("--frobnicate"), std::string::npos);
}

TEST_F(CliTest, OptionWithoutValueIsUsageError) {
    auto r = run({"-s"});
    EXPECT_EQ(r.code, cli::kExitUsage);
}

TEST_F(CliTest, HelpExitsCleanly) {
    auto r = run({"--help"});
    EXPECT_EQ(r.code, cli::kExitOk);
    EXPECT_NE(r.out.find("Usage:"), std::string::npos);
}

TEST_F(CliTest, MissingNamespaceIsFailure) {
    auto schema = write("cabin.graphql", "type Cabin { id: ID }");
    auto r = run({"-s", schema, "-o", output()});

    EXPECT_EQ(r.code, cli::kExitFailure);
    EXPECT_NE(r.err.find("--namespace"), std::string::npos);
}

TEST_F(CliTest, QueryOnlySchemaWritesEmptyArtifacts) {
    auto schema = write("query.graphql", "type Query { ping: String }");
    auto r = run({"-s", schema, "-o", output(), "--namespace", NS});

    EXPECT_EQ(r.code, cli::kExitOk) << r.err;
    EXPECT_EQ(fs::readFileSync(output() + "/schema.nt"), "");

    std::istringstream ttl(fs::readFileSync(output() + "/schema.ttl"));
    std::string line;
    while (std::getline(ttl, line)) {
        if (!line.empty()) EXPECT_EQ(line.rfind("@prefix ", 0), 0u) << line;
    }
}

TEST_F(CliTest, RejectRootReferencesFlag) {
    auto schema = write("cabin.graphql", "type Query { cabin: Cabin } type Cabin { owner: Query }");

    EXPECT_EQ(run({"-s", schema, "-o", output(), "--namespace", NS}).code, cli::kExitOk);

    auto r = run({"-s", schema, "-o", output(), "--namespace", NS, "--reject-root-references"});
    EXPECT_EQ(r.code, cli::kExitFailure);
    EXPECT_NE(r.err.find("Cabin.owner"), std::string::npos) << r.err;
}
