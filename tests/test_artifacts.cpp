// ═══════════════════════════════════════════════════════════════════
//  test_artifacts.cpp — Tests for writing the .nt / .ttl artifacts
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <s2dm/artifacts.h>
#include <s2dm/console.h>
#include <s2dm/fs.h>
#include <s2dm/sdl_parser.h>
#include <s2dm/serializer.h>
#include <filesystem>
#include <sstream>

using namespace s2dm;
using namespace s2dm::rdf;

namespace {

const std::string NS = "https://covesa.org/s2dm/mydomain#";

class ArtifactsTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        console::setLevel(console::Level::Silent);
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("s2dm_artifacts_") + info->name());
        std::filesystem::remove_all(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
        console::setLevel(console::Level::Info);
    }

    MaterializeResult materialize(const std::string& sdl) {
        return materializeSchema(sdl::parseSchema(sdl), MaterializerConfig::from(NS));
    }

    std::size_t leftoverTempFiles() const {
        std::size_t count = 0;
        for (auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.path().extension() == ".tmp") ++count;
        }
        return count;
    }
};

} // namespace

TEST_F(ArtifactsTest, WritesBothForms) {
    auto result = materialize("type Cabin { doors: [Door] } type Door { isOpen: Boolean }");
    auto paths = writeArtifacts(result, dir.string());

    EXPECT_EQ(std::filesystem::path(paths.ntriples), dir / "schema.nt");
    EXPECT_EQ(std::filesystem::path(paths.turtle), dir / "schema.ttl");
    ASSERT_TRUE(fs::existsSync(paths.ntriples));
    ASSERT_TRUE(fs::existsSync(paths.turtle));

    EXPECT_EQ(fs::readFileSync(paths.ntriples), serializeNTriples(result.triples));
    EXPECT_EQ(fs::readFileSync(paths.turtle), serializeTurtle(result.triples, result.config));
    EXPECT_EQ(leftoverTempFiles(), 0u);
}

TEST_F(ArtifactsTest, CreatesNestedOutputDirectory) {
    auto nested = (dir / "a" / "b").string();
    auto paths = writeArtifacts(materialize("enum Kind { SUV }"), nested, "vehicle");

    EXPECT_TRUE(fs::existsSync((dir / "a" / "b" / "vehicle.nt").string()));
    EXPECT_TRUE(fs::existsSync((dir / "a" / "b" / "vehicle.ttl").string()));
    EXPECT_EQ(std::filesystem::path(paths.turtle).filename(), "vehicle.ttl");
}

TEST_F(ArtifactsTest, OverwritesPreviousRun) {
    writeArtifacts(materialize("enum Kind { SUV }"), dir.string());
    auto second = materialize("enum Kind { VAN }");
    auto paths = writeArtifacts(second, dir.string());

    auto nt = fs::readFileSync(paths.ntriples);
    EXPECT_EQ(nt.find("Kind.SUV"), std::string::npos);
    EXPECT_NE(nt.find("Kind.VAN"), std::string::npos);
    EXPECT_EQ(leftoverTempFiles(), 0u);
}

TEST_F(ArtifactsTest, EmptySchemaWritesEmptyArtifacts) {
    auto result = materialize("type Query { ping: String }");
    ASSERT_TRUE(result.emptySchema);

    auto paths = writeArtifacts(result, dir.string());
    EXPECT_EQ(fs::readFileSync(paths.ntriples), "");

    // prefix declarations only
    auto ttl = fs::readFileSync(paths.turtle);
    EXPECT_NE(ttl.find("@prefix ns:"), std::string::npos);
    std::istringstream in(ttl);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) EXPECT_EQ(line.rfind("@prefix ", 0), 0u) << line;
    }
}

TEST_F(ArtifactsTest, IdenticalInputGivesIdenticalBytes) {
    auto sdl = "type Cabin { kind: CabinKindEnum } enum CabinKindEnum { SUV VAN }";
    auto first = writeArtifacts(materialize(sdl), (dir / "one").string());
    auto second = writeArtifacts(materialize(sdl), (dir / "two").string());

    EXPECT_EQ(fs::readFileSync(first.ntriples), fs::readFileSync(second.ntriples));
    EXPECT_EQ(fs::readFileSync(first.turtle), fs::readFileSync(second.turtle));
}

TEST_F(ArtifactsTest, UnwritableDirectoryThrows) {
    // a regular file where the output directory should be
    std::filesystem::create_directories(dir);
    auto blocker = (dir / "file").string();
    fs::writeFileSync(blocker, "x");

    EXPECT_ANY_THROW(writeArtifacts(materialize("enum Kind { SUV }"), blocker));
}

TEST_F(ArtifactsTest, FailedRenameLeavesNoMismatchedPair) {
    auto result = materialize("type Cabin { isOpen: Boolean }");

    // a non-empty directory where schema.nt should go makes the last rename fail
    std::filesystem::create_directories(dir / "schema.nt" / "occupied");
    EXPECT_THROW(writeArtifacts(result, dir.string()), std::filesystem::filesystem_error);

    EXPECT_FALSE(fs::existsSync((dir / "schema.ttl").string()));
    EXPECT_TRUE(std::filesystem::is_directory(dir / "schema.nt"));
    EXPECT_EQ(leftoverTempFiles(), 0u);
}
