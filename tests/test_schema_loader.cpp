// ═══════════════════════════════════════════════════════════════════
//  test_schema_loader.cpp — Tests for resolving schema sources
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <s2dm/console.h>
#include <s2dm/fs.h>
#include <s2dm/schema_loader.h>
#include <filesystem>

using namespace s2dm;

namespace {

class SchemaLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        console::setLevel(console::Level::Silent);
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("s2dm_loader_") + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
        console::setLevel(console::Level::Info);
    }

    std::string write(const std::string& relative, const std::string& content) {
        auto file = dir / relative;
        std::filesystem::create_directories(file.parent_path());
        fs::writeFileSync(file.string(), content);
        return file.string();
    }
};

} // namespace

TEST_F(SchemaLoaderTest, SingleFile) {
    auto file = write("cabin.graphql", "type Cabin { id: ID }");
    auto model = sdl::loadSchema({file});
    ASSERT_EQ(model.size(), 1u);
    EXPECT_NE(model.find("Cabin"), nullptr);
}

TEST_F(SchemaLoaderTest, DirectoryIsWalkedInSortedOrder) {
    write("b/door.gql", "type Door { isOpen: Boolean }");
    write("a.graphql", "type Cabin { doors: [Door] }");
    write("notes.txt", "not a schema {");

    auto sources = sdl::resolveSources({dir.string()});
    ASSERT_EQ(sources.size(), 2u);
    EXPECT_EQ(std::filesystem::path(sources[0]).filename(), "a.graphql");
    EXPECT_EQ(std::filesystem::path(sources[1]).filename(), "door.gql");

    auto model = sdl::loadSchema({dir.string()});
    ASSERT_EQ(model.size(), 2u);
    EXPECT_EQ(nameOf(model.types()[0]), "Cabin");
    EXPECT_EQ(nameOf(model.types()[1]), "Door");
}

TEST_F(SchemaLoaderTest, ExtensionAcrossFiles) {
    auto base = write("base.graphql", "type Cabin { id: ID }");
    auto ext = write("ext.graphql", "extend type Cabin { seats: Int }");

    auto model = sdl::loadSchema({ext, base});
    auto& cabin = std::get<ObjectTypeDefinition>(*model.find("Cabin"));
    EXPECT_EQ(cabin.fields.size(), 2u);
}

TEST_F(SchemaLoaderTest, ParseErrorNamesFileAndLine) {
    auto first = write("1.graphql", "type A { x: Int }\n");
    auto second = write("2.graphql", "type B {\n  y Int\n}\n");

    try {
        sdl::loadSchema({first, second});
        FAIL() << "expected SchemaParseError";
    } catch (const SchemaParseError& e) {
        EXPECT_EQ(e.source(), second);
        EXPECT_EQ(e.line(), 2u);
        EXPECT_EQ(e.column(), 5u);
        EXPECT_NE(std::string(e.what()).find("2.graphql:2:5"), std::string::npos);
    }
}

TEST_F(SchemaLoaderTest, FileWithoutTrailingNewline) {
    auto first = write("1.graphql", "type A { x: Int }");
    auto second = write("2.graphql", "type B {\n  y Int\n}");

    try {
        sdl::loadSchema({first, second});
        FAIL() << "expected SchemaParseError";
    } catch (const SchemaParseError& e) {
        EXPECT_EQ(e.source(), second);
        EXPECT_EQ(e.line(), 2u);
    }
}

TEST_F(SchemaLoaderTest, MissingPath) {
    EXPECT_THROW(sdl::loadSchema({(dir / "nope.graphql").string()}), SourceError);
    EXPECT_THROW(sdl::resolveSources({(dir / "nope").string()}), SourceError);
}

TEST_F(SchemaLoaderTest, EmptyDirectory) {
    std::filesystem::create_directories(dir / "empty");
    EXPECT_TRUE(sdl::resolveSources({(dir / "empty").string()}).empty());
    EXPECT_THROW(sdl::loadSchema({(dir / "empty").string()}), SourceError);
}

TEST_F(SchemaLoaderTest, JsonModel) {
    auto file = write("model.json", R"({
        "types": [ { "kind": "ENUM", "name": "Kind", "values": [ { "name": "SUV" } ] } ]
    })");
    auto model = sdl::loadSchema({file});
    ASSERT_EQ(model.size(), 1u);
    EXPECT_EQ(kindOf(model.types()[0]), TypeKind::Enum);
}

TEST_F(SchemaLoaderTest, JsonModelMustStandAlone) {
    auto json = write("model.json", R"({"types": []})");
    auto sdlFile = write("cabin.graphql", "type Cabin { id: ID }");
    EXPECT_THROW(sdl::loadSchema({json, sdlFile}), SourceError);
}

TEST_F(SchemaLoaderTest, InvalidJsonModel) {
    auto broken = write("broken.json", "{ \"types\": [");
    auto unknown = write("unknown.json", R"({"types": [{"kind": "DIRECTIVE", "name": "d"}]})");
    EXPECT_THROW(sdl::loadSchemaModelJson(broken), SourceError);
    EXPECT_THROW(sdl::loadSchemaModelJson(unknown), SourceError);
}

TEST_F(SchemaLoaderTest, UnreachableUrl) {
    EXPECT_THROW(sdl::loadSchema({"http://127.0.0.1:1/schema.graphql"}), SourceError);
}
