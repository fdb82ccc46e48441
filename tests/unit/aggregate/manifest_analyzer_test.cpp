#include "test_helpers.h"
#include <gtest/gtest.h>
#include <scry/aggregate/manifest_analyzer.h>

using namespace scry;
using namespace scry::aggregate;
using namespace scry::test;

class ManifestAnalyzerTest : public ScryTest {};

TEST_F(ManifestAnalyzerTest, PackageJsonReadsBothDependencySections) {
    auto path = writeFile("package.json", R"({
  "name": "web",
  "dependencies": {"react": "^18.0.0", "next": "14.0.0"},
  "devDependencies": {"tailwindcss": "^3.4.0"}
})");
    auto deps = parsePackageJson(path);
    ASSERT_TRUE(deps) << deps.error().message;
    EXPECT_EQ(deps.value(), (std::vector<std::string>{"next", "react", "tailwindcss"}));
}

TEST_F(ManifestAnalyzerTest, MalformedPackageJsonIsAParseError) {
    auto path = writeFile("package.json", "{ \"dependencies\": ");
    EXPECT_THAT(parsePackageJson(path), HasErrorCode(ErrorCode::ParseError));
}

TEST_F(ManifestAnalyzerTest, RequirementsStripVersionsExtrasAndOptions) {
    auto path = writeFile("requirements.txt", R"(# web stack
fastapi==0.110.0
uvicorn[standard]>=0.29
-r dev.txt
requests ; python_version > "3.8"

Django~=5.0
)");
    auto deps = parseRequirements(path);
    ASSERT_TRUE(deps);
    EXPECT_EQ(deps.value(),
              (std::vector<std::string>{"fastapi", "uvicorn", "requests", "Django"}));
}

TEST_F(ManifestAnalyzerTest, GoModRequireLinesAndBlocks) {
    auto path = writeFile("go.mod", R"(module example.com/app

go 1.22

require github.com/gin-gonic/gin v1.9.1

require (
	github.com/stretchr/testify v1.9.0 // indirect
	golang.org/x/text v0.14.0
)
)");
    auto deps = parseGoMod(path);
    ASSERT_TRUE(deps);
    EXPECT_EQ(deps.value(), (std::vector<std::string>{"github.com/gin-gonic/gin",
                                                      "github.com/stretchr/testify",
                                                      "golang.org/x/text"}));
}

TEST_F(ManifestAnalyzerTest, CargoTomlDependencyKeys) {
    auto path = writeFile("Cargo.toml", R"([package]
name = "svc"
version = "0.1.0"

[dependencies]
axum = "0.7"
serde = { version = "1", features = ["derive"] }

[dev-dependencies]
proptest = "1"
)");
    auto deps = parseCargoToml(path);
    ASSERT_TRUE(deps);
    EXPECT_EQ(deps.value(), (std::vector<std::string>{"axum", "serde"}));
    EXPECT_THAT(parseCargoToml(testDir / "nope.toml"), HasErrorCode(ErrorCode::FileNotFound));
}

TEST_F(ManifestAnalyzerTest, FrameworksFollowPatternTableOrder) {
    std::map<std::string, std::vector<std::string>> deps = {
        {"npm", {"react-dom", "Express"}},
        {"pip", {"flask"}},
        {"go", {"github.com/gin-gonic/gin"}},
    };
    EXPECT_EQ(detectFrameworks(deps),
              (std::vector<std::string>{"Flask", "React", "Express", "Gin"}));
    EXPECT_TRUE(detectFrameworks({}).empty());
}

TEST_F(ManifestAnalyzerTest, ReduxInSmallProjectRaisesArchPurity) {
    writeFile("package.json", R"({"dependencies": {"react": "18", "@reduxjs/toolkit": "2"}})");
    std::vector<std::filesystem::path> files = {testDir / "package.json"};
    for (int i = 0; i < 5; ++i)
        files.push_back(testDir / "src" / scry::format("C{}.tsx", i));

    auto report = analyzeManifests(testDir, files);
    ASSERT_EQ(report.dependencies.count("npm"), 1u);
    EXPECT_EQ(report.frameworks, (std::vector<std::string>{"React"}));
    ASSERT_EQ(report.findings.size(), 1u);
    const auto& f = report.findings[0];
    EXPECT_EQ(f.kind, detect::FindingKind::ArchPurity);
    EXPECT_EQ(f.severity, detect::Severity::High);
    EXPECT_EQ(f.file, "package.json");
    EXPECT_EQ(f.message, "Redux detected in small project (5 components).");
    EXPECT_EQ(f.metadata["tsx_files"], 5);
}

TEST_F(ManifestAnalyzerTest, ReduxInLargeProjectIsFine) {
    writeFile("package.json", R"({"dependencies": {"redux": "5"}})");
    std::vector<std::filesystem::path> files;
    for (int i = 0; i < 20; ++i)
        files.push_back(testDir / scry::format("C{}.tsx", i));
    EXPECT_TRUE(analyzeManifests(testDir, files).findings.empty());
}

TEST_F(ManifestAnalyzerTest, BrokenManifestIsLeftOut) {
    writeFile("package.json", "not json");
    writeFile("requirements.txt", "django\n");
    auto report = analyzeManifests(testDir, {});
    EXPECT_EQ(report.dependencies.count("npm"), 0u);
    EXPECT_EQ(report.dependencies.at("pip"), (std::vector<std::string>{"django"}));
    EXPECT_EQ(report.frameworks, (std::vector<std::string>{"Django"}));
}
