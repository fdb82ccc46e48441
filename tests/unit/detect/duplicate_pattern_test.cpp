#include <gtest/gtest.h>
#include <scry/detect/duplicate_pattern.h>

using namespace scry::detect;

namespace {

ConditionalChain chain(std::string file, uint32_t line, std::vector<std::string> branches) {
    ConditionalChain c;
    c.file = std::move(file);
    c.line = line;
    c.branches = std::move(branches);
    return c;
}

const std::vector<std::string> kShape = {"CMP:==", "CMP:==", "ELSE"};

} // namespace

TEST(DuplicatePatternTest, ThreeIdenticalChainsProduceOneFinding) {
    DuplicatePatternDetector detector;
    detector.add(chain("b.py", 4, kShape));
    detector.add(chain("a.py", 30, kShape));
    detector.add(chain("a.py", 10, kShape));

    auto findings = detector.findings();
    ASSERT_EQ(findings.size(), 1u);
    const auto& f = findings.front();
    EXPECT_EQ(f.kind, FindingKind::DuplicatePattern);
    EXPECT_EQ(f.severity, Severity::Medium);
    EXPECT_EQ(f.file, "a.py");
    EXPECT_EQ(f.line, 10u);
    EXPECT_EQ(f.metadata["occurrences"], 3);
    EXPECT_EQ(f.metadata["signature"], "CMP:==|CMP:==|ELSE");
    EXPECT_EQ(f.metadata["hash"], DuplicatePatternDetector::signatureHash("CMP:==|CMP:==|ELSE"));
    ASSERT_EQ(f.metadata["locations"].size(), 3u);
    EXPECT_EQ(f.metadata["locations"][2]["file"], "b.py");
}

TEST(DuplicatePatternTest, TwoOccurrencesProduceNothing) {
    DuplicatePatternDetector detector;
    detector.add(chain("a.py", 1, kShape));
    detector.add(chain("b.py", 1, kShape));
    EXPECT_TRUE(detector.findings().empty());
}

TEST(DuplicatePatternTest, ShortChainsAreIgnored) {
    DuplicatePatternDetector detector;
    for (uint32_t i = 1; i <= 5; ++i)
        detector.add(chain("a.py", i, {"CMP:<", "ELSE"}));
    EXPECT_EQ(detector.trackedChains(), 0u);
    EXPECT_TRUE(detector.findings().empty());
}

TEST(DuplicatePatternTest, DifferentOperatorClassesDoNotGroup) {
    DuplicatePatternDetector detector;
    detector.add(chain("a.py", 1, {"CMP:==", "CMP:==", "ELSE"}));
    detector.add(chain("a.py", 9, {"CMP:<", "CMP:==", "ELSE"}));
    detector.add(chain("a.py", 19, {"BOOL:and", "CMP:==", "ELSE"}));
    EXPECT_EQ(detector.trackedChains(), 3u);
    EXPECT_TRUE(detector.findings().empty());
}

TEST(DuplicatePatternTest, EvidenceIsCapped) {
    DuplicatePatternDetector detector;
    for (uint32_t i = 1; i <= 7; ++i)
        detector.add(chain("a.py", i * 10, kShape));

    auto findings = detector.findings();
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].metadata["occurrences"], 7);
    EXPECT_EQ(findings[0].metadata["locations"].size(), 4u);
}
