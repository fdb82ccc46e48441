#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <scry/core/format.h>
#include <scry/core/types.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scry::test {

// Base fixture: a fresh scratch directory per test, removed on teardown
class ScryTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / generateTestId();
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    // Writes content to testDir / relative, creating parent directories
    std::filesystem::path writeFile(std::string_view relative, std::string_view content) {
        auto path = testDir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if (!file) {
            throw std::runtime_error("Failed to create test file");
        }
        return path;
    }

    std::filesystem::path testDir;

private:
    static std::string generateTestId() {
        static std::mt19937_64 rng{std::random_device{}()};
        auto now = std::chrono::system_clock::now().time_since_epoch().count();
        return scry::format("scry_test_{}_{}", now, rng());
    }
};

// A python function `name` spanning exactly `lines` lines, body of plain assignments
inline std::string pythonFunction(std::string_view name, int lines, bool annotated = false) {
    std::string out = scry::format("def {}(){}:\n", name, annotated ? " -> int" : "");
    for (int i = 1; i < lines - 1; ++i) {
        out += scry::format("    x{} = {}\n", i, i);
    }
    out += "    return 0\n";
    return out;
}

MATCHER_P(HasErrorCode, code, "Result has expected error code") {
    return !arg.has_value() && arg.error() == code;
}

struct TestVectors {
    static constexpr std::string_view EMPTY_SHA256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    static constexpr std::string_view ABC_SHA256 =
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
};

} // namespace scry::test
