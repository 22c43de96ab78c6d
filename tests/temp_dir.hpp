#ifndef FERRY_TEMP_DIR_HPP
#define FERRY_TEMP_DIR_HPP

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

// Fixture that gives every test its own scratch directory.
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        std::random_device rd;
        dir = std::filesystem::temp_directory_path() / ("ferry-test-" + std::to_string(rd()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path write_lines(const std::string& name, const std::vector<std::string>& lines) {
        auto path = dir / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        for (const auto& line : lines) out << line << '\n';
        return path;
    }

    void append_lines(const std::string& name, const std::vector<std::string>& lines) {
        std::ofstream out(dir / name, std::ios::binary | std::ios::app);
        for (const auto& line : lines) out << line << '\n';
    }
};

#endif //FERRY_TEMP_DIR_HPP
