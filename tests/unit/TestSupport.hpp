#pragma once

#include "cdi/ldconfig.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace cdihook::test {

// Fresh directory per test, removed afterwards.
class Workspace : public ::testing::Test {
protected:
    void SetUp() override {
        auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
        workspace = std::filesystem::temp_directory_path() / "cdihook_tests" /
                    (std::to_string(timestamp) + "_" +
                     std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        std::filesystem::create_directories(workspace);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(workspace, ec);
    }

    std::string path(const std::string& relative) const { return (workspace / relative).string(); }

    void write(const std::string& relative, const std::string& content) const {
        std::filesystem::path file = workspace / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream ofs(file, std::ios::binary | std::ios::trunc);
        ofs << content;
    }

    std::string read(const std::string& relative) const {
        std::ifstream ifs(workspace / relative, std::ios::binary);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

    std::vector<std::string> read_lines(const std::string& relative) const {
        std::vector<std::string> lines;
        std::ifstream ifs(workspace / relative);
        std::string line;
        while (std::getline(ifs, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::filesystem::path workspace;
};

// Records every command instead of running it.
class FakeCommandRunner : public CommandRunner {
public:
    ExecResult run(const std::vector<std::string>& args) override {
        calls.push_back(args);
        return result;
    }

    std::vector<std::vector<std::string>> calls;
    ExecResult result{0, ""};
};

}  // namespace cdihook::test
