#pragma once

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace DurakTest {

/**
 * Throwaway resource directory, removed when the test ends.
 * Each instance gets a fresh path so process-wide caches never see a
 * recycled document.
 */
class TempBundle {
public:
    TempBundle() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info ? info->name() : "bundle";
        std::random_device rd;
        root = std::filesystem::temp_directory_path()
            / ("durak_" + name + "_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(root);
    }

    ~TempBundle() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    TempBundle(const TempBundle&) = delete;
    TempBundle& operator=(const TempBundle&) = delete;

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        auto target = root / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream file(target, std::ios::binary | std::ios::trunc);
        file << content;
        return target;
    }

    std::filesystem::path writeMetadata(const nlohmann::json& sets,
                                        const std::string& relative = "metadata.json") const {
        return write(relative, nlohmann::json{{"sets", sets}}.dump(2));
    }

    const std::filesystem::path& path() const { return root; }

private:
    std::filesystem::path root;
};

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace DurakTest
