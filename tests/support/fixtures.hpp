#pragma once

/// @file fixtures.hpp
/// @brief Temporary plugin trees for tests

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace coframe_test {

/// Unique directory under the system temp path, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "coframe_test_") {
        static int counter = 0;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 (prefix + std::to_string(stamp) + "_" + std::to_string(++counter));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /// Write a file relative to the directory, creating parents
    std::filesystem::path write(const std::filesystem::path& relative, const std::string& content) const {
        auto full = m_path / relative;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream file(full, std::ios::binary | std::ios::trunc);
        file << content;
        return full;
    }

    /// Write `plugins/<name>/plugin.json` plus declaration documents
    std::filesystem::path write_plugin(
        const std::string& name,
        const std::string& manifest,
        const std::vector<std::pair<std::string, std::string>>& documents = {}) const {
        auto dir = std::filesystem::path("plugins") / name;
        write(dir / "plugin.json", manifest);
        for (const auto& [file, content] : documents) {
            write(dir / file, content);
        }
        return m_path / dir;
    }

private:
    std::filesystem::path m_path;
};

/// Read a whole file
inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace coframe_test
