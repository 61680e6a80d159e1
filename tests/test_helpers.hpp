#pragma once

#include <gtest/gtest.h>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace rcopy::test {

// Отдельный каталог на каждый тест, удаляется в деструкторе
class TempDir {
public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info
            ? fmt::format("{}.{}", info->test_suite_name(), info->name())
            : std::string("rcopy");
        path_ = std::filesystem::temp_directory_path()
              / fmt::format("rcopy_test_{}_{}", name, ::getpid());
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto operator/(std::string_view name) const -> std::filesystem::path {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

inline std::vector<char> make_pattern(std::size_t size, std::uint32_t seed = 42) {
    std::vector<char> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto& b : data) {
        b = static_cast<char>(dist(gen));
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const std::vector<char>& data) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ASSERT_TRUE(ofs.good()) << "cannot write " << path;
}

inline void write_text(const std::filesystem::path& path, std::string_view text) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    ASSERT_TRUE(ofs.good()) << "cannot write " << path;
}

inline std::vector<char> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

} // namespace rcopy::test
