// =============================================================================
// gzchunk - Test Support
// =============================================================================
// Temporary files and byte helpers shared by the test suites.
// =============================================================================

#ifndef GZC_TESTS_TEST_SUPPORT_H
#define GZC_TESTS_TEST_SUPPORT_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>
#include <vector>

namespace gzc::test {

/// @brief Generate a unique temporary file path (the file is not created).
[[nodiscard]] inline std::filesystem::path tempFilePath(const std::string& suffix) {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("gzc_test_" + std::to_string(counter++) + "_" +
            std::to_string(std::random_device{}()) + suffix);
}

/// @brief RAII cleanup for temporary files.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

[[nodiscard]] inline std::vector<std::uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                     std::istreambuf_iterator<char>());
}

/// @brief Compressible but non-trivial content (text-like with a seeded PRNG).
[[nodiscard]] inline std::vector<std::uint8_t> makeContent(std::size_t size,
                                                           std::uint32_t seed = 42) {
    static constexpr char kAlphabet[] = "ACGTN acgt\n";
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);
    std::vector<std::uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(kAlphabet[pick(rng)]);
    }
    return data;
}

/// @brief Incompressible content.
[[nodiscard]] inline std::vector<std::uint8_t> makeRandomBytes(std::size_t size,
                                                               std::uint32_t seed = 7) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> byteDist(0, 255);
    std::vector<std::uint8_t> data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(byteDist(rng));
    }
    return data;
}

}  // namespace gzc::test

#endif  // GZC_TESTS_TEST_SUPPORT_H
