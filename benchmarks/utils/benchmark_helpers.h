/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_VFS_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_VFS_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::vfs_transfer::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::string;

/**
 * @brief Scratch directory for benchmark trees, removed on destruction
 */
class temp_tree_manager {
public:
    /**
     * @param base_dir Base directory (default: a fresh directory under the system temp dir)
     */
    explicit temp_tree_manager(const std::filesystem::path& base_dir = {});

    ~temp_tree_manager();

    temp_tree_manager(const temp_tree_manager&) = delete;
    auto operator=(const temp_tree_manager&) -> temp_tree_manager& = delete;

    /**
     * @brief Create a file with random content
     * @param relative Path below the base directory; parents are created
     */
    auto create_random_file(const std::string& relative, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create a tree of @p file_count files spread over @p fanout subdirectories
     * @return Root of the tree
     */
    auto create_tree(const std::string& name,
                     std::size_t file_count,
                     std::size_t file_size,
                     std::size_t fanout = 4) -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Remove everything below @p relative
     */
    void remove(const std::string& relative);

    void cleanup();

private:
    std::filesystem::path base_dir_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 4 * KB;
constexpr std::size_t medium_file = 256 * KB;
constexpr std::size_t large_file = 16 * MB;
}  // namespace sizes

}  // namespace kcenon::vfs_transfer::benchmark

#endif  // KCENON_VFS_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
