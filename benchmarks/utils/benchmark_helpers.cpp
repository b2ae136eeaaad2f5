/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>

namespace kcenon::vfs_transfer::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::string {
    std::string data(size, '\0');

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<char>(dis(gen));
    }

    return data;
}

// temp_tree_manager implementation

temp_tree_manager::temp_tree_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("vfs_transfer_benchmarks_" + std::to_string(std::random_device{}()));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_tree_manager::~temp_tree_manager() {
    cleanup();
}

auto temp_tree_manager::create_random_file(const std::string& relative,
                                           std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    auto path = base_dir_ / relative;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_tree_manager::create_tree(const std::string& name,
                                    std::size_t file_count,
                                    std::size_t file_size,
                                    std::size_t fanout) -> std::filesystem::path {
    if (fanout == 0) {
        fanout = 1;
    }
    for (std::size_t i = 0; i < file_count; ++i) {
        auto relative = name + "/d" + std::to_string(i % fanout) + "/f" + std::to_string(i);
        create_random_file(relative, file_size, static_cast<uint32_t>(i + 1));
    }
    return base_dir_ / name;
}

auto temp_tree_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_tree_manager::remove(const std::string& relative) {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_ / relative, ec);
}

void temp_tree_manager::cleanup() {
    if (!owns_dir_) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

}  // namespace kcenon::vfs_transfer::benchmark
