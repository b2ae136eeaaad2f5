/**
 * @file local_download_example.cpp
 * @brief Download a file or directory tree with the local backend
 *
 * This example demonstrates:
 * - Constructing a backend through the capability gate
 * - Downloading files and directories with a bounded worker count
 * - Using progress callbacks to monitor a directory download
 * - Verifying the result with backend checksums
 */

#include <kcenon/vfs_transfer/vfs_transfer.h>

#include <atomic>
#include <iostream>
#include <string>

using namespace kcenon::vfs_transfer;

namespace {

/**
 * @brief Prints one line per finished file
 */
class file_counter : public progress_callback {
public:
    void relative_update(uint64_t increment) override {
        auto done = completed_.fetch_add(increment) + increment;
        std::cout << "\r  files downloaded: " << done << std::flush;
    }

    [[nodiscard]] auto completed() const -> uint64_t { return completed_.load(); }

private:
    std::atomic<uint64_t> completed_{0};
};

void print_usage(const char* program) {
    std::cout << "Local Download Example" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source> <destination>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -j, --jobs <n>    Number of parallel workers for directories" << std::endl;
    std::cout << "  --file            Treat the source as a single file" << std::endl;
    std::cout << "  --count-files     Print a file counter instead of a progress bar" << std::endl;
    std::cout << "  --no-progress     Disable the progress display" << std::endl;
    std::cout << "  --verify          Compare source and destination checksums" << std::endl;
    std::cout << "  --json-logs       Emit log lines as JSON" << std::endl;
    std::cout << "  --help            Show this help message" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    download_options options;
    bool verify = false;
    bool count_files = false;
    std::string source;
    std::string destination;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-j" || arg == "--jobs") {
            if (++i >= argc) {
                std::cerr << "Error: --jobs requires an argument" << std::endl;
                return 1;
            }
            options.jobs = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "--file") {
            options.file_only = true;
        } else if (arg == "--count-files") {
            count_files = true;
        } else if (arg == "--no-progress") {
            options.no_progress_bar = true;
        } else if (arg == "--verify") {
            verify = true;
        } else if (arg == "--json-logs") {
            get_logger().set_output_format(log_output_format::json);
        } else if (arg[0] != '-') {
            if (source.empty()) {
                source = arg;
            } else if (destination.empty()) {
                destination = arg;
            }
        }
    }

    if (source.empty() || destination.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto backend_result = make_filesystem<local_filesystem>(filesystem_config{});
    if (!backend_result.has_value()) {
        std::cerr << "Failed to create backend: " << backend_result.error().message << std::endl;
        return 1;
    }
    auto backend = backend_result.value();

    file_counter counter;
    if (count_files) {
        options.callback = &counter;
    }

    transfer_orchestrator orchestrator(*backend, backend);
    auto from = path_info::from_url(source);
    auto to = path_info::from_url(destination);

    std::cout << "Downloading " << from << " -> " << to << std::endl;
    auto downloaded = orchestrator.download(from, to, options);
    if (count_files) {
        std::cout << std::endl;
    }

    if (!downloaded.has_value()) {
        std::cerr << "Download failed: " << downloaded.error().message << std::endl;
        std::cerr << "  code: " << to_string(downloaded.error().code) << std::endl;
        return 1;
    }
    std::cout << "Download completed" << std::endl;

    if (verify) {
        auto expected = backend->checksum(from);
        auto actual = backend->checksum(to);
        if (!expected.has_value() || !actual.has_value()) {
            std::cerr << "Verification failed: checksum unavailable" << std::endl;
            return 1;
        }
        if (expected.value() != actual.value()) {
            std::cerr << "Verification failed: " << expected.value() << " != " << actual.value()
                      << std::endl;
            return 1;
        }
        std::cout << "Verified checksum " << actual.value() << std::endl;
    }

    return 0;
}
