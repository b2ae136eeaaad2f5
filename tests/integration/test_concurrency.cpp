/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for directory downloads
 *
 * This file contains tests for:
 * - Cancellation of files not yet started after a failure
 * - Readers polling a destination while it is being downloaded
 * - Several directory downloads sharing one backend
 * - Bounded fan-out under load
 */

#include "test_fixtures.h"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace kcenon::vfs_transfer::test {

// =============================================================================
// Concurrency Test Fixtures
// =============================================================================

class ConcurrentDownloadTest : public TransferFixture {
protected:
    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
        TransferFixture::TearDown();
    }

    auto populate(const std::string& root, int count, const std::string& content = "payload")
        -> void {
        for (int i = 0; i < count; ++i) {
            remote_->add_file(root + "/f" + std::to_string(i), content);
        }
    }

    auto download_async(const std::string& from, const std::string& to, std::size_t jobs)
        -> std::future<result<void>> {
        return std::async(std::launch::async, [this, from, to, jobs]() {
            transfer_orchestrator orchestrator(*remote_, local_);
            download_options options;
            options.no_progress_bar = true;
            options.jobs = jobs;
            return orchestrator.download(path_info("mem", from), local_path(to), options);
        });
    }
};

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST_F(ConcurrentDownloadTest, NoFileStartsAfterFailure) {
    populate("/a", 10);
    remote_->block_on("/a/f0");
    remote_->fail_on("/a/f1");

    std::promise<void> cancelled;
    std::once_flag once;
    get_logger().set_level(log_level::debug);
    get_logger().set_callback([&](log_level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        if (category == log_category::scheduler &&
            message.find("Cancelling remaining files") != std::string_view::npos) {
            std::call_once(once, [&] { cancelled.set_value(); });
        }
    });

    auto pending = download_async("/a", "b", 2);

    bool blocked = remote_->wait_until_started("/a/f0");
    auto cancel_status = cancelled.get_future().wait_for(std::chrono::seconds(5));
    remote_->release();

    auto done = pending.get();

    ASSERT_TRUE(blocked);
    ASSERT_EQ(cancel_status, std::future_status::ready);
    ASSERT_FALSE(done.has_value());
    EXPECT_EQ(done.error().code, error_code::transfer_failed);

    auto started = remote_->started();
    std::sort(started.begin(), started.end());
    EXPECT_EQ(started, (std::vector<std::string>{"/a/f0", "/a/f1"}));

    // The file in flight when the failure happened still completes
    EXPECT_EQ(read_file(download_dir_ / "b/f0"), "payload");
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "b/f1"));
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "b/f2"));
    EXPECT_TRUE(temporary_files(download_dir_).empty());
}

TEST_F(ConcurrentDownloadTest, OnlyFirstOfSeveralFailuresIsReturned) {
    populate("/a", 12, std::string(40, 'x'));
    for (int i = 0; i < 12; i += 3) {
        remote_->fail_on("/a/f" + std::to_string(i));
    }
    remote_->set_delay(std::chrono::milliseconds(5));

    auto done = download_async("/a", "b", 4).get();

    ASSERT_FALSE(done.has_value());
    EXPECT_EQ(done.error().code, error_code::transfer_failed);
    EXPECT_NE(done.error().message.find("connection reset"), std::string::npos);
    EXPECT_TRUE(temporary_files(download_dir_).empty());

    // Whatever did land is complete
    std::error_code ec;
    if (std::filesystem::exists(download_dir_ / "b", ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(download_dir_ / "b")) {
            EXPECT_EQ(std::filesystem::file_size(entry.path()), 40u) << entry.path();
        }
    }
}

// =============================================================================
// Visibility Tests
// =============================================================================

TEST_F(ConcurrentDownloadTest, PollerNeverSeesPartialFile) {
    const std::string content(64 * 1024, 'p');
    remote_->add_file("/big", content);
    remote_->set_delay(std::chrono::milliseconds(50));
    auto target = download_dir_ / "big";

    std::atomic<bool> finished{false};
    std::atomic<int> partial_sightings{0};
    std::atomic<int> complete_sightings{0};
    std::thread poller([&] {
        while (!finished.load()) {
            std::error_code ec;
            auto size = std::filesystem::file_size(target, ec);
            if (!ec) {
                if (size == content.size()) {
                    complete_sightings.fetch_add(1);
                } else {
                    partial_sightings.fetch_add(1);
                }
            }
            std::this_thread::yield();
        }
    });

    transfer_orchestrator orchestrator(*remote_, local_);
    download_options options;
    options.no_progress_bar = true;
    auto done = orchestrator.download(path_info("mem", "/big"), path_info::local(target), options);
    finished.store(true);
    poller.join();

    ASSERT_TRUE(done.has_value()) << done.error().message;
    EXPECT_EQ(partial_sightings.load(), 0);
    EXPECT_EQ(read_file(target), content);
}

// =============================================================================
// Load Tests
// =============================================================================

TEST_F(ConcurrentDownloadTest, ParallelDirectoryDownloadsShareBackend) {
    constexpr int directories = 4;
    for (int d = 0; d < directories; ++d) {
        populate("/dir" + std::to_string(d), 6, "content " + std::to_string(d));
    }

    std::vector<std::future<result<void>>> pending;
    for (int d = 0; d < directories; ++d) {
        pending.push_back(
            download_async("/dir" + std::to_string(d), "out" + std::to_string(d), 3));
    }

    for (int d = 0; d < directories; ++d) {
        auto done = pending[d].get();
        ASSERT_TRUE(done.has_value()) << done.error().message;
        for (int i = 0; i < 6; ++i) {
            EXPECT_EQ(read_file(download_dir_ / ("out" + std::to_string(d)) /
                                ("f" + std::to_string(i))),
                      "content " + std::to_string(d));
        }
    }
    EXPECT_EQ(remote_->started().size(), static_cast<std::size_t>(directories * 6));
}

TEST_F(ConcurrentDownloadTest, ManyFilesBoundedWorkers) {
    constexpr int files = 200;
    populate("/many", files);
    recording_callback callback;

    transfer_orchestrator orchestrator(*remote_, local_);
    download_options options;
    options.jobs = 8;
    options.callback = &callback;
    auto done = orchestrator.download(path_info("mem", "/many"), local_path("many"), options);

    ASSERT_TRUE(done.has_value()) << done.error().message;
    EXPECT_EQ(callback.total(), static_cast<uint64_t>(files));
    EXPECT_LE(remote_->max_active(), 8);

    std::size_t landed = 0;
    for (const auto& entry : std::filesystem::directory_iterator(download_dir_ / "many")) {
        (void)entry;
        ++landed;
    }
    EXPECT_EQ(landed, static_cast<std::size_t>(files));
}

}  // namespace kcenon::vfs_transfer::test
