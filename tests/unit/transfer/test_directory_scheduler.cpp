/**
 * @file test_directory_scheduler.cpp
 * @brief Unit tests for directory_scheduler
 */

#include "test_fixtures.h"

namespace kcenon::vfs_transfer::test {

class DirectorySchedulerTest : public TransferFixture {
protected:
    auto download(const std::string& from, const std::string& to,
                  directory_transfer_options options = {})
        -> result<directory_transfer_summary> {
        options.no_progress_bar = true;
        directory_scheduler scheduler(*remote_, local_);
        return scheduler.download(path_info("mem", from), local_path(to), options);
    }
};

TEST_F(DirectorySchedulerTest, MirrorsTreeUnderDestination) {
    remote_->add_file("/a/x", "1234");
    remote_->add_file("/a/y/z", "0123456789");

    auto summary = download("/a", "b");

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().files_total, 2u);
    EXPECT_EQ(summary.value().workers, 2u);
    EXPECT_EQ(read_file(download_dir_ / "b/x"), "1234");
    EXPECT_EQ(read_file(download_dir_ / "b/y/z"), "0123456789");
    EXPECT_TRUE(temporary_files(download_dir_).empty());
}

TEST_F(DirectorySchedulerTest, EmptySourceCreatesDestination) {
    remote_->add_dir("/empty");

    auto summary = download("/empty", "b");

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().files_total, 0u);
    EXPECT_TRUE(std::filesystem::is_directory(download_dir_ / "b"));
    EXPECT_TRUE(std::filesystem::is_empty(download_dir_ / "b"));
}

TEST_F(DirectorySchedulerTest, WorkersNeverExceedFileCount) {
    remote_->add_file("/a/only", "1");

    directory_transfer_options options;
    options.jobs = 16;
    auto summary = download("/a", "b", options);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().workers, 1u);
}

TEST_F(DirectorySchedulerTest, ZeroJobsMeansOneWorker) {
    remote_->add_file("/a/1", "1");
    remote_->add_file("/a/2", "2");

    directory_transfer_options options;
    options.jobs = 0;
    auto summary = download("/a", "b", options);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().workers, 1u);
}

TEST_F(DirectorySchedulerTest, DefaultsToBackendJobs) {
    for (int i = 0; i < 10; ++i) {
        remote_->add_file("/a/f" + std::to_string(i), "data");
    }

    auto summary = download("/a", "b");

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().workers, remote_->jobs());
    EXPECT_EQ(summary.value().files_total, 10u);
}

TEST_F(DirectorySchedulerTest, ConcurrencyBoundedByJobs) {
    for (int i = 0; i < 8; ++i) {
        remote_->add_file("/a/f" + std::to_string(i), "payload");
    }
    remote_->set_delay(std::chrono::milliseconds(20));

    directory_transfer_options options;
    options.jobs = 2;
    auto summary = download("/a", "b", options);

    ASSERT_TRUE(summary.has_value());
    EXPECT_LE(remote_->max_active(), 2);
    EXPECT_GE(remote_->max_active(), 1);
    EXPECT_EQ(remote_->started().size(), 8u);
}

TEST_F(DirectorySchedulerTest, FirstFailureIsReturned) {
    remote_->add_file("/a/1", "one");
    remote_->add_file("/a/2", "two is broken");
    remote_->add_file("/a/3", "three");
    remote_->fail_on("/a/2");

    directory_transfer_options options;
    options.jobs = 1;
    auto summary = download("/a", "b", options);

    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::transfer_failed);
    EXPECT_NE(summary.error().message.find("mem:///a/2"), std::string::npos);

    EXPECT_EQ(read_file(download_dir_ / "b/1"), "one");
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "b/2"));
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "b/3"));
    EXPECT_TRUE(temporary_files(download_dir_).empty());

    // Nothing is started after the failure
    EXPECT_EQ(remote_->started(), (std::vector<std::string>{"/a/1", "/a/2"}));
}

TEST_F(DirectorySchedulerTest, ListingErrorIsReturned) {
    remote_->add_file("/a/1", "one");
    remote_->add_file("/a/2", "two");
    remote_->fail_listing_after(1);

    auto summary = download("/a", "b");

    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::file_read_error);
    EXPECT_EQ(summary.error().message, "listing interrupted");
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "b/2"));
}

TEST_F(DirectorySchedulerTest, ListingExceptionInWorkerIsReturned) {
    remote_->add_file("/a/1", "one");
    remote_->add_file("/a/2", "two");
    remote_->add_file("/a/3", "three");
    // Pass 1 counts, pass 2 feeds the workers
    remote_->throw_listing_on_pass(2, 1);

    directory_transfer_options options;
    options.jobs = 1;
    auto summary = download("/a", "b", options);

    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::transfer_failed);
    EXPECT_NE(summary.error().message.find("connection dropped while listing"),
              std::string::npos);
    EXPECT_EQ(read_file(download_dir_ / "b/1"), "one");
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "b/2"));
    EXPECT_TRUE(temporary_files(download_dir_).empty());
}

TEST_F(DirectorySchedulerTest, ListingExceptionWithSeveralWorkers) {
    for (int i = 0; i < 6; ++i) {
        remote_->add_file("/a/f" + std::to_string(i), "data");
    }
    remote_->throw_listing_on_pass(2, 2);

    directory_transfer_options options;
    options.jobs = 3;
    auto summary = download("/a", "b", options);

    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::transfer_failed);
    EXPECT_LE(remote_->started().size(), 2u);
}

TEST_F(DirectorySchedulerTest, BackendExceptionLeavesNoTemporaries) {
    remote_->add_file("/a/1", "one");
    remote_->add_file("/a/2", std::string(200, 'x'));
    remote_->throw_on("/a/2");

    directory_transfer_options options;
    options.jobs = 1;
    auto summary = download("/a", "b", options);

    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::transfer_failed);
    EXPECT_NE(summary.error().message.find("socket closed mid-transfer"), std::string::npos);
    EXPECT_NE(summary.error().message.find("mem:///a/2"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(download_dir_ / "b/2"));
    EXPECT_TRUE(temporary_files(download_dir_).empty());
}

TEST_F(DirectorySchedulerTest, ListsSourceOnceBeforeTransferring) {
    remote_->add_file("/a/x", "1");
    remote_->add_file("/a/y/z", "2");

    ASSERT_TRUE(download("/a", "b").has_value());

    // One counting pass, one pass shared by the workers
    EXPECT_EQ(remote_->listing_passes(), 2u);
}

TEST_F(DirectorySchedulerTest, EmptySourceListedOnce) {
    remote_->add_dir("/empty");

    ASSERT_TRUE(download("/empty", "b").has_value());

    EXPECT_EQ(remote_->listing_passes(), 1u);
}

TEST_F(DirectorySchedulerTest, NoFileStartsWhileFailureIsQueued) {
    remote_->add_file("/a/0", "fast");
    remote_->add_file("/a/1", "slow");
    remote_->add_file("/a/2", "broken");
    remote_->add_file("/a/3", "three");
    remote_->add_file("/a/4", "four");
    remote_->delay_on("/a/1", std::chrono::milliseconds(200));
    remote_->fail_on("/a/2");

    // Holds the consumer on the first completion, so the failure from /a/2
    // stays queued while /a/1 finishes.
    std::atomic<bool> first{true};
    function_callback slow_consumer([&](uint64_t) {
        if (first.exchange(false)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
    });

    directory_transfer_options options;
    options.jobs = 2;
    options.callback = &slow_consumer;
    auto summary = download("/a", "b", options);

    ASSERT_FALSE(summary.has_value());
    EXPECT_NE(summary.error().message.find("mem:///a/2"), std::string::npos);

    auto started = remote_->started();
    std::set<std::string> seen(started.begin(), started.end());
    EXPECT_EQ(seen, (std::set<std::string>{"/a/0", "/a/1", "/a/2"}));
    EXPECT_TRUE(temporary_files(download_dir_).empty());
}

TEST_F(DirectorySchedulerTest, UnlistableBackendFails) {
    minimal_filesystem bare;
    directory_scheduler scheduler(bare, local_);

    auto summary = scheduler.download(path_info("bare", "/a"), local_path("b"));

    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::action_not_supported);
}

TEST_F(DirectorySchedulerTest, CallbackCountsFiles) {
    remote_->add_file("/a/x", "1234");
    remote_->add_file("/a/y/z", "0123456789");
    remote_->add_file("/a/y/w", "");
    recording_callback callback;

    directory_transfer_options options;
    options.callback = &callback;
    auto summary = download("/a", "b", options);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(callback.total(), 3u);
    EXPECT_EQ(callback.updates(), 3u);
}

TEST_F(DirectorySchedulerTest, UsesInjectedPool) {
    remote_->add_file("/a/x", "1");
    remote_->add_file("/a/y", "2");
    auto pool = std::make_shared<adapters::async_worker_pool>(2);

    directory_scheduler scheduler(*remote_, local_, pool);
    directory_transfer_options options;
    options.no_progress_bar = true;
    auto summary = scheduler.download(path_info("mem", "/a"), local_path("b"), options);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(pool->pending_tasks(), 0u);
    EXPECT_EQ(read_file(download_dir_ / "b/y"), "2");
}

TEST_F(DirectorySchedulerTest, LogsStartAndCompletion) {
    remote_->add_file("/a/x", "1");
    std::vector<std::string> messages;
    std::mutex mutex;
    get_logger().set_level(log_level::debug);
    get_logger().set_callback([&](log_level, std::string_view category,
                                  std::string_view message, const transfer_log_context*) {
        std::lock_guard<std::mutex> lock(mutex);
        if (category == log_category::scheduler) {
            messages.emplace_back(message);
        }
    });

    auto summary = download("/a", "b");
    get_logger().set_callback(nullptr);
    get_logger().set_level(log_level::info);

    ASSERT_TRUE(summary.has_value());
    ASSERT_GE(messages.size(), 2u);
    EXPECT_EQ(messages.front(), "Directory download started with 1 workers");
    EXPECT_EQ(messages.back(), "Directory download completed");
}

}  // namespace kcenon::vfs_transfer::test
