/**
 * @file progress_indicator.cpp
 * @brief Implementation of progress_indicator
 */

#include "kcenon/vfs_transfer/progress/progress_indicator.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "kcenon/vfs_transfer/core/logging.h"
#include "kcenon/vfs_transfer/fs/filesystem.h"

namespace kcenon::vfs_transfer {

namespace {

class indicator_callback : public progress_callback {
public:
    explicit indicator_callback(progress_indicator& indicator) : indicator_(indicator) {}

    void relative_update(uint64_t increment) override { indicator_.update(increment); }

    void set_size(std::optional<uint64_t> total) override { indicator_.set_total(total); }

protected:
    progress_indicator& indicator_;
};

/**
 * @brief Resolves an unknown total through the backend that holds the file
 */
class sized_indicator_callback final : public indicator_callback {
public:
    sized_indicator_callback(progress_indicator& indicator, const filesystem& fs, path_info path)
        : indicator_callback(indicator), fs_(fs), path_(std::move(path)) {}

    void set_size(std::optional<uint64_t> total) override {
        if (!total) {
            auto size = fs_.getsize(path_);
            if (!size) {
                VFS_LOG_DEBUG(log_category::progress,
                              "Size of '" + path_.url() + "' unknown: " + size.error().message);
                return;
            }
            total = size.value();
        }
        indicator_.set_total(total);
    }

private:
    const filesystem& fs_;
    path_info path_;
};

}  // namespace

progress_indicator::progress_indicator(progress_indicator_options options)
    : options_(std::move(options)) {
    if (options_.total) {
        set_total(options_.total);
    }
}

progress_indicator::~progress_indicator() {
    close();
}

void progress_indicator::update(uint64_t increment) {
    completed_.fetch_add(increment, std::memory_order_relaxed);
    if (options_.disable || closed_.load()) {
        return;
    }

    std::unique_lock<std::mutex> lock(render_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    if (now - last_render_ < options_.refresh_interval) {
        return;
    }
    last_render_ = now;
    render(false);
}

void progress_indicator::set_total(std::optional<uint64_t> total) {
    if (total) {
        total_.store(*total);
        has_total_.store(true);
    } else {
        has_total_.store(false);
    }
}

auto progress_indicator::total() const -> std::optional<uint64_t> {
    if (!has_total_.load()) {
        return std::nullopt;
    }
    return total_.load();
}

void progress_indicator::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return;
    }
    if (options_.disable) {
        return;
    }
    std::lock_guard<std::mutex> lock(render_mutex_);
    render(true);
}

auto progress_indicator::as_callback() -> std::unique_ptr<progress_callback> {
    return std::make_unique<indicator_callback>(*this);
}

auto progress_indicator::as_callback(const filesystem& fs, path_info path)
    -> std::unique_ptr<progress_callback> {
    return std::make_unique<sized_indicator_callback>(*this, fs, std::move(path));
}

auto progress_indicator::format_bytes(uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 5> units = {"B", "KiB", "MiB", "GiB", "TiB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    std::size_t index = 0;
    while (value >= 1024.0 && index + 1 < units.size()) {
        value /= 1024.0;
        ++index;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << units[index];
    return oss.str();
}

auto progress_indicator::format_amount(uint64_t amount) const -> std::string {
    if (options_.unit == progress_unit::bytes) {
        return format_bytes(amount);
    }
    return std::to_string(amount);
}

void progress_indicator::render(bool final_line) {
    std::ostream& out = options_.output ? *options_.output : std::cerr;

    auto done = completed();
    auto expected = total();

    std::ostringstream line;
    line << "\r";
    if (!options_.label.empty()) {
        line << options_.label << ": ";
    }
    if (expected && *expected > 0) {
        auto percent = std::min<uint64_t>(100, done * 100 / *expected);
        line << std::setw(3) << percent << "% |" << format_amount(done) << "/"
             << format_amount(*expected);
    } else {
        line << format_amount(done);
    }
    if (options_.unit == progress_unit::files) {
        line << " files";
    }
    if (final_line) {
        line << "\n";
    }

    out << line.str() << std::flush;
}

}  // namespace kcenon::vfs_transfer
