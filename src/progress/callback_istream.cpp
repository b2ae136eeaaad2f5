/**
 * @file callback_istream.cpp
 * @brief Implementation of callback_istream
 */

#include "kcenon/vfs_transfer/progress/callback_istream.h"

namespace kcenon::vfs_transfer {

callback_streambuf::callback_streambuf(std::streambuf* source, progress_callback& callback)
    : source_(source), callback_(callback) {}

void callback_streambuf::report(uint64_t count) {
    if (count == 0) {
        return;
    }
    bytes_read_ += count;
    callback_.relative_update(count);
}

auto callback_streambuf::underflow() -> int_type {
    // Peek only; nothing is consumed yet.
    if (source_ == nullptr) {
        return traits_type::eof();
    }
    return source_->sgetc();
}

auto callback_streambuf::uflow() -> int_type {
    if (source_ == nullptr) {
        return traits_type::eof();
    }
    auto c = source_->sbumpc();
    if (!traits_type::eq_int_type(c, traits_type::eof())) {
        report(1);
    }
    return c;
}

auto callback_streambuf::xsgetn(char_type* s, std::streamsize count) -> std::streamsize {
    if (source_ == nullptr || count <= 0) {
        return 0;
    }
    auto n = source_->sgetn(s, count);
    if (n > 0) {
        report(static_cast<uint64_t>(n));
    }
    return n;
}

auto callback_streambuf::showmanyc() -> std::streamsize {
    if (source_ == nullptr) {
        return -1;
    }
    return source_->in_avail();
}

callback_istream::callback_istream(std::istream& source, progress_callback& callback)
    : std::istream(nullptr), buffer_(source.rdbuf(), callback) {
    rdbuf(&buffer_);
}

}  // namespace kcenon::vfs_transfer
