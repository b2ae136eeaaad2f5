/**
 * @file callback_istream.h
 * @brief Input stream that reports every byte read to a progress callback
 */

#ifndef KCENON_VFS_TRANSFER_PROGRESS_CALLBACK_ISTREAM_H
#define KCENON_VFS_TRANSFER_PROGRESS_CALLBACK_ISTREAM_H

#include <cstdint>
#include <istream>
#include <streambuf>

#include "kcenon/vfs_transfer/progress/progress_callback.h"

namespace kcenon::vfs_transfer {

/**
 * @brief Unbuffered view of another streambuf that counts consumed bytes
 *
 * Holds no get area of its own, so every read goes straight to the source
 * and the callback sees exactly the bytes handed to the reader, no more.
 */
class callback_streambuf final : public std::streambuf {
public:
    callback_streambuf(std::streambuf* source, progress_callback& callback);

    [[nodiscard]] auto bytes_read() const noexcept -> uint64_t { return bytes_read_; }

protected:
    auto underflow() -> int_type override;
    auto uflow() -> int_type override;
    auto xsgetn(char_type* s, std::streamsize count) -> std::streamsize override;
    auto showmanyc() -> std::streamsize override;

private:
    void report(uint64_t count);

    std::streambuf* source_;
    progress_callback& callback_;
    uint64_t bytes_read_ = 0;
};

/**
 * @brief Wraps a stream so reads report progress transparently
 *
 * @code
 * std::ifstream file("payload.bin", std::ios::binary);
 * callback_istream wrapped(file, callback);
 * backend.upload_stream(wrapped, destination, size, callback);
 * @endcode
 *
 * The wrapped stream must outlive this object.
 */
class callback_istream final : public std::istream {
public:
    callback_istream(std::istream& source, progress_callback& callback);

    callback_istream(const callback_istream&) = delete;
    auto operator=(const callback_istream&) -> callback_istream& = delete;

    [[nodiscard]] auto bytes_read() const noexcept -> uint64_t { return buffer_.bytes_read(); }

private:
    callback_streambuf buffer_;
};

}  // namespace kcenon::vfs_transfer

#endif  // KCENON_VFS_TRANSFER_PROGRESS_CALLBACK_ISTREAM_H
