/*
 * File: memory_device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <cstring>
#include <algorithm>
#include <utility>
#include <vector>

#include "chunkio/core/bytes.hpp"
#include "chunkio/storage/device.hpp"

namespace chunkio::storage {
    class memory_device {
    public:
        memory_device() = default;
        explicit memory_device(core::byte_buffer data) : data_(std::move(data)) {}

        bool is_open() const noexcept { return open_; }

        bool seek(offset_type off, seek_origin origin) {
            ++seek_count_;
            if (!open_) {
                return false;
            }
            const auto target = resolve_seek(off, origin, data_.size());
            if (target < 0) {
                return false;
            }
            pos_ = static_cast<std::size_t>(target);
            return true;
        }

        position_type tell() const noexcept { return pos_; }

        std::size_t read(core::byte* dst, std::size_t n) {
            if (!open_ || pos_ >= data_.size()) {
                return 0;
            }
            const std::size_t got = std::min(n, data_.size() - pos_);
            std::memcpy(dst, data_.data() + pos_, got);
            pos_ += got;
            return got;
        }

        // Overwrites at the cursor, growing the buffer when the write runs past the end.
        bool write(const core::byte* src, std::size_t n) {
            if (!open_) {
                return false;
            }
            if (pos_ + n > data_.size()) {
                data_.resize(pos_ + n);
            }
            std::memcpy(data_.data() + pos_, src, n);
            pos_ += n;
            return true;
        }

        bool flush() noexcept { return open_; }

        position_type get_file_size() const noexcept {
            return data_.size();
        }

        void close() noexcept { open_ = false; }

        const core::byte_buffer& data() const noexcept { return data_; }
        std::size_t seek_count() const noexcept { return seek_count_; }

    private:
        core::byte_buffer data_;
        std::size_t pos_ = 0;
        std::size_t seek_count_ = 0;
        bool open_ = true;
    };
    static_assert(SeekableDevice<memory_device>);
}
