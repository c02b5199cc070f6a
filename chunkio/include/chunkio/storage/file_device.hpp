/*
 * File: file_device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once
#include <cstdint>
#include <fstream>
#include <filesystem>

#include "chunkio/core/bytes.hpp"
#include "chunkio/storage/device.hpp"

namespace chunkio::storage {

// Simple file-backed seekable device (not thread-safe).
// std::fstream keeps one position for get and put, so reads and writes
// share the cursor the same way a plain file descriptor does.
class file_device {
public:
    file_device() = default;

    explicit file_device(const std::filesystem::path& filename,
                         bool truncate = false) {
        open_or_create_(filename, truncate);
    }

    bool is_open() const noexcept {
        return file_.is_open();
    }

    bool seek(offset_type off, seek_origin origin) {
        if (!is_open()) {
            return false;
        }
        const auto target = resolve_seek(off, origin, get_file_size());
        if (target < 0) {
            return false;
        }
        file_.clear();
        file_.seekg(static_cast<std::streamoff>(target), std::ios::beg);
        file_.seekp(static_cast<std::streamoff>(target), std::ios::beg);
        return static_cast<bool>(file_);
    }

    position_type tell() {
        if (!is_open()) {
            return 0;
        }
        const std::streamoff pos = file_.tellg();
        return (pos >= 0) ? static_cast<position_type>(pos) : 0;
    }

    // Read up to n bytes at the cursor.
    std::size_t read(chunkio::core::byte* dst, std::size_t n) {
        if (!is_open()) {
            return 0;
        }
        file_.clear();
        file_.read(reinterpret_cast<char*>(dst),
                   static_cast<std::streamsize>(n));
        const auto got = static_cast<std::size_t>(file_.gcount());
        // a short read leaves eof/fail set; the next seek clears it
        file_.clear();
        return got;
    }

    // Write n bytes at the cursor.
    bool write(const chunkio::core::byte* src, std::size_t n) {
        if (!is_open()) {
            return false;
        }
        file_.clear();
        const std::streamoff pos = file_.tellg();
        if (pos >= 0) {
            file_.seekp(pos, std::ios::beg);
        }
        file_.write(reinterpret_cast<const char*>(src),
                    static_cast<std::streamsize>(n));
        if (!file_) {
            return false;
        }
        return true;
    }

    bool flush() {
        if (!is_open()) {
            return false;
        }
        file_.flush();
        return static_cast<bool>(file_);
    }

    position_type get_file_size() {
        if (!is_open()) {
            return 0;
        }
        file_.clear();
        const auto cur = file_.tellg();
        file_.seekg(0, std::ios::end);
        const std::streamoff endg = file_.tellg();

        // restore position (best-effort)
        if (cur >= 0) {
            file_.seekg(cur, std::ios::beg);
            file_.seekp(cur, std::ios::beg);
        }
        return (endg >= 0) ? static_cast<position_type>(endg) : 0;
    }

    void close() {
        if (is_open()) {
            file_.close();
        }
    }

private:
    void open_or_create_(const std::filesystem::path& filename, bool truncate) {
        auto mode = std::ios::in | std::ios::out | std::ios::binary;
        if (truncate) {
            mode |= std::ios::trunc;
        }
        file_.open(filename, mode);
        if (!file_.is_open()) {
            file_.open(filename, std::ios::out | std::ios::binary | std::ios::trunc);
            file_.close();
            file_.open(filename, std::ios::in | std::ios::out | std::ios::binary);
        }
    }

private:
    std::fstream file_{};
};

static_assert(SeekableDevice<file_device>);

} // namespace chunkio::storage
