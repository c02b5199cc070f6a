/*
 * File: device.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <concepts>
#include "chunkio/core/bytes.hpp"

namespace chunkio::storage {

    using position_type = std::uint64_t;
    using offset_type = std::int64_t;

    enum class seek_origin {
        begin,
        end,
    };

    // A byte resource with a single cursor, used for record IO.
    // seek() must fail (return false) for targets before the start of the
    // device; seeking past the end is allowed and makes the next read short.
    template <class D>
    concept SeekableDevice = requires(
        D dev,
        offset_type off,
        seek_origin origin,
        chunkio::core::byte* dst,
        const chunkio::core::byte* src,
        std::size_t n
    ) {
        { dev.is_open() } -> std::convertible_to<bool>;

        { dev.seek(off, origin) } -> std::same_as<bool>;
        { dev.tell() }            -> std::convertible_to<position_type>;

        // read returns the number of bytes actually read
        { dev.read(dst, n) }  -> std::convertible_to<std::size_t>;
        { dev.write(src, n) } -> std::same_as<bool>;
        { dev.flush() }       -> std::same_as<bool>;

        { dev.get_file_size() } -> std::convertible_to<position_type>;
    };

    // Absolute target of a seek request, or -1 when it lands before the start.
    inline offset_type resolve_seek(offset_type off, seek_origin origin,
                                    position_type size) noexcept {
        const offset_type base = (origin == seek_origin::begin)
            ? 0 : static_cast<offset_type>(size);
        if (off < -base) {
            return -1;
        }
        return base + off;
    }

} // namespace chunkio::storage
