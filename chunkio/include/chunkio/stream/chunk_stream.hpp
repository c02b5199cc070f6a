/*
 * File: chunk_stream.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "chunkio/core/assert.hpp"
#include "chunkio/core/bytes.hpp"
#include "chunkio/core/errors.hpp"
#include "chunkio/storage/device.hpp"
#include "chunkio/codec/entry.hpp"
#include "chunkio/stream/flow.hpp"

namespace chunkio::stream {

    // Windowed reader/writer of fixed-size records over a seekable device.
    //
    // The stream keeps no cursor of its own: every call positions the device
    // from scratch and leaves it wherever the call stopped. The device is
    // owned by the caller and must outlive the stream.
    template <storage::SeekableDevice DeviceT>
    class chunk_stream {
    public:
        using device_type = DeviceT;
        using offset_type = storage::offset_type;
        using seek_origin = storage::seek_origin;

        explicit chunk_stream(DeviceT& dev) : device_(&dev) {}

        // Encodes value into buffer, writes it at the current device position
        // and flushes. The buffer is cleared afterwards and keeps its capacity.
        template <codec::Entry<device_type> T>
        void write_entry(core::byte_buffer& buffer, const T& value) {
            const auto record_size = codec::checked_entry_size<T>();
            check_open_("write_entry");

            codec::entry_codec<T>::store(value, buffer);
            CHUNKIO_ASSERT(buffer.size() % static_cast<std::size_t>(record_size) == 0,
                "codec stored a partial record");

            if (!device_->write(buffer.data(), buffer.size())) {
                throw core::stream_error(core::errc::write_failed,
                    std::to_string(buffer.size()) + " bytes");
            }
            if (!device_->flush()) {
                throw core::stream_error(core::errc::flush_failed, "after write_entry");
            }
            buffer.clear();
        }

        // write_entry at the end of the file, whatever the cursor is.
        template <codec::Entry<device_type> T>
        void append_entry(core::byte_buffer& buffer, const T& value) {
            check_open_("append_entry");
            seek_or_throw_(0, seek_origin::end);
            write_entry<T>(buffer, value);
        }

        template <codec::Entry<device_type> T>
        std::vector<T> head(std::int64_t until_entry) {
            return stream_in<T>(stream_flow::forward, until_entry);
        }

        template <codec::Entry<device_type> T>
        std::vector<T> tail(std::int64_t until_entry) {
            return stream_in<T>(stream_flow::backward, until_entry);
        }

        // Reads up to until_entry records, oldest first.
        //
        // forward:  records [0, until_entry).
        // backward: the last until_entry complete records. When the window is
        //           larger than the file the read falls back to forward.
        //
        // Stops at the first record that fails to decode (end of data or a
        // trailing partial record); that is not an error.
        template <codec::Entry<device_type> T>
        std::vector<T> stream_in(stream_flow direction, std::int64_t until_entry) {
            std::vector<T> entries;
            if (until_entry <= 0) {
                return entries;
            }

            const std::int64_t record_size = codec::checked_entry_size<T>();
            check_open_("stream_in");

            // backward windows end on the last complete record, so a trailing
            // partial record never shifts the slots that are read
            const auto file_size = device_->get_file_size();
            const auto available = static_cast<std::int64_t>(
                file_size / static_cast<storage::position_type>(record_size));
            const std::int64_t aligned_end = available * record_size;

            // a window that does not fit in offset_type cannot be anchored on
            // the end of any file
            const bool window_fits = until_entry <= max_offset / record_size;
            const std::int64_t window = window_fits ? record_size * until_entry : max_offset;
            const std::int64_t anchor = aligned_end - window;

            stream_flow mode = direction;
            if (mode == stream_flow::backward) {
                if (!window_fits || anchor < 0 || !device_->seek(anchor, seek_origin::begin)) {
                    mode = stream_flow::forward;
                }
            }

            entries.reserve(static_cast<std::size_t>(std::min(until_entry, available)));

            for (std::int64_t index = 0; index < until_entry; ) {
                const std::int64_t position = record_size * index;
                if (mode == stream_flow::forward) {
                    seek_or_throw_(position, seek_origin::begin);
                }
                else {
                    seek_or_throw_(anchor + position, seek_origin::begin);
                }

                auto entry = codec::entry_codec<T>::load(*device_);
                if (!entry) {
                    break;
                }
                entries.push_back(std::move(*entry));
                ++index;
            }

            return entries;
        }

        // Number of complete records in the file.
        template <codec::Entry<device_type> T>
        std::int64_t count_entries() {
            const auto record_size = codec::checked_entry_size<T>();
            check_open_("count_entries");
            return static_cast<std::int64_t>(
                device_->get_file_size() / static_cast<storage::position_type>(record_size));
        }

    private:
        constexpr static offset_type max_offset = std::numeric_limits<offset_type>::max();

        void check_open_(const char* where) const {
            if (!device_->is_open()) {
                throw core::stream_error(core::errc::device_closed, where);
            }
        }

        void seek_or_throw_(offset_type off, seek_origin origin) {
            if (!device_->seek(off, origin)) {
                throw core::stream_error(core::errc::seek_failed,
                    std::string("offset ") + std::to_string(off)
                    + (origin == seek_origin::begin ? " from begin" : " from end"));
            }
        }

    private:
        device_type* device_ = nullptr;
    };

    // Free-function forms for one-off calls on a device.
    template <typename T, storage::SeekableDevice DeviceT>
        requires codec::Entry<T, DeviceT>
    std::vector<T> head(DeviceT& dev, std::int64_t until_entry) {
        return chunk_stream<DeviceT>(dev).template head<T>(until_entry);
    }

    template <typename T, storage::SeekableDevice DeviceT>
        requires codec::Entry<T, DeviceT>
    std::vector<T> tail(DeviceT& dev, std::int64_t until_entry) {
        return chunk_stream<DeviceT>(dev).template tail<T>(until_entry);
    }

} // namespace chunkio::stream
