/*
 * File: entry.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <typeinfo>

#include "chunkio/core/bytes.hpp"
#include "chunkio/core/errors.hpp"
#include "chunkio/storage/device.hpp"

namespace chunkio::codec {

	// Specialize for every record type that is stored in a chunk file.
	//
	//   entry_size()            number of bytes one record occupies on disk.
	//                           Declared, not sizeof(T): padding and byte order
	//                           make the two differ.
	//   store(value, buffer)    appends exactly entry_size() bytes to buffer.
	//   load(device)            reads entry_size() bytes at the device cursor,
	//                           std::nullopt on a short read or IO fault.
	template <typename T>
	struct entry_codec;

	template <typename T, typename DeviceT>
	concept Entry = requires(const T& value, core::byte_buffer& out, DeviceT& dev) {
		{ entry_codec<T>::entry_size() } -> std::convertible_to<std::int64_t>;
		{ entry_codec<T>::store(value, out) } -> std::same_as<void>;
		{ entry_codec<T>::load(dev) } -> std::same_as<std::optional<T>>;
	};

	template <storage::SeekableDevice DeviceT>
	inline bool read_exact(DeviceT& dev, core::byte_span dst) {
		std::size_t done = 0;
		while (done < dst.size()) {
			const std::size_t got = dev.read(dst.data() + done, dst.size() - done);
			if (got == 0) {
				return false;
			}
			done += got;
		}
		return true;
	}

	template <typename T>
	inline std::int64_t checked_entry_size() {
		const std::int64_t size = entry_codec<T>::entry_size();
		if (size <= 0) {
			throw core::stream_error(core::errc::bad_entry_size,
				std::string("entry size of ") + typeid(T).name()
				+ " is " + std::to_string(size));
		}
		return size;
	}

} // namespace chunkio::codec
