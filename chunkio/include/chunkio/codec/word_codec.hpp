/*
 * File: word_codec.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "chunkio/core/bytes.hpp"
#include "chunkio/core/byteorder.hpp"
#include "chunkio/codec/entry.hpp"

namespace chunkio::codec {

	namespace byteorder = core::byteorder;

	// Fixed-width numeric record, always little-endian on disk.
	template <byteorder::Word WordT>
	struct word_codec {

		using value_type = WordT;

		constexpr static std::int64_t entry_size() noexcept {
			return static_cast<std::int64_t>(sizeof(value_type));
		}

		static void store(value_type val, core::byte_buffer& out) {
			const auto at = out.size();
			out.resize(at + sizeof(value_type));
			byteorder::native_to_le<value_type>(val, out.data() + at);
		}

		template <storage::SeekableDevice DeviceT>
		static std::optional<value_type> load(DeviceT& dev) {
			std::array<core::byte, sizeof(value_type)> buf{};
			if (!read_exact(dev, buf)) {
				return std::nullopt;
			}
			return byteorder::le_to_native<value_type>(buf.data());
		}
	};

	template <>
	struct entry_codec<std::int16_t> : public word_codec<std::int16_t> {};
	template <>
	struct entry_codec<std::int32_t> : public word_codec<std::int32_t> {};
	template <>
	struct entry_codec<std::int64_t> : public word_codec<std::int64_t> {};

	template <>
	struct entry_codec<std::uint16_t> : public word_codec<std::uint16_t> {};
	template <>
	struct entry_codec<std::uint32_t> : public word_codec<std::uint32_t> {};
	template <>
	struct entry_codec<std::uint64_t> : public word_codec<std::uint64_t> {};

	template <>
	struct entry_codec<float> : public word_codec<float> {};
	template <>
	struct entry_codec<double> : public word_codec<double> {};

} // namespace chunkio::codec
