/*
 * File: byteorder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <bit>
#include <cstring>
#include <type_traits>

#include "chunkio/core/bytes.hpp"

namespace chunkio::core::byteorder {

	template <typename T>
	concept UnsignedWord = std::is_unsigned_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept SignedWord = std::is_signed_v<T> && std::is_integral_v<T> &&
		((sizeof(T) == 2) || (sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept FloatWord = std::is_floating_point_v<T> &&
		((sizeof(T) == 4) || (sizeof(T) == 8));

	template <typename T>
	concept Word = SignedWord<T> || UnsignedWord<T> || FloatWord<T>;

	// Unsigned integer of the same width, used as the on-disk carrier.
	template <Word T>
	using carrier_t = std::conditional_t<sizeof(T) == 2, std::uint16_t,
		std::conditional_t<sizeof(T) == 4, std::uint32_t, std::uint64_t>>;

	template <UnsignedWord WordT>
	inline WordT le_to_native_unsigned(const core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little) {
			WordT result = 0;
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				result |= static_cast<WordT>(static_cast<WordT>(mem[i]) << (8 * i));
			}
			return result;
		}
		else {
			WordT result;
			std::memcpy(&result, mem, sizeof(WordT));
			return result;
		}
	}

	template <UnsignedWord WordT>
	inline void native_to_le_unsigned(WordT val, core::byte* mem) {
		if constexpr (std::endian::native != std::endian::little) {
			for (std::size_t i = 0; i < sizeof(WordT); ++i) {
				mem[i] = static_cast<core::byte>((val >> (8 * i)) & 0xFF);
			}
		}
		else {
			std::memcpy(mem, &val, sizeof(WordT));
		}
	}

	template <Word WordT>
	inline WordT le_to_native(const core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			return le_to_native_unsigned<WordT>(mem);
		}
		else {
			const auto uns = le_to_native_unsigned<carrier_t<WordT>>(mem);
			return std::bit_cast<WordT>(uns);
		}
	}

	template <Word WordT>
	inline void native_to_le(WordT val, core::byte* mem) {
		if constexpr (std::is_unsigned_v<WordT>) {
			native_to_le_unsigned<WordT>(val, mem);
		}
		else {
			native_to_le_unsigned<carrier_t<WordT>>(std::bit_cast<carrier_t<WordT>>(val), mem);
		}
	}

} // namespace chunkio::core::byteorder
