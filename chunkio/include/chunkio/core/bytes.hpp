/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <span>

namespace chunkio::core {

	using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_span = std::span<byte>;

} // namespace chunkio::core
