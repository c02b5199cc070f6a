/*
 * File: errors.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-10-19
 * License: MIT
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chunkio::core {

	enum class errc {
		bad_entry_size,
		device_closed,
		seek_failed,
		write_failed,
		flush_failed,
	};

	inline const char* to_string(errc code) noexcept {
		switch (code) {
		case errc::bad_entry_size: return "bad entry size";
		case errc::device_closed:  return "device is closed";
		case errc::seek_failed:    return "seek failed";
		case errc::write_failed:   return "write failed";
		case errc::flush_failed:   return "flush failed";
		}
		return "unknown error";
	}

	class stream_error : public std::runtime_error {
	public:
		stream_error(errc code, const std::string& what)
			: std::runtime_error(std::string(to_string(code)) + ": " + what)
			, code_(code) {}

		errc code() const noexcept { return code_; }

	private:
		errc code_;
	};

} // namespace chunkio::core
