#include "chunkio/core/errors.hpp"
#include "chunkio/codec/word_codec.hpp"
#include "chunkio/storage/file_device.hpp"
#include "chunkio/stream/chunk_stream.hpp"

#include "cli.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

namespace {
	using device_type = chunkio::storage::file_device;
	using stream_type = chunkio::stream::chunk_stream<device_type>;
	using chunkio::stream::stream_flow;

	using chunktail::entry_kind;

	// Calls fn with a value-initialized T matching kind.
	template <typename Fn>
	int with_entry_type(entry_kind kind, Fn&& fn) {
		switch (kind) {
		case entry_kind::i16: return fn(std::int16_t{});
		case entry_kind::i32: return fn(std::int32_t{});
		case entry_kind::i64: return fn(std::int64_t{});
		case entry_kind::u16: return fn(std::uint16_t{});
		case entry_kind::u32: return fn(std::uint32_t{});
		case entry_kind::u64: return fn(std::uint64_t{});
		case entry_kind::f32: return fn(float{});
		case entry_kind::f64: return fn(double{});
		}
		return 1;
	}

	template <typename T>
	void print_entry(const T& value) {
		if constexpr (std::is_floating_point_v<T>) {
			std::cout << std::setprecision(std::numeric_limits<T>::max_digits10) << value << "\n";
		}
		else {
			std::cout << value << "\n";
		}
	}

	int cmd_read(const std::string& filename, stream_flow flow, std::int64_t count, entry_kind kind) {
		try {
			if (!std::filesystem::exists(filename)) {
				std::cerr << "File not found: " << filename << "\n";
				return 1;
			}
			device_type dev(filename);
			if (!dev.is_open()) {
				std::cerr << "Failed to open " << filename << "\n";
				return 1;
			}
			stream_type stream(dev);
			return with_entry_type(kind, [&](auto tag) {
				using entry_type = decltype(tag);
				for (const auto& entry : stream.stream_in<entry_type>(flow, count)) {
					print_entry(entry);
				}
				return 0;
			});
		}
		catch (const std::exception& e) {
			std::cerr << "Error reading " << filename << ": " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_count(const std::string& filename, entry_kind kind) {
		try {
			if (!std::filesystem::exists(filename)) {
				std::cerr << "File not found: " << filename << "\n";
				return 1;
			}
			device_type dev(filename);
			if (!dev.is_open()) {
				std::cerr << "Failed to open " << filename << "\n";
				return 1;
			}
			stream_type stream(dev);
			return with_entry_type(kind, [&](auto tag) {
				using entry_type = decltype(tag);
				const auto size = chunkio::codec::entry_codec<entry_type>::entry_size();
				const auto total = dev.get_file_size();
				std::cout << "Entries: " << stream.count_entries<entry_type>() << "\n";
				if (total % static_cast<std::uint64_t>(size) != 0) {
					std::cout << "Trailing bytes: " << (total % static_cast<std::uint64_t>(size)) << "\n";
				}
				return 0;
			});
		}
		catch (const std::exception& e) {
			std::cerr << "Error counting entries: " << e.what() << "\n";
			return 1;
		}
	}

	int cmd_append(const std::string& filename, const std::vector<std::string>& values, entry_kind kind) {
		try {
			device_type dev(filename);
			if (!dev.is_open()) {
				std::cerr << "Failed to open " << filename << "\n";
				return 1;
			}
			stream_type stream(dev);
			return with_entry_type(kind, [&](auto tag) {
				using entry_type = decltype(tag);
				std::vector<entry_type> parsed;
				parsed.reserve(values.size());
				for (const auto& text : values) {
					parsed.push_back(chunktail::parse_value<entry_type>(text));
				}
				chunkio::core::byte_buffer buffer;
				for (const auto& value : parsed) {
					stream.append_entry(buffer, value);
				}
				std::cout << "Appended " << parsed.size() << " entries to " << filename << "\n";
				return 0;
			});
		}
		catch (const std::exception& e) {
			std::cerr << "Error appending: " << e.what() << "\n";
			return 1;
		}
	}
}

int main(int argc, char* argv[]) {
	CLI::App app{ "chunktail - head/tail for fixed-size binary record files" };

	chunktail::options opts;
	chunktail::setup_app(app, opts);

	CLI11_PARSE(app, argc, argv);

	switch (opts.cmd) {
	case chunktail::command::head:
		return cmd_read(opts.filename, stream_flow::forward, opts.count, opts.kind);
	case chunktail::command::tail:
		return cmd_read(opts.filename, stream_flow::backward, opts.count, opts.kind);
	case chunktail::command::count:
		return cmd_count(opts.filename, opts.kind);
	case chunktail::command::append:
		return cmd_append(opts.filename, opts.values, opts.kind);
	case chunktail::command::none:
		break;
	}
	return 1;
}
