#pragma once

#include <CLI/CLI.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace chunktail {

	constexpr std::int64_t DEFAULT_COUNT = 10;

	enum class entry_kind {
		i16, i32, i64, u16, u32, u64, f32, f64,
	};

	enum class command {
		none, head, tail, count, append,
	};

	inline const std::map<std::string, entry_kind>& entry_kinds() {
		static const std::map<std::string, entry_kind> kinds = {
			{ "i16", entry_kind::i16 }, { "i32", entry_kind::i32 }, { "i64", entry_kind::i64 },
			{ "u16", entry_kind::u16 }, { "u32", entry_kind::u32 }, { "u64", entry_kind::u64 },
			{ "f32", entry_kind::f32 }, { "f64", entry_kind::f64 },
		};
		return kinds;
	}

	struct options {
		std::string filename;
		entry_kind kind = entry_kind::i64;
		std::int64_t count = DEFAULT_COUNT;
		std::vector<std::string> values;
		command cmd = command::none;
	};

	// Registers the file argument, the shared --type option and the
	// subcommands. The chosen subcommand is stored in opts.cmd.
	inline void setup_app(CLI::App& app, options& opts) {
		app.add_option("file", opts.filename, "Record file")->required();

		app.add_option("-t,--type", opts.kind, "Entry type")
			->transform(CLI::CheckedTransformer(entry_kinds(), CLI::ignore_case))
			->default_str("i64");

		// --type may follow the subcommand
		app.fallthrough();
		app.require_subcommand(1);

		auto head_cmd = app.add_subcommand("head", "Print the first N entries");
		head_cmd->add_option("-n,--count", opts.count, "Number of entries")->default_val(DEFAULT_COUNT);
		head_cmd->callback([&opts]() { opts.cmd = command::head; });

		auto tail_cmd = app.add_subcommand("tail", "Print the last N entries");
		tail_cmd->add_option("-n,--count", opts.count, "Number of entries")->default_val(DEFAULT_COUNT);
		tail_cmd->callback([&opts]() { opts.cmd = command::tail; });

		auto count_cmd = app.add_subcommand("count", "Print the number of complete entries");
		count_cmd->callback([&opts]() { opts.cmd = command::count; });

		auto append_cmd = app.add_subcommand("append", "Append entries to the end of the file");
		append_cmd->add_option("values", opts.values, "Values to append")->required();
		append_cmd->callback([&opts]() { opts.cmd = command::append; });
	}

	template <typename T>
	T parse_value(const std::string& text) {
		if constexpr (std::is_unsigned_v<T>) {
			// istream wraps "-1" into the unsigned range
			if (text.find('-') != std::string::npos) {
				throw std::invalid_argument("negative value for an unsigned type: " + text);
			}
		}
		std::istringstream in(text);
		T value{};
		if constexpr (sizeof(T) < sizeof(int) && std::is_integral_v<T>) {
			// avoid reading 16-bit values as characters
			std::conditional_t<std::is_signed_v<T>, int, unsigned> wide{};
			in >> wide;
			if (in && (wide < std::numeric_limits<T>::min() || wide > std::numeric_limits<T>::max())) {
				throw std::out_of_range("value out of range: " + text);
			}
			value = static_cast<T>(wide);
		}
		else {
			in >> value;
		}
		if (!in || !in.eof()) {
			throw std::invalid_argument("not a valid value: " + text);
		}
		return value;
	}

} // namespace chunktail
