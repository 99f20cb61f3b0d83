#pragma once

#include <boost/charconv.hpp>
#include <cstdint>
#include <hlsget/result.hpp>
#include <string>
#include <string_view>

namespace hlsget::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val;
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<double> to_double(std::string_view sv) {
	return to_number<double>(sv);
}

// Fallback helper for attributes where 0 is preferred over an error
template <typename T>
T to_number_default(std::string_view sv, T def_val = 0) {
	auto res = to_number<T>(sv);
	if (res.has_value()) { return res.value(); }
	return def_val;
}

// =============================================================================
// String helpers
// =============================================================================

inline std::string_view trim(std::string_view sv) {
	constexpr std::string_view kWhitespace = " \t\r\n\f\v";
	auto first = sv.find_first_not_of(kWhitespace);
	if (first == std::string_view::npos) return {};
	auto last = sv.find_last_not_of(kWhitespace);
	return sv.substr(first, last - first + 1);
}

}  // namespace hlsget::utils
