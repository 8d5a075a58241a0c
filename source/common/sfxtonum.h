#ifndef SFX_e0958577_e50c_4ba7_b815_5759001acfa8_H
#define SFX_e0958577_e50c_4ba7_b815_5759001acfa8_H

#include "sfxstringview.h"

#include <charconv>
#include <optional>
#include <type_traits>

namespace sfx {

/// Parses the entire view as a number. Leading and trailing whitespace is not allowed.
template <typename T>
[[nodiscard]]
auto toNum( const sfx::StringView &view ) -> std::optional<T> {
	static_assert( std::is_arithmetic_v<T> && !std::is_same_v<T, bool> );
	const char *begin = view.data(), *end = view.data() + view.size();
	// std::from_chars() does not accept the leading plus sign
	if( begin != end && *begin == '+' ) {
		++begin;
	}
	if( begin == end ) {
		return std::nullopt;
	}
	T value {};
	const auto [ptr, err] = std::from_chars( begin, end, value );
	if( err == std::errc() && ptr == end ) {
		return value;
	}
	return std::nullopt;
}

}

#endif
