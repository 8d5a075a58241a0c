#ifndef SFX_8c84e583_3f17_4a75_9163_f62b2523bc05_H
#define SFX_8c84e583_3f17_4a75_9163_f62b2523bc05_H

#include "sfxbasicmath.h"

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string_view>
#include <utility>

namespace sfx {

enum CaseSensitivity { IgnoreCase, MatchCase };

[[nodiscard]]
bool equalCharsIgnoreCase( const char *s1, const char *s2, size_t length );

[[nodiscard]]
inline constexpr auto strlen( const char *s ) -> size_t {
	const char *p = s;
	while( *p ) {
		p++;
	}
	return (size_t)( p - s );
}

class StringView {
protected:
	const char *m_s;
	size_t m_len: 31;
	bool m_terminated: 1;

	static constexpr unsigned kMaxLen = 1u << 31u;

	[[nodiscard]]
	static constexpr auto checkLen( size_t len ) -> size_t {
		assert( len < kMaxLen );
		return len;
	}

	[[nodiscard]]
	auto toOffset( const char *p ) const -> unsigned {
		assert( (uint64_t)(uintptr_t)( p - m_s ) < (uint64_t)kMaxLen );
		return (unsigned)( p - m_s );
	}
public:
	enum Terminated {
		Unspecified,
		ZeroTerminated,
	};

	constexpr StringView() noexcept
		: m_s( "" ), m_len( 0 ), m_terminated( ZeroTerminated ) {}

	constexpr explicit StringView( const char *s ) noexcept
		: m_s( s ), m_len( checkLen( sfx::strlen( s ) ) ), m_terminated( ZeroTerminated ) {}

	constexpr StringView( const char *s, size_t len, Terminated terminated = Unspecified ) noexcept
		: m_s( s ), m_len( checkLen( len ) ), m_terminated( terminated ) {
		assert( !m_terminated || !m_s[len] );
	}

	[[nodiscard]]
	bool isZeroTerminated() const { return m_terminated; }

	[[nodiscard]]
	auto data() const -> const char * { return m_s; }
	[[nodiscard]]
	auto size() const -> size_t { return m_len; }
	[[nodiscard]]
	auto length() const -> size_t { return m_len; }

	[[nodiscard]]
	bool empty() const { return !m_len; }

	[[nodiscard]]
	bool equals( const sfx::StringView &that, CaseSensitivity caseSensitivity = MatchCase ) const {
		if( m_len == that.m_len ) {
			if( caseSensitivity == MatchCase ) {
				return !std::memcmp( m_s, that.m_s, m_len );
			}
			return equalCharsIgnoreCase( m_s, that.m_s, m_len );
		}
		return false;
	}

	[[nodiscard]]
	bool equalsIgnoreCase( const sfx::StringView &that ) const {
		return m_len == that.m_len && equalCharsIgnoreCase( m_s, that.m_s, m_len );
	}

	[[nodiscard]]
	bool operator==( const sfx::StringView &that ) const { return equals( that ); }
	[[nodiscard]]
	bool operator!=( const sfx::StringView &that ) const { return !equals( that ); }

	[[nodiscard]]
	auto begin() const -> const char * { return m_s; }
	[[nodiscard]]
	auto end() const -> const char * { return m_s + m_len; }

	[[nodiscard]]
	auto operator[]( size_t index ) const -> const char & {
		assert( index < m_len );
		return m_s[index];
	}

	[[nodiscard]]
	auto indexOf( char ch ) const -> std::optional<unsigned> {
		if( const auto *p = (const char *)::memchr( m_s, ch, m_len ) ) {
			return toOffset( p );
		}
		return std::nullopt;
	}

	[[nodiscard]]
	auto trimLeft() const -> sfx::StringView;
	[[nodiscard]]
	auto trimRight() const -> sfx::StringView;
	[[nodiscard]]
	auto trim() const -> sfx::StringView { return trimLeft().trimRight(); }

	[[nodiscard]]
	auto take( size_t n ) const -> sfx::StringView {
		const auto len = sfx::min<size_t>( m_len, n );
		return StringView( m_s, len, m_terminated && len == m_len ? ZeroTerminated : Unspecified );
	}

	[[nodiscard]]
	auto drop( size_t n ) const -> sfx::StringView {
		const auto prefixLen = sfx::min<size_t>( n, m_len );
		return StringView( m_s + prefixLen, m_len - prefixLen, m_terminated ? ZeroTerminated : Unspecified );
	}

	[[nodiscard]]
	auto asStdView() const -> std::string_view { return std::string_view( m_s, m_len ); }
};

[[nodiscard]]
inline constexpr auto operator "" _asView( const char *s, std::size_t len ) -> sfx::StringView {
	return len ? sfx::StringView( s, len, sfx::StringView::ZeroTerminated ) : sfx::StringView();
}

}

#endif
