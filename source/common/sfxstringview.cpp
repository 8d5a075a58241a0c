#include "sfxstringview.h"

#include <cctype>

namespace sfx {

bool equalCharsIgnoreCase( const char *s1, const char *s2, size_t length ) {
	for( size_t i = 0; i < length; ++i ) {
		if( std::tolower( (unsigned char)s1[i] ) != std::tolower( (unsigned char)s2[i] ) ) {
			return false;
		}
	}
	return true;
}

auto StringView::trimLeft() const -> sfx::StringView {
	const char *p = m_s, *end = m_s + m_len;
	while( p != end && std::isspace( (unsigned char)*p ) ) {
		++p;
	}
	return StringView( p, (size_t)( end - p ), m_terminated ? ZeroTerminated : Unspecified );
}

auto StringView::trimRight() const -> sfx::StringView {
	const char *end = m_s + m_len;
	while( end != m_s && std::isspace( (unsigned char)*( end - 1 ) ) ) {
		--end;
	}
	const auto len = (size_t)( end - m_s );
	return StringView( m_s, len, m_terminated && len == m_len ? ZeroTerminated : Unspecified );
}

}
