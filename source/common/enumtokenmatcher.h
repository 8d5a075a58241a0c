#ifndef SFX_b8ac1b0c_13e8_4886_8239_a07545ad663e_H
#define SFX_b8ac1b0c_13e8_4886_8239_a07545ad663e_H

#include "sfxstringview.h"

#include <initializer_list>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace sfx {

// Allows an efficient matching of short string tokens against string representations of enum values.
// Registered names are assumed to have an externally managed lifetime, preferrably &'static one.
template <typename Enum, typename Derived>
class EnumTokenMatcher {
public:
	EnumTokenMatcher() {
		for( int16_t &head: m_smallLengthHeads ) {
			head = -1;
		}
	}

	EnumTokenMatcher( std::initializer_list<std::pair<sfx::StringView, Enum>> namesAndValues ) : EnumTokenMatcher() {
		m_patterns.reserve( namesAndValues.size() );
		for( const auto &[name, value] : namesAndValues ) {
			add( name, value );
		}
	}

	[[nodiscard]]
	auto match( const sfx::StringView &token ) const -> std::optional<Enum> {
		const size_t length = token.length();
		if( length < m_minLengthSoFar || length > m_maxLengthSoFar ) [[unlikely]] {
			return std::nullopt;
		}
		if( length - 1 < std::size( m_smallLengthHeads ) ) [[likely]] {
			return matchInList( m_smallLengthHeads[length - 1], token );
		}
		return matchInList( m_largeLengthHead, token );
	}

	/// Returns the first registered name of the value
	[[nodiscard]]
	auto getName( Enum value ) const -> std::optional<sfx::StringView> {
		for( const TokenPattern &pattern: m_patterns ) {
			if( pattern.value == value ) {
				return pattern.name;
			}
		}
		return std::nullopt;
	}

	// Type-erased accessors for config vars

	template <typename Numeric>
	[[nodiscard]]
	static auto matchFn( const void *matcher, const sfx::StringView &token ) -> std::optional<Numeric> {
		if( const std::optional<Enum> maybeValue = ( (const Derived *)matcher )->match( token ) ) {
			return (Numeric)*maybeValue;
		}
		return std::nullopt;
	}

	template <typename Numeric>
	[[nodiscard]]
	auto getEnumValues() const -> std::vector<Numeric> {
		std::vector<Numeric> result;
		result.reserve( m_patterns.size() );
		for( const TokenPattern &pattern: m_patterns ) {
			result.push_back( (Numeric)pattern.value );
		}
		return result;
	}

	// We have to use the static getter (even if it's undesired) as a workaround
	// https://developercommunity.visualstudio.com/t/c-class-with-inline-static-member-of-the-same-type/973593
	static Derived &instance() {
		static Derived s_instance;
		return s_instance;
	}
protected:
	struct TokenPattern {
		sfx::StringView name;
		int16_t ownIndex { -1 };
		int16_t nextIndexInList { -1 };
		Enum value;

		TokenPattern( const sfx::StringView &name, Enum value ): name( name ), value( value ) {}
		[[nodiscard]]
		bool match( const sfx::StringView &token ) const { return name.equalsIgnoreCase( token ); }
	};

	void add( const sfx::StringView &name, Enum value ) {
		assert( name.length() && name.length() <= std::numeric_limits<uint16_t>::max() );
		assert( m_patterns.size() < (size_t)std::numeric_limits<int16_t>::max() );
		const auto newPatternIndex  = (int16_t)m_patterns.size();
		const auto newPatternLength = (uint16_t)name.length();

		// Figure out what bin should be used for this name
		int16_t *headIndex = &m_largeLengthHead;
		if( (size_t)( newPatternLength - 1 ) < std::size( m_smallLengthHeads ) ) {
			headIndex = &m_smallLengthHeads[newPatternLength - 1];
		}

		m_minLengthSoFar = sfx::min( newPatternLength, m_minLengthSoFar );
		m_maxLengthSoFar = sfx::max( newPatternLength, m_maxLengthSoFar );

		m_patterns.emplace_back( TokenPattern( name, value ) );
		// Link the newly created pattern to the head of the list
		m_patterns.back().ownIndex        = newPatternIndex;
		m_patterns.back().nextIndexInList = *headIndex;
		*headIndex                        = newPatternIndex;
	}

	[[nodiscard]]
	auto matchInList( int headIndex, const sfx::StringView &token ) const -> std::optional<Enum> {
		for( int index = headIndex; index >= 0; ) {
			const TokenPattern &pattern = m_patterns[index];
			if( pattern.match( token ) ) {
				return pattern.value;
			}
			index = pattern.nextIndexInList;
		}
		return std::nullopt;
	}

	std::vector<TokenPattern> m_patterns;
	// We can't use pointers due to possible relocations of m_patterns data
	int16_t m_smallLengthHeads[15];
	int16_t m_largeLengthHead { -1 };
	uint16_t m_minLengthSoFar { std::numeric_limits<uint16_t>::max() };
	uint16_t m_maxLengthSoFar { 0 };
};

}

#endif
