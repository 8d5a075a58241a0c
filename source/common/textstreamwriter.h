#ifndef SFX_66ebbbe4_80b1_4209_a595_2211a8e80c8a_H
#define SFX_66ebbbe4_80b1_4209_a595_2211a8e80c8a_H

#include "sfxbasicmath.h"

#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <type_traits>

namespace sfx {

class OutputMessageStream;

class TextStreamWriter {
protected:
	OutputMessageStream *const m_stream;

	// Values that do not fit the stream are silently truncated.

	template <typename T>
	sfx_forceinline void writeFloatingPointValue( T value );
	template <typename T>
	sfx_forceinline void writeIntegralValue( T value );

public:
	explicit TextStreamWriter( OutputMessageStream *stream ) : m_stream( stream ) {}

	TextStreamWriter( const TextStreamWriter & ) = delete;
	TextStreamWriter( TextStreamWriter && ) = delete;
	auto operator=( const TextStreamWriter & ) = delete;
	auto operator=( TextStreamWriter && ) = delete;

	// Note: these methods are made public to avoid hassle with declaring global operators as friends.

	void writeInt32( int32_t value );
	void writeInt64( int64_t value );
	void writeUInt32( uint32_t value );
	void writeUInt64( uint64_t value );
	void writeFloat( float value );
	void writeDouble( double value );

	void writeChar( char value );
	void writeChars( const char *chars, size_t numGivenChars );
	void writeQuotedChars( const char *chars, size_t numGivenChars );

	char separatorChar { ' ' };
	char quotesChar { '\'' };
	bool hasPendingSeparator { false };
	bool usePendingSeparators { true };
};

// https://stackoverflow.com/a/74922953
struct StringLiteral {
private:
	[[nodiscard]]
	static consteval auto trimTrailingZeros( const char *s, size_t n ) -> size_t {
		while( n && s[n - 1] == '\0' ) {
			n--;
		}
		return n;
	}
public:
	template<class T, std::size_t N, std::enable_if_t<std::is_same_v<T, const char>>...>
	consteval StringLiteral( T ( &chars )[N] ) : data( chars ), length( trimTrailingZeros( chars, N ) ) {}

	const char *const data;
	const size_t length;
};

template <typename Chars>
struct unquoted {
	explicit constexpr unquoted( const Chars &chars ): chars( chars ) {}
	const Chars &chars;
};

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, char value ) -> TextStreamWriter & {
	writer.writeChar( value ); return writer;
}

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, int32_t value ) -> TextStreamWriter & {
	writer.writeInt32( value ); return writer;
}

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, int64_t value ) -> TextStreamWriter & {
	writer.writeInt64( value ); return writer;
}

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, uint32_t value ) -> TextStreamWriter & {
	writer.writeUInt32( value ); return writer;
}

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, uint64_t value ) -> TextStreamWriter & {
	writer.writeUInt64( value ); return writer;
}

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, float value ) -> TextStreamWriter & {
	writer.writeFloat( value ); return writer;
}

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, double value ) -> TextStreamWriter & {
	writer.writeDouble( value ); return writer;
}

[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, const StringLiteral &literal ) -> TextStreamWriter & {
	if( literal.length ) [[likely]] {
		writer.writeChars( literal.data, literal.length );
	}
	return writer;
}

template <typename Chars>
	requires
		requires( const Chars &ch ) {
		{ ch.data() } -> std::same_as<const char *>;
		{ ch.size() } -> std::integral;
	}
[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, const Chars &chars ) -> TextStreamWriter & {
	writer.writeQuotedChars( chars.data(), chars.size() );
	return writer;
}

template <typename Chars>
[[maybe_unused]]
sfx_forceinline auto operator<<( TextStreamWriter &writer, unquoted<Chars> &&unquotedChars ) -> TextStreamWriter & {
	writer.writeChars( unquotedChars.chars.data(), unquotedChars.chars.size() );
	return writer;
}

}

#endif
