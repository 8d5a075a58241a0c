#include "outputmessages.h"
#include "textstreamwriter.h"

#include <cassert>
#include <charconv>
#include <cstdio>
#include <cstring>

namespace sfx {

template <typename T>
sfx_forceinline void TextStreamWriter::writeFloatingPointValue( T value ) {
	static_assert( std::is_same_v<std::remove_cvref_t<T>, float> || std::is_same_v<std::remove_cvref_t<T>, double> );
	const size_t separatorLen  = ( hasPendingSeparator ? 1 : 0 );
	constexpr size_t numberLen = std::is_same_v<std::remove_cvref_t<T>, float> ? 48 : 320;
	const size_t sizeToReserve = separatorLen + numberLen + 1;
	if( char *bufferChars = m_stream->reserve( sizeToReserve ) ) [[likely]] {
		bufferChars[0] = separatorChar;
		// std::to_chars() for floating-point values is not universally available yet
		const int res = snprintf( bufferChars + separatorLen, numberLen + 1, "%f", (double)value );
		if( res > 0 && (size_t)res <= numberLen ) {
			m_stream->advance( (size_t)res + separatorLen );
			hasPendingSeparator = usePendingSeparators;
		}
	}
}

template <typename T>
sfx_forceinline void TextStreamWriter::writeIntegralValue( T value ) {
	const size_t separatorLen  = ( hasPendingSeparator ? 1 : 0 );
	constexpr size_t numberLen = 24;
	const size_t sizeToReserve = numberLen + separatorLen;
	if( char *const bufferChars = m_stream->reserve( sizeToReserve ) ) [[likely]] {
		bufferChars[0] = separatorChar;
		char *const toCharsBegin = bufferChars + separatorLen;
		char *const toCharsEnd   = bufferChars + separatorLen + numberLen;
		const auto [ptr, err] = std::to_chars( toCharsBegin, toCharsEnd, value );
		if( err == std::errc() ) [[likely]] {
			m_stream->advance( (size_t)( ptr - toCharsBegin ) + separatorLen );
			hasPendingSeparator = usePendingSeparators;
		}
	}
}

void TextStreamWriter::writeInt32( int32_t value ) {
	writeIntegralValue<int32_t>( value );
}

void TextStreamWriter::writeInt64( int64_t value ) {
	writeIntegralValue<int64_t>( value );
}

void TextStreamWriter::writeUInt32( uint32_t value ) {
	writeIntegralValue<uint32_t>( value );
}

void TextStreamWriter::writeUInt64( uint64_t value ) {
	writeIntegralValue<uint64_t>( value );
}

void TextStreamWriter::writeFloat( float value ) {
	writeFloatingPointValue<float>( value );
}

void TextStreamWriter::writeDouble( double value ) {
	writeFloatingPointValue<double>( value );
}

void TextStreamWriter::writeChar( char value ) {
	const size_t separatorLen = ( hasPendingSeparator ? 1 : 0 );
	const size_t charsToWrite = separatorLen + 1;
	if( char *const bufferChars = m_stream->reserve( charsToWrite ) ) [[likely]] {
		bufferChars[0] = separatorChar;
		bufferChars[separatorLen] = value;
		m_stream->advance( charsToWrite );
		hasPendingSeparator = usePendingSeparators;
	}
}

void TextStreamWriter::writeChars( const char *chars, size_t numGivenChars ) {
	if( numGivenChars ) [[likely]] {
		const size_t separatorLen = ( hasPendingSeparator ? 1 : 0 );
		const size_t charsToWrite = separatorLen + numGivenChars;
		if( char *bufferChars = m_stream->reserve( charsToWrite ) ) [[likely]] {
			bufferChars[0] = separatorChar;
			std::memcpy( bufferChars + separatorLen, chars, numGivenChars );
			m_stream->advance( charsToWrite );
			hasPendingSeparator = usePendingSeparators;
		}
	}
}

void TextStreamWriter::writeQuotedChars( const char *chars, size_t numGivenChars ) {
	// Empty strings are still printed as a pair of quotes
	const size_t separatorLen = ( hasPendingSeparator ? 1 : 0 );
	const size_t charsToWrite = separatorLen + numGivenChars + 2;
	if( char *bufferChars = m_stream->reserve( charsToWrite ) ) [[likely]] {
		bufferChars[0] = separatorChar;
		bufferChars[separatorLen] = quotesChar;
		if( numGivenChars ) {
			std::memcpy( bufferChars + separatorLen + 1, chars, numGivenChars );
		}
		bufferChars[separatorLen + 1 + numGivenChars] = quotesChar;
		m_stream->advance( charsToWrite );
		hasPendingSeparator = usePendingSeparators;
	}
}

}
