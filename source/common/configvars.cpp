#include "configvars.h"
#include "sfxexceptions.h"
#include "sfxtonum.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

using sfx::operator""_asView;

namespace sfx {

DeclaredConfigVar *DeclaredConfigVar::s_listHead;

DeclaredConfigVar::DeclaredConfigVar( const sfx::StringView &name, const char *desc )
	: m_name( name ), m_desc( desc ) {
	assert( m_name.isZeroTerminated() && !m_name.empty() );
	m_next = s_listHead;
	if( s_listHead ) {
		s_listHead->m_prev = this;
	}
	s_listHead    = this;
	m_initialized = true;
}

DeclaredConfigVar::~DeclaredConfigVar() {
	if( m_next ) {
		m_next->m_prev = m_prev;
	}
	if( m_prev ) {
		m_prev->m_next = m_next;
	} else {
		assert( s_listHead == this );
		s_listHead = m_next;
	}
	m_initialized = false;
}

void DeclaredConfigVar::failOnGet() const {
	std::string message( "Attempt to get a value of an uninitialized var " );
	message.append( m_name.data(), m_name.size() );
	sfx::failWithRuntimeError( message.data() );
}

bool DeclaredConfigVar::setFromText( const sfx::StringView &text ) {
	const bool result = handleValueChanges( text.trim() );
	markModified();
	return result;
}

void DeclaredConfigVar::resetToDefault() {
	applyDefaultValue();
	markModified();
}

auto DeclaredConfigVar::findByName( const sfx::StringView &name ) -> DeclaredConfigVar * {
	for( DeclaredConfigVar *var = s_listHead; var; var = var->m_next ) {
		if( var->m_name.equalsIgnoreCase( name ) ) {
			return var;
		}
	}
	return nullptr;
}

auto DeclaredConfigVar::setByName( const sfx::StringView &name, const sfx::StringView &text ) -> std::optional<bool> {
	if( DeclaredConfigVar *var = findByName( name ) ) {
		return var->setFromText( text );
	}
	return std::nullopt;
}

void DeclaredConfigVar::resetAllToDefaults() {
	for( DeclaredConfigVar *var = s_listHead; var; var = var->m_next ) {
		var->resetToDefault();
	}
}

template <typename T>
static void appendNumber( T value, std::string *buffer ) {
	if constexpr( std::is_floating_point_v<T> ) {
		char chars[64];
		const int res = snprintf( chars, sizeof( chars ), "%g", (double)value );
		if( res > 0 && (size_t)res < sizeof( chars ) ) {
			buffer->append( chars, (size_t)res );
		}
	} else {
		buffer->append( std::to_string( value ) );
	}
}

BoolConfigVar::BoolConfigVar( const sfx::StringView &name, Params &&params )
	: DeclaredConfigVar( name, params.desc ), m_params( params ) {
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
}

void BoolConfigVar::getValueText( std::string *buffer ) const {
	buffer->push_back( get() ? '1' : '0' );
}

void BoolConfigVar::getDefaultValueText( std::string *buffer ) const {
	buffer->push_back( m_params.byDefault ? '1' : '0' );
}

bool BoolConfigVar::handleValueChanges( const sfx::StringView &newValue ) {
	if( const auto maybeNum = sfx::toNum<int64_t>( newValue ) ) {
		m_cachedValue.store( *maybeNum != 0, std::memory_order_relaxed );
		// Non-zero values other than 1 are accepted as true but get corrected
		return *maybeNum == 0 || *maybeNum == 1;
	}
	if( newValue.equalsIgnoreCase( "true"_asView ) ) {
		m_cachedValue.store( true, std::memory_order_relaxed );
		return true;
	}
	if( newValue.equalsIgnoreCase( "false"_asView ) ) {
		m_cachedValue.store( false, std::memory_order_relaxed );
		return true;
	}
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
	return false;
}

void BoolConfigVar::applyDefaultValue() {
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
}

bool BoolConfigVar::get() const {
	if( m_initialized ) [[likely]] {
		return m_cachedValue.load( std::memory_order_relaxed );
	}
	failOnGet();
}

void BoolConfigVar::set( bool value ) {
	m_cachedValue.store( value, std::memory_order_relaxed );
	markModified();
}

UnsignedConfigVar::UnsignedConfigVar( const sfx::StringView &name, Params &&params )
	: DeclaredConfigVar( name, params.desc ), m_params( params ) {
	assert( m_params.minInclusive.value_or( 0 ) <= m_params.maxInclusive.value_or( std::numeric_limits<unsigned>::max() ) );
	assert( clampValue( m_params.byDefault ) == m_params.byDefault );
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
}

auto UnsignedConfigVar::clampValue( uint64_t value ) const -> unsigned {
	const uint64_t minValue = m_params.minInclusive.value_or( 0 );
	const uint64_t maxValue = m_params.maxInclusive.value_or( std::numeric_limits<unsigned>::max() );
	return (unsigned)sfx::clamp( value, minValue, maxValue );
}

void UnsignedConfigVar::getValueText( std::string *buffer ) const {
	appendNumber( get(), buffer );
}

void UnsignedConfigVar::getDefaultValueText( std::string *buffer ) const {
	appendNumber( m_params.byDefault, buffer );
}

bool UnsignedConfigVar::handleValueChanges( const sfx::StringView &newValue ) {
	if( const std::optional<uint64_t> maybeNum = sfx::toNum<uint64_t>( newValue ) ) {
		const unsigned correctedValue = clampValue( *maybeNum );
		m_cachedValue.store( correctedValue, std::memory_order_relaxed );
		return correctedValue == *maybeNum;
	}
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
	return false;
}

void UnsignedConfigVar::applyDefaultValue() {
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
}

auto UnsignedConfigVar::get() const -> unsigned {
	if( m_initialized ) [[likely]] {
		return m_cachedValue.load( std::memory_order_relaxed );
	}
	failOnGet();
}

void UnsignedConfigVar::set( unsigned value ) {
	m_cachedValue.store( clampValue( value ), std::memory_order_relaxed );
	markModified();
}

FloatConfigVar::FloatConfigVar( const sfx::StringView &name, Params &&params )
	: DeclaredConfigVar( name, params.desc ), m_params( params ) {
	assert( std::isfinite( m_params.byDefault ) );
	assert( clampValue( m_params.byDefault ) == m_params.byDefault );
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
}

auto FloatConfigVar::clampValue( float value ) const -> float {
	const float minValue = m_params.minInclusive.value_or( std::numeric_limits<float>::lowest() );
	const float maxValue = m_params.maxInclusive.value_or( std::numeric_limits<float>::max() );
	return sfx::clamp( value, minValue, maxValue );
}

void FloatConfigVar::getValueText( std::string *buffer ) const {
	appendNumber( get(), buffer );
}

void FloatConfigVar::getDefaultValueText( std::string *buffer ) const {
	appendNumber( m_params.byDefault, buffer );
}

bool FloatConfigVar::handleValueChanges( const sfx::StringView &newValue ) {
	if( const std::optional<float> maybeNum = sfx::toNum<float>( newValue ); maybeNum && std::isfinite( *maybeNum ) ) {
		const float correctedValue = clampValue( *maybeNum );
		m_cachedValue.store( correctedValue, std::memory_order_relaxed );
		return correctedValue == *maybeNum;
	}
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
	return false;
}

void FloatConfigVar::applyDefaultValue() {
	m_cachedValue.store( m_params.byDefault, std::memory_order_relaxed );
}

auto FloatConfigVar::get() const -> float {
	if( m_initialized ) [[likely]] {
		return m_cachedValue.load( std::memory_order_relaxed );
	}
	failOnGet();
}

void FloatConfigVar::set( float value ) {
	if( !std::isfinite( value ) ) {
		sfx::failWithInvalidArgument( "The value must be finite" );
	}
	m_cachedValue.store( clampValue( value ), std::memory_order_relaxed );
	markModified();
}

UntypedEnumValueConfigVar::UntypedEnumValueConfigVar( const sfx::StringView &name, const char *desc,
													  MatcherObj matcherObj, MatcherFn matcherFn,
													  std::vector<int> &&enumValues, int defaultValue )
	: DeclaredConfigVar( name, desc ), m_matcherObj( matcherObj ), m_matcherFn( matcherFn )
	, m_enumValues( std::move( enumValues ) ), m_defaultValue( defaultValue ) {
	assert( !m_enumValues.empty() );
	assert( isAValidValue( m_defaultValue ) );
	m_cachedValue.store( m_defaultValue, std::memory_order_relaxed );
}

auto UntypedEnumValueConfigVar::helperOfGet() const -> int {
	if( m_initialized ) [[likely]] {
		return m_cachedValue.load( std::memory_order_relaxed );
	}
	failOnGet();
}

void UntypedEnumValueConfigVar::helperOfSet( int value ) {
	if( !isAValidValue( value ) ) {
		value = m_defaultValue;
	}
	m_cachedValue.store( value, std::memory_order_relaxed );
	markModified();
}

void UntypedEnumValueConfigVar::getValueText( std::string *buffer ) const {
	appendNumber( helperOfGet(), buffer );
}

void UntypedEnumValueConfigVar::getDefaultValueText( std::string *buffer ) const {
	appendNumber( m_defaultValue, buffer );
}

bool UntypedEnumValueConfigVar::handleValueChanges( const sfx::StringView &newValue ) {
	std::optional<int> validatedValue;
	if( const auto maybeNum = sfx::toNum<int>( newValue ) ) {
		if( isAValidValue( *maybeNum ) ) {
			validatedValue = maybeNum;
		}
	} else if( const auto maybeMatchedValue = m_matcherFn( m_matcherObj, newValue ) ) {
		validatedValue = maybeMatchedValue;
	}
	if( validatedValue ) {
		m_cachedValue.store( *validatedValue, std::memory_order_relaxed );
		return true;
	}
	m_cachedValue.store( m_defaultValue, std::memory_order_relaxed );
	return false;
}

void UntypedEnumValueConfigVar::applyDefaultValue() {
	m_cachedValue.store( m_defaultValue, std::memory_order_relaxed );
}

bool UntypedEnumValueConfigVar::isAValidValue( int value ) const {
	return std::find( m_enumValues.begin(), m_enumValues.end(), value ) != m_enumValues.end();
}

UntypedEnumFlagsConfigVar::UntypedEnumFlagsConfigVar( const sfx::StringView &name, const char *desc,
													  MatcherObj matcherObj, MatcherFn matcherFn,
													  std::vector<unsigned> &&enumValues,
													  size_t typeSizeInBytes, unsigned defaultValue )
	: DeclaredConfigVar( name, desc ), m_matcherObj( matcherObj ), m_matcherFn( matcherFn )
	, m_enumValues( std::move( enumValues ) ) {
	assert( !m_enumValues.empty() );
	for( const unsigned value: m_enumValues ) {
		m_allBitsInEnumValues |= value;
		if( !value ) {
			m_hasZeroInValues = true;
		}
	}
	m_defaultValue = defaultValue & m_allBitsInEnumValues;
	// We can't just use "~0u" as lesser than "~0u" all-bits-set default values may be specified for types of lesser size
	assert( typeSizeInBytes == 1 || typeSizeInBytes == 2 || typeSizeInBytes == 4 );
	m_allBitsSetValueForType = 255;
	for( size_t i = 1; i < typeSizeInBytes; ++i ) {
		m_allBitsSetValueForType = ( m_allBitsSetValueForType << 8 ) | 255;
	}
	m_cachedValue.store( m_defaultValue, std::memory_order_relaxed );
}

void UntypedEnumFlagsConfigVar::writeValueText( unsigned value, std::string *buffer ) const {
	if( value != m_allBitsSetValueForType && value != m_allBitsInEnumValues ) {
		appendNumber( value, buffer );
	} else {
		// Try displaying it nicer
		buffer->append( "-1", 2 );
	}
}

void UntypedEnumFlagsConfigVar::getValueText( std::string *buffer ) const {
	writeValueText( helperOfGet(), buffer );
}

void UntypedEnumFlagsConfigVar::getDefaultValueText( std::string *buffer ) const {
	writeValueText( m_defaultValue, buffer );
}

bool UntypedEnumFlagsConfigVar::handleValueChanges( const sfx::StringView &newValue ) {
	std::optional<unsigned> validatedValue;
	if( const auto maybeNum = sfx::toNum<unsigned>( newValue ) ) {
		if( isAnAcceptableValue( *maybeNum ) ) {
			// While accepting (enum-type)~0u, make sure that it does not contain extra bits
			validatedValue = *maybeNum & m_allBitsInEnumValues;
		}
	} else if( sfx::toNum<int>( newValue ) == std::optional<int>( -1 ) ) {
		validatedValue = m_allBitsInEnumValues;
	} else {
		// Try parsing '|' - separated string of tokens or values
		validatedValue = parseValueFromString( newValue );
	}
	if( validatedValue ) {
		m_cachedValue.store( *validatedValue, std::memory_order_relaxed );
		return true;
	}
	m_cachedValue.store( m_defaultValue, std::memory_order_relaxed );
	return false;
}

void UntypedEnumFlagsConfigVar::applyDefaultValue() {
	m_cachedValue.store( m_defaultValue, std::memory_order_relaxed );
}

auto UntypedEnumFlagsConfigVar::parseValueFromString( const sfx::StringView &string ) const -> std::optional<unsigned> {
	if( string.empty() ) {
		if( m_hasZeroInValues ) {
			return 0;
		}
		return std::nullopt;
	}

	unsigned newValueBits = 0;
	sfx::StringView rest( string );
	for(;; ) {
		const std::optional<unsigned> maybeSeparatorIndex = rest.indexOf( '|' );
		const sfx::StringView token = rest.take( maybeSeparatorIndex.value_or( (unsigned)rest.size() ) ).trim();
		if( const auto maybeTokenNum = sfx::toNum<unsigned>( token ) ) {
			if( std::find( m_enumValues.begin(), m_enumValues.end(), *maybeTokenNum ) != m_enumValues.end() ) {
				newValueBits |= *maybeTokenNum;
			} else {
				return std::nullopt;
			}
		} else if( const auto maybeMatchedValue = m_matcherFn( m_matcherObj, token ) ) {
			newValueBits |= *maybeMatchedValue;
		} else {
			return std::nullopt;
		}
		if( !maybeSeparatorIndex ) {
			break;
		}
		rest = rest.drop( *maybeSeparatorIndex + 1 );
	}
	return newValueBits;
}

bool UntypedEnumFlagsConfigVar::isAnAcceptableValue( unsigned value ) const {
	// If it matches some bits (or is zero and zeroes are allowed)
	if( ( m_allBitsInEnumValues & value ) || ( m_hasZeroInValues && !value ) ) {
		// If it does not add extra bits, with the exception of the all-bits-set value
		if( !( ~m_allBitsInEnumValues & value ) || ( value == m_allBitsSetValueForType ) ) {
			return true;
		}
	}
	return false;
}

auto UntypedEnumFlagsConfigVar::helperOfGet() const -> unsigned {
	if( m_initialized ) [[likely]] {
		return m_cachedValue.load( std::memory_order_relaxed );
	}
	failOnGet();
}

void UntypedEnumFlagsConfigVar::helperOfSet( unsigned value ) {
	if( isAnAcceptableValue( value ) ) {
		m_cachedValue.store( value & m_allBitsInEnumValues, std::memory_order_relaxed );
	} else {
		m_cachedValue.store( m_defaultValue, std::memory_order_relaxed );
	}
	markModified();
}

}
