#ifndef SFX_401ac9ba_ab1a_4661_a79f_2d6b7385ce67_H
#define SFX_401ac9ba_ab1a_4661_a79f_2d6b7385ce67_H

#include "sfxstringview.h"

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace sfx {

/// A base for statically declared tunables.
/// Vars link themselves into a global list at construction and hold their current value.
/// Values are read from the simulation thread and may be changed by the host using text representations.
class DeclaredConfigVar {
public:
	virtual ~DeclaredConfigVar();

	DeclaredConfigVar( const DeclaredConfigVar & ) = delete;
	auto operator=( const DeclaredConfigVar & ) -> DeclaredConfigVar & = delete;
	DeclaredConfigVar( DeclaredConfigVar && ) = delete;
	auto operator=( DeclaredConfigVar && ) -> DeclaredConfigVar & = delete;

	/// False if the var is accessed during static initialization before being constructed
	[[nodiscard]]
	bool initialized() const { return m_initialized; }
	[[nodiscard]]
	auto modificationId() const -> uint64_t { return m_modificationId.load( std::memory_order_relaxed ); }
	[[nodiscard]]
	auto getName() const -> const sfx::StringView & { return m_name; }
	[[nodiscard]]
	auto getDesc() const -> const char * { return m_desc; }

	/// Sets the value from text.
	/// Returns false if the text could not be accepted as is, so the value was either corrected or reset.
	[[maybe_unused]]
	bool setFromText( const sfx::StringView &text );
	void resetToDefault();

	virtual void getValueText( std::string *buffer ) const = 0;
	virtual void getDefaultValueText( std::string *buffer ) const = 0;

	[[nodiscard]]
	static auto findByName( const sfx::StringView &name ) -> DeclaredConfigVar *;
	/// Returns std::nullopt if there's no var with the given name, the result of setFromText() otherwise
	[[nodiscard]]
	static auto setByName( const sfx::StringView &name, const sfx::StringView &text ) -> std::optional<bool>;
	static void resetAllToDefaults();

	[[nodiscard]]
	static auto listHead() -> DeclaredConfigVar * { return s_listHead; }
	[[nodiscard]]
	auto next() const -> DeclaredConfigVar * { return m_next; }
protected:
	DeclaredConfigVar( const sfx::StringView &name, const char *desc );

	[[nodiscard]]
	virtual bool handleValueChanges( const sfx::StringView &newValue ) = 0;
	virtual void applyDefaultValue() = 0;

	void markModified() { m_modificationId.fetch_add( 1, std::memory_order_relaxed ); }

	[[noreturn]]
	void failOnGet() const;

	DeclaredConfigVar *m_next { nullptr };
	DeclaredConfigVar *m_prev { nullptr };
	const sfx::StringView m_name;
	const char *const m_desc;
	std::atomic<uint64_t> m_modificationId { 0 };
	bool m_initialized { false };

	static DeclaredConfigVar *s_listHead;
};

class VarModificationTracker {
public:
	explicit VarModificationTracker( const DeclaredConfigVar *trackedVar ) : m_trackedVar( trackedVar ) {}

	[[nodiscard]]
	bool checkAndReset() {
		if( m_trackedVar->initialized() ) [[likely]] {
			if( const uint64_t modificationId = m_trackedVar->modificationId(); modificationId != m_lastModificationId ) {
				m_lastModificationId = modificationId;
				return true;
			}
		}
		return false;
	}
private:
	const DeclaredConfigVar *const m_trackedVar;
	uint64_t m_lastModificationId { ~(uint64_t)0 };
};

class BoolConfigVar final : public DeclaredConfigVar {
public:
	struct Params {
		const bool byDefault { false };
		const char *desc { nullptr };
	};

	BoolConfigVar( const sfx::StringView &name, Params &&params );

	[[nodiscard]]
	bool get() const;
	void set( bool value );

	void getValueText( std::string *buffer ) const override;
	void getDefaultValueText( std::string *buffer ) const override;
private:
	bool handleValueChanges( const sfx::StringView &newValue ) override;
	void applyDefaultValue() override;

	const Params m_params;
	// Note: Due to correctness reasons, we have to use atomic wrappers for values
	// that get read/written from multiple threads. Their operations default to relaxed loads/stores.
	std::atomic<bool> m_cachedValue { false };
};

class UnsignedConfigVar final : public DeclaredConfigVar {
public:
	struct Params {
		const unsigned byDefault { 0 };
		const std::optional<unsigned> minInclusive;
		const std::optional<unsigned> maxInclusive;
		const char *desc { nullptr };
	};

	UnsignedConfigVar( const sfx::StringView &name, Params &&params );

	[[nodiscard]]
	auto get() const -> unsigned;
	void set( unsigned value );

	void getValueText( std::string *buffer ) const override;
	void getDefaultValueText( std::string *buffer ) const override;
private:
	bool handleValueChanges( const sfx::StringView &newValue ) override;
	void applyDefaultValue() override;

	[[nodiscard]]
	auto clampValue( uint64_t value ) const -> unsigned;

	const Params m_params;
	std::atomic<unsigned> m_cachedValue { 0 };
};

class FloatConfigVar final : public DeclaredConfigVar {
public:
	struct Params {
		const float byDefault { 0.0f };
		const std::optional<float> minInclusive;
		const std::optional<float> maxInclusive;
		const char *desc { nullptr };
	};

	FloatConfigVar( const sfx::StringView &name, Params &&params );

	[[nodiscard]]
	auto get() const -> float;
	void set( float value );

	void getValueText( std::string *buffer ) const override;
	void getDefaultValueText( std::string *buffer ) const override;
private:
	bool handleValueChanges( const sfx::StringView &newValue ) override;
	void applyDefaultValue() override;

	[[nodiscard]]
	auto clampValue( float value ) const -> float;

	const Params m_params;
	std::atomic<float> m_cachedValue { 0.0f };
};

class UntypedEnumValueConfigVar : public DeclaredConfigVar {
public:
	using MatcherObj  = const void *;
	using MatcherFn   = std::optional<int> (*)( const void *, const sfx::StringView & );

	void getValueText( std::string *buffer ) const final;
	void getDefaultValueText( std::string *buffer ) const final;
protected:
	UntypedEnumValueConfigVar( const sfx::StringView &name, const char *desc,
							   MatcherObj matcherObj, MatcherFn matcherFn,
							   std::vector<int> &&enumValues, int defaultValue );

	[[nodiscard]]
	auto helperOfGet() const -> int;
	void helperOfSet( int value );
private:
	bool handleValueChanges( const sfx::StringView &newValue ) final;
	void applyDefaultValue() final;

	[[nodiscard]]
	bool isAValidValue( int value ) const;

	const MatcherObj m_matcherObj;
	const MatcherFn m_matcherFn;
	const std::vector<int> m_enumValues;
	std::atomic<int> m_cachedValue { 0 };
	const int m_defaultValue;
};

template <typename Enum, typename Matcher>
class EnumValueConfigVar final : public UntypedEnumValueConfigVar {
	using NumericType   = std::underlying_type_t<Enum>;
	static_assert( sizeof( NumericType ) <= 4, "The code assumes that values fit a regular integer" );
public:
	struct Params {
		const Enum byDefault {};
		const char *desc { nullptr };
	};

	EnumValueConfigVar( const sfx::StringView &name, Params &&params )
		: UntypedEnumValueConfigVar( name, params.desc, std::addressof( Matcher::instance() ),
									 &Matcher::template matchFn<int>,
									 Matcher::instance().template getEnumValues<int>(), (int)params.byDefault ) {}

	[[nodiscard]]
	auto get() const -> Enum {
		return (Enum)UntypedEnumValueConfigVar::helperOfGet();
	}
	void set( Enum value ) {
		UntypedEnumValueConfigVar::helperOfSet( (int)value );
	}
};

class UntypedEnumFlagsConfigVar : public DeclaredConfigVar {
public:
	using MatcherObj  = const void *;
	using MatcherFn   = std::optional<unsigned> (*)( const void *, const sfx::StringView & );

	void getValueText( std::string *buffer ) const final;
	void getDefaultValueText( std::string *buffer ) const final;
protected:
	UntypedEnumFlagsConfigVar( const sfx::StringView &name, const char *desc,
							   MatcherObj matcherObj, MatcherFn matcherFn,
							   std::vector<unsigned> &&enumValues, size_t typeSizeInBytes, unsigned defaultValue );

	[[nodiscard]]
	auto helperOfGet() const -> unsigned;
	void helperOfSet( unsigned value );
private:
	bool handleValueChanges( const sfx::StringView &newValue ) final;
	void applyDefaultValue() final;

	[[nodiscard]]
	auto parseValueFromString( const sfx::StringView &string ) const -> std::optional<unsigned>;
	[[nodiscard]]
	bool isAnAcceptableValue( unsigned value ) const;

	void writeValueText( unsigned value, std::string *buffer ) const;

	const MatcherObj m_matcherObj;
	const MatcherFn m_matcherFn;
	const std::vector<unsigned> m_enumValues;
	unsigned m_defaultValue { 0 };
	unsigned m_allBitsInEnumValues { 0 };
	unsigned m_allBitsSetValueForType { 0 };
	std::atomic<unsigned> m_cachedValue { 0 };
	bool m_hasZeroInValues { false };
};

template <typename Enum, typename Matcher>
class EnumFlagsConfigVar final : public UntypedEnumFlagsConfigVar {
	using NumericType = std::underlying_type_t<Enum>;
	static_assert( std::is_unsigned_v<NumericType>, "Using signed types for flags is wrong" );
	static_assert( sizeof( NumericType ) <= 4, "The code assumes that values fit a regular unsigned integer" );
public:
	struct Params {
		const Enum byDefault {};
		const char *desc { nullptr };
	};

	EnumFlagsConfigVar( const sfx::StringView &name, Params &&params )
		: UntypedEnumFlagsConfigVar( name, params.desc, std::addressof( Matcher::instance() ),
									 &Matcher::template matchFn<unsigned>,
									 Matcher::instance().template getEnumValues<unsigned>(),
									 sizeof( Enum ), (unsigned)params.byDefault ) {}

	[[nodiscard]]
	auto get() const -> Enum {
		return (Enum)UntypedEnumFlagsConfigVar::helperOfGet();
	}
	[[nodiscard]]
	bool isAnyBitSet( Enum value ) const {
		return ( UntypedEnumFlagsConfigVar::helperOfGet() & (unsigned)value ) != 0;
	}
	[[nodiscard]]
	bool areAllBitsSet( Enum value ) const {
		return ( UntypedEnumFlagsConfigVar::helperOfGet() & (unsigned)value ) == (unsigned)value;
	}
	void set( Enum value ) {
		UntypedEnumFlagsConfigVar::helperOfSet( (unsigned)value );
	}
};

}

#endif
