#include "configvarstest.h"
#include "../configvars.h"
#include "../enumtokenmatcher.h"

#include <cmath>
#include <limits>
#include <stdexcept>

using sfx::operator""_asView;

enum class Quality : uint8_t { Low, Medium, High };

class QualityMatcher : public sfx::EnumTokenMatcher<Quality, QualityMatcher> {
public:
	QualityMatcher() : sfx::EnumTokenMatcher<Quality, QualityMatcher>( {
		{ "Low"_asView, Quality::Low },
		{ "Medium"_asView, Quality::Medium },
		{ "High"_asView, Quality::High },
	}) {}
};

enum class Channels : unsigned { None = 0, Visual = 1, Audio = 2, Decals = 4 };

class ChannelsMatcher : public sfx::EnumTokenMatcher<Channels, ChannelsMatcher> {
public:
	ChannelsMatcher() : sfx::EnumTokenMatcher<Channels, ChannelsMatcher>( {
		{ "None"_asView, Channels::None },
		{ "Visual"_asView, Channels::Visual },
		{ "Audio"_asView, Channels::Audio },
		{ "Decals"_asView, Channels::Decals },
	}) {}
};

static sfx::BoolConfigVar v_testBool( "test_bool"_asView, { .byDefault = true, .desc = "A bool var" } );

static sfx::UnsignedConfigVar v_testUnsigned( "test_unsigned"_asView, {
	.byDefault = 10, .minInclusive = 1, .maxInclusive = 1024, .desc = "An unsigned var",
});

static sfx::FloatConfigVar v_testFloat( "test_float"_asView, {
	.byDefault = 0.5f, .minInclusive = 0.0f, .maxInclusive = 16.0f, .desc = "A float var",
});

static sfx::EnumValueConfigVar<Quality, QualityMatcher> v_testQuality( "test_quality"_asView, {
	.byDefault = Quality::Medium, .desc = "An enum var",
});

static sfx::EnumFlagsConfigVar<Channels, ChannelsMatcher> v_testChannels( "test_channels"_asView, {
	.byDefault = Channels::Visual, .desc = "A flags var",
});

void ConfigVarsTest::init() {
	v_testBool.resetToDefault();
	v_testUnsigned.resetToDefault();
	v_testFloat.resetToDefault();
	v_testQuality.resetToDefault();
	v_testChannels.resetToDefault();
}

void ConfigVarsTest::test_defaults() {
	QVERIFY( v_testBool.get() );
	QCOMPARE( v_testUnsigned.get(), 10u );
	QCOMPARE( v_testFloat.get(), 0.5f );
	QVERIFY( v_testQuality.get() == Quality::Medium );
	QVERIFY( v_testChannels.get() == Channels::Visual );
	QVERIFY( v_testBool.initialized() );
	QCOMPARE( std::string_view( v_testBool.getDesc() ), std::string_view( "A bool var" ) );
}

void ConfigVarsTest::test_boolVar() {
	QVERIFY( v_testBool.setFromText( "0"_asView ) );
	QVERIFY( !v_testBool.get() );
	QVERIFY( v_testBool.setFromText( " TRUE "_asView ) );
	QVERIFY( v_testBool.get() );
	QVERIFY( v_testBool.setFromText( "false"_asView ) );
	QVERIFY( !v_testBool.get() );

	// Accepted, but corrected
	QVERIFY( !v_testBool.setFromText( "2"_asView ) );
	QVERIFY( v_testBool.get() );

	v_testBool.set( false );
	QVERIFY( !v_testBool.setFromText( "maybe"_asView ) );
	QVERIFY( v_testBool.get() );
}

void ConfigVarsTest::test_unsignedVarClamping() {
	QVERIFY( v_testUnsigned.setFromText( "64"_asView ) );
	QCOMPARE( v_testUnsigned.get(), 64u );

	QVERIFY( !v_testUnsigned.setFromText( "0"_asView ) );
	QCOMPARE( v_testUnsigned.get(), 1u );

	QVERIFY( !v_testUnsigned.setFromText( "2048"_asView ) );
	QCOMPARE( v_testUnsigned.get(), 1024u );

	QVERIFY( !v_testUnsigned.setFromText( "-5"_asView ) );
	QCOMPARE( v_testUnsigned.get(), 10u );

	v_testUnsigned.set( 5000 );
	QCOMPARE( v_testUnsigned.get(), 1024u );
}

void ConfigVarsTest::test_floatVarClamping() {
	QVERIFY( v_testFloat.setFromText( "0.25"_asView ) );
	QCOMPARE( v_testFloat.get(), 0.25f );

	QVERIFY( !v_testFloat.setFromText( "-1"_asView ) );
	QCOMPARE( v_testFloat.get(), 0.0f );

	QVERIFY( !v_testFloat.setFromText( "100"_asView ) );
	QCOMPARE( v_testFloat.get(), 16.0f );

	QVERIFY( !v_testFloat.setFromText( "inf"_asView ) );
	QCOMPARE( v_testFloat.get(), 0.5f );

	bool hasRejectedNaN = false;
	try {
		v_testFloat.set( std::numeric_limits<float>::quiet_NaN() );
	} catch( const std::invalid_argument & ) {
		hasRejectedNaN = true;
	}
	QVERIFY( hasRejectedNaN );
	QCOMPARE( v_testFloat.get(), 0.5f );
}

void ConfigVarsTest::test_enumValueVar() {
	QVERIFY( v_testQuality.setFromText( "high"_asView ) );
	QVERIFY( v_testQuality.get() == Quality::High );

	QVERIFY( v_testQuality.setFromText( "0"_asView ) );
	QVERIFY( v_testQuality.get() == Quality::Low );

	QVERIFY( !v_testQuality.setFromText( "7"_asView ) );
	QVERIFY( v_testQuality.get() == Quality::Medium );

	QVERIFY( !v_testQuality.setFromText( "Ultra"_asView ) );
	QVERIFY( v_testQuality.get() == Quality::Medium );
}

void ConfigVarsTest::test_enumFlagsVar() {
	QVERIFY( v_testChannels.setFromText( "Audio | decals"_asView ) );
	QCOMPARE( (unsigned)v_testChannels.get(), 6u );
	QVERIFY( v_testChannels.isAnyBitSet( Channels::Audio ) );
	QVERIFY( !v_testChannels.isAnyBitSet( Channels::Visual ) );
	QVERIFY( v_testChannels.areAllBitsSet( (Channels)6 ) );

	QVERIFY( v_testChannels.setFromText( "-1"_asView ) );
	QCOMPARE( (unsigned)v_testChannels.get(), 7u );

	QVERIFY( v_testChannels.setFromText( "None"_asView ) );
	QCOMPARE( (unsigned)v_testChannels.get(), 0u );

	QVERIFY( v_testChannels.setFromText( "3"_asView ) );
	QCOMPARE( (unsigned)v_testChannels.get(), 3u );

	// Unknown bits
	QVERIFY( !v_testChannels.setFromText( "8"_asView ) );
	QVERIFY( v_testChannels.get() == Channels::Visual );

	QVERIFY( !v_testChannels.setFromText( "Audio|Haptics"_asView ) );
	QVERIFY( v_testChannels.get() == Channels::Visual );
}

void ConfigVarsTest::test_setByName() {
	QVERIFY( sfx::DeclaredConfigVar::findByName( "TEST_UNSIGNED"_asView ) == &v_testUnsigned );
	QVERIFY( !sfx::DeclaredConfigVar::findByName( "test_missing"_asView ) );

	QVERIFY( sfx::DeclaredConfigVar::setByName( "Test_Unsigned"_asView, "32"_asView ) == std::optional( true ) );
	QCOMPARE( v_testUnsigned.get(), 32u );
	QVERIFY( sfx::DeclaredConfigVar::setByName( "test_unsigned"_asView, "0"_asView ) == std::optional( false ) );
	QCOMPARE( v_testUnsigned.get(), 1u );
	QVERIFY( sfx::DeclaredConfigVar::setByName( "test_missing"_asView, "1"_asView ) == std::nullopt );

	bool foundInList = false;
	for( sfx::DeclaredConfigVar *var = sfx::DeclaredConfigVar::listHead(); var; var = var->next() ) {
		if( var == &v_testFloat ) {
			foundInList = true;
		}
	}
	QVERIFY( foundInList );
}

void ConfigVarsTest::test_modificationTracker() {
	sfx::VarModificationTracker tracker( &v_testFloat );
	// The initial value is reported as a modification
	QVERIFY( tracker.checkAndReset() );
	QVERIFY( !tracker.checkAndReset() );

	v_testFloat.set( 1.0f );
	QVERIFY( tracker.checkAndReset() );
	QVERIFY( !tracker.checkAndReset() );

	(void)v_testFloat.setFromText( "2"_asView );
	QVERIFY( tracker.checkAndReset() );
}

void ConfigVarsTest::test_valueText() {
	std::string buffer;
	v_testFloat.set( 0.25f );
	v_testFloat.getValueText( &buffer );
	QCOMPARE( buffer, std::string( "0.25" ) );

	buffer.clear();
	v_testFloat.getDefaultValueText( &buffer );
	QCOMPARE( buffer, std::string( "0.5" ) );

	buffer.clear();
	(void)v_testChannels.setFromText( "-1"_asView );
	v_testChannels.getValueText( &buffer );
	QCOMPARE( buffer, std::string( "-1" ) );

	buffer.clear();
	(void)v_testBool.setFromText( "0"_asView );
	v_testBool.getValueText( &buffer );
	QCOMPARE( buffer, std::string( "0" ) );
}
