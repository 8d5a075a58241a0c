#ifndef SFX_2ea57e19_a5a2_4fa8_9ff2_e26a6c8d450d_H
#define SFX_2ea57e19_a5a2_4fa8_9ff2_e26a6c8d450d_H

#include <bit>
#include <cassert>
#include <cstdint>
#include <limits>

namespace sfx {

/// An implementation of the JSF generator.
/// This implementation is derived from the code in public domain
/// http://burtleburtle.net/bob/rand/smallprng.html
class RandomGenerator {
	// Initialize just to suppress Clang-Tidy warnings
	uint32_t m_a { 0 }, m_b { 0 }, m_c { 0 }, m_d { 0 };

	// Maps the full range of 32-bit values to [0, 1)
	static constexpr double kUnitNormalizer = 1.0 / ( (double)std::numeric_limits<uint32_t>::max() + 1.0 );
public:
	[[nodiscard]]
	constexpr RandomGenerator() {
		setSeed( 17 );
	}

	[[nodiscard]]
	constexpr explicit RandomGenerator( uint32_t seed ) {
		setSeed( seed );
	}

	constexpr void setSeed( uint32_t seed ) {
		m_a = 0xF1EA5EED;
		m_b = m_c = m_d = seed;
		for( unsigned i = 0; i < 20; ++i ) {
			(void)next();
		}
	}

	[[nodiscard]]
	constexpr auto next() -> uint32_t {
		const uint32_t e = m_a - std::rotl( m_b, 27 );
		m_a = m_b ^ std::rotl( m_c, 17 );
		m_b = m_c + m_d;
		m_c = m_d + e;
		m_d = e + m_a;
		return m_d;
	}

	[[nodiscard]]
	constexpr auto nextBounded( unsigned range ) -> uint32_t {
		assert( range > 0 );
		// A public-domain implementation by D. Lemire.
		auto random32bit = (uint64_t)next();
		auto multiresult = (uint64_t)( random32bit * (uint64_t)range );
		auto leftover    = (uint32_t)multiresult;
		if( leftover < range ) {
			// Originally -range % range
			const uint32_t threshold = ( ~range + 1u ) % range;
			while( leftover < threshold ) {
				random32bit = next();
				multiresult = random32bit * range;
				leftover    = (uint32_t)multiresult;
			}
		}
		return (uint32_t)( multiresult >> 32 ); // [0, range)
	}

	/// Returns a value in [0, 1). The upper bound is never reached.
	[[nodiscard]]
	constexpr auto nextFloat() -> float {
		const auto result = (float)( kUnitNormalizer * (double)next() );
		// Rounding to float may yield exactly 1.0f for values close to the bound
		return result < 1.0f ? result : 0x1.fffffep-1f;
	}

	/// Returns a value in [min, max].
	[[nodiscard]]
	constexpr auto nextFloat( float min, float max ) -> float {
		assert( min <= max );
		const double doubleMin = min;
		const double doubleMax = max;
		return (float)( doubleMin + ( doubleMax - doubleMin ) * ( kUnitNormalizer * (double)next() ) );
	}

	[[nodiscard]]
	constexpr bool tryWithChance( float chance ) {
		assert( chance >= 0.0f && chance <= 1.0f );
		return nextFloat() < chance;
	}
};

}

#endif
