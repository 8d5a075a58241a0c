#ifndef SFX_078207e3_b707_4891_8be2_a1d772433792_H
#define SFX_078207e3_b707_4891_8be2_a1d772433792_H

#include <concepts>

#ifdef _MSC_VER
#define sfx_forceinline __forceinline
#define sfx_noinline __declspec( noinline )
#else
#define sfx_forceinline inline __attribute__( ( always_inline ) )
#define sfx_noinline __attribute__( ( noinline ) )
#endif

#ifdef min
#undef min
#endif

#ifdef max
#undef max
#endif

namespace sfx {

template <typename T>
[[nodiscard]]
constexpr sfx_forceinline auto min( const T &a, const T &b ) -> T {
	return a < b ? a : b;
}

template <typename T>
[[nodiscard]]
constexpr sfx_forceinline auto max( const T &a, const T &b ) -> T {
	return a < b ? b : a;
}

template <typename T>
[[nodiscard]]
constexpr sfx_forceinline auto clamp( const T &v, const T &lo, const T &hi ) -> T {
	return min( max( v, lo ), hi );
}

template <typename T>
[[nodiscard]]
constexpr sfx_forceinline auto square( const T &v ) -> T {
	return v * v;
}

template <std::integral T>
[[nodiscard]]
constexpr sfx_forceinline bool isPowerOf2( const T &v ) {
	return ( v & ( v - 1 ) ) == 0;
}

}

#endif
