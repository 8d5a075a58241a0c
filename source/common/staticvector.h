#ifndef SFX_a05b40f1_3524_4ef0_a701_37dcd60476d8_H
#define SFX_a05b40f1_3524_4ef0_a701_37dcd60476d8_H

#include <cassert>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace sfx {

/// A vector with a fixed capacity and an in-place storage
template <typename T, size_t N>
class StaticVector {
	static_assert( N > 0 );
	alignas( T ) std::byte m_data[sizeof( T ) * N];
	unsigned m_size { 0 };

	[[nodiscard]]
	auto ptr() -> T * { return (T *)m_data; }
	[[nodiscard]]
	auto ptr() const -> const T * { return (const T *)m_data; }
public:
	StaticVector() = default;
	StaticVector( const StaticVector & ) = delete;
	auto operator=( const StaticVector & ) -> StaticVector & = delete;

	~StaticVector() { clear(); }

	[[nodiscard]]
	auto size() const -> size_t { return m_size; }
	[[nodiscard]]
	static constexpr auto capacity() -> size_t { return N; }
	[[nodiscard]]
	bool empty() const { return !m_size; }
	[[nodiscard]]
	bool full() const { return m_size == N; }

	[[nodiscard]]
	auto begin() -> T * { return ptr(); }
	[[nodiscard]]
	auto end() -> T * { return ptr() + m_size; }
	[[nodiscard]]
	auto begin() const -> const T * { return ptr(); }
	[[nodiscard]]
	auto end() const -> const T * { return ptr() + m_size; }

	[[nodiscard]]
	auto operator[]( size_t index ) -> T & {
		assert( index < m_size );
		return ptr()[index];
	}
	[[nodiscard]]
	auto operator[]( size_t index ) const -> const T & {
		assert( index < m_size );
		return ptr()[index];
	}

	[[nodiscard]]
	auto back() -> T & {
		assert( m_size );
		return ptr()[m_size - 1];
	}

	/// Returns raw memory for a new element that must be constructed by the caller
	[[nodiscard]]
	auto unsafe_grow_back() -> void * {
		assert( !full() );
		return ptr() + m_size++;
	}

	template <typename... Args>
	auto emplace_back( Args &&...args ) -> T & {
		return *new( unsafe_grow_back() )T( std::forward<Args>( args )... );
	}

	void pop_back() {
		assert( m_size );
		m_size--;
		if constexpr( !std::is_trivially_destructible_v<T> ) {
			ptr()[m_size].~T();
		}
	}

	void clear() {
		if constexpr( !std::is_trivially_destructible_v<T> ) {
			for( T &value: *this ) {
				value.~T();
			}
		}
		m_size = 0;
	}
};

}

#endif
