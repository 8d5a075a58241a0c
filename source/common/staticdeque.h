#ifndef SFX_71e90563_1c20_4409_b973_9a146d1b5a24_H
#define SFX_71e90563_1c20_4409_b973_9a146d1b5a24_H

#include <cassert>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace sfx {

/// A ring buffer with a fixed capacity and an in-place storage.
/// Supports appending at the back and removal at both ends.
template <typename T, size_t N>
class StaticDeque {
	static_assert( N > 0 );
	static_assert( std::is_trivially_destructible_v<T>, "Only trivially destructible types are supported" );

	alignas( T ) std::byte m_data[sizeof( T ) * N];
	unsigned m_head { 0 };
	unsigned m_size { 0 };

	[[nodiscard]]
	auto at( unsigned offset ) -> T * { return (T *)m_data + ( m_head + offset ) % N; }
	[[nodiscard]]
	auto at( unsigned offset ) const -> const T * { return (const T *)m_data + ( m_head + offset ) % N; }
public:
	class const_iterator {
		friend class StaticDeque;
		const StaticDeque *m_deque;
		unsigned m_offset;
		const_iterator( const StaticDeque *deque, unsigned offset ) : m_deque( deque ), m_offset( offset ) {}
	public:
		[[nodiscard]]
		auto operator*() const -> const T & { return *m_deque->at( m_offset ); }
		auto operator++() -> const_iterator & { m_offset++; return *this; }
		[[nodiscard]]
		bool operator==( const const_iterator &that ) const { return m_offset == that.m_offset; }
		[[nodiscard]]
		bool operator!=( const const_iterator &that ) const { return m_offset != that.m_offset; }
	};

	[[nodiscard]]
	auto size() const -> size_t { return m_size; }
	[[nodiscard]]
	bool empty() const { return !m_size; }
	[[nodiscard]]
	bool full() const { return m_size == N; }

	[[nodiscard]]
	auto begin() const -> const_iterator { return const_iterator( this, 0 ); }
	[[nodiscard]]
	auto end() const -> const_iterator { return const_iterator( this, m_size ); }

	[[nodiscard]]
	auto front() const -> const T & {
		assert( m_size );
		return *at( 0 );
	}
	[[nodiscard]]
	auto back() const -> const T & {
		assert( m_size );
		return *at( m_size - 1 );
	}

	template <typename... Args>
	auto emplace_back( Args &&...args ) -> T & {
		assert( !full() );
		T *const result = new( at( m_size ) )T( std::forward<Args>( args )... );
		m_size++;
		return *result;
	}

	void pop_front() {
		assert( m_size );
		m_head = ( m_head + 1 ) % N;
		m_size--;
	}

	void clear() {
		m_head = 0;
		m_size = 0;
	}
};

}

#endif
