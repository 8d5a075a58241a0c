#ifndef SFX_32fd1bc7_a9b3_45a5_a863_190e094d7815_H
#define SFX_32fd1bc7_a9b3_45a5_a863_190e094d7815_H

#include "sfxexceptions.h"

#include <cassert>
#include <cstdint>
#include <cstdlib>

#ifdef __SANITIZE_ADDRESS__
#include <sanitizer/asan_interface.h>
#define SFX_ASAN_LOCK( address, size ) ASAN_POISON_MEMORY_REGION( address, size )
#define SFX_ASAN_UNLOCK( address, size ) ASAN_UNPOISON_MEMORY_REGION( address, size )
#else
#define SFX_ASAN_LOCK( address, size ) (void)0
#define SFX_ASAN_UNLOCK( address, size ) (void)0
#endif

namespace sfx {

/// A fixed-capacity allocator of equally-sized chunks that are carved from a single heap block.
/// Free chunks form a LIFO list. The link to the next free chunk is stored in the chunk itself.
/// Free chunks are poisoned in ASan builds.
class HeapBasedFreelistAllocator {
	struct FreeChunk { FreeChunk *next; };

	void *m_mallocData { nullptr };
	uint8_t *m_basePtr { nullptr };
	FreeChunk *m_freeHead { nullptr };
	size_t m_stride { 0 };
	unsigned m_capacity { 0 };
	unsigned m_numAllocated { 0 };

	[[nodiscard]]
	static constexpr auto pad( uintptr_t value, uintptr_t alignment ) -> uintptr_t {
		return value + ( alignment - value % alignment ) % alignment;
	}
public:
	HeapBasedFreelistAllocator( unsigned chunkSize, unsigned capacity, unsigned alignment = 16u ) {
		assert( capacity );
		assert( alignment && !( alignment & ( alignment - 1 ) ) );
		const unsigned chunkAlignment = alignment >= alignof( FreeChunk ) ? alignment : (unsigned)alignof( FreeChunk );
		const size_t minStride        = chunkSize >= sizeof( FreeChunk ) ? chunkSize : sizeof( FreeChunk );

		m_stride   = pad( minStride, chunkAlignment );
		m_capacity = capacity;
		// Reserve extra bytes to be able to align the base pointer
		m_mallocData = std::malloc( m_stride * capacity + chunkAlignment - 1 );
		if( !m_mallocData ) {
			sfx::failWithBadAlloc();
		}
		m_basePtr = (uint8_t *)pad( (uintptr_t)m_mallocData, chunkAlignment );

		// Make chunks get allocated in the order of addresses
		for( unsigned i = capacity; i > 0; --i ) {
			auto *const chunk = (FreeChunk *)( m_basePtr + m_stride * ( i - 1 ) );
			chunk->next       = m_freeHead;
			m_freeHead        = chunk;
		}
		SFX_ASAN_LOCK( m_basePtr, m_stride * m_capacity );
	}

	~HeapBasedFreelistAllocator() {
		SFX_ASAN_UNLOCK( m_basePtr, m_stride * m_capacity );
		std::free( m_mallocData );
	}

	HeapBasedFreelistAllocator( const HeapBasedFreelistAllocator & ) = delete;
	auto operator=( const HeapBasedFreelistAllocator & ) -> HeapBasedFreelistAllocator & = delete;

	[[nodiscard]]
	auto allocOrNull() noexcept -> uint8_t * {
		FreeChunk *const chunk = m_freeHead;
		if( !chunk ) {
			return nullptr;
		}
		SFX_ASAN_UNLOCK( chunk, m_stride );
		m_freeHead = chunk->next;
		m_numAllocated++;
		return (uint8_t *)chunk;
	}

	void free( void *p ) noexcept {
		assert( mayOwn( p ) );
		assert( !( ( (const uint8_t *)p - m_basePtr ) % m_stride ) );
		assert( m_numAllocated > 0 );

		auto *const chunk = (FreeChunk *)p;
		chunk->next       = m_freeHead;
		m_freeHead        = chunk;
		m_numAllocated--;
		SFX_ASAN_LOCK( chunk, m_stride );
	}

	[[nodiscard]]
	bool isFull() const { return !m_freeHead; }

	[[nodiscard]]
	auto capacity() const -> unsigned { return m_capacity; }
	[[nodiscard]]
	auto size() const -> unsigned { return m_numAllocated; }

	[[nodiscard]]
	bool mayOwn( const void *p ) const {
		return (uintptr_t)( (const uint8_t *)p - m_basePtr ) < (uintptr_t)( m_stride * m_capacity );
	}
};

}

#endif
