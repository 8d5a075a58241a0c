#include "freelistallocatortest.h"
#include "../freelistallocator.h"

#include <cstdint>
#include <new>

static constexpr unsigned kCapacity = 32;

void FreelistAllocatorTest::initTestCase() {
	for( unsigned i = 0; i < kCapacity; ++i ) {
		if( i % 2 ) {
			QVariantList list;
			for( unsigned j = 0; j < kCapacity; ++j ) {
				list.append( QString::number( j ).repeated( j ) );
			}
			m_expectedVariants.append( QVariant( list ) );
		} else {
			m_expectedVariants.append( QString::number( i ) );
		}
	}
}

void FreelistAllocatorTest::runAllocatorTest( unsigned alignment ) {
	sfx::HeapBasedFreelistAllocator allocator( sizeof( QVariant ), kCapacity, alignment );
	QCOMPARE( allocator.capacity(), (unsigned)m_expectedVariants.size() );

	// Check whether it does not break after a full alloc/free cycle
	for( unsigned attemptNum = 0; attemptNum < 8; ++attemptNum ) {
		QVector<QVariant *> constructedVariants;
		for( unsigned i = 0; i < kCapacity; ++i ) {
			uint8_t *mem = allocator.allocOrNull();
			QVERIFY( mem );
			QVERIFY( !( (uintptr_t)mem % alignment ) );
			constructedVariants.push_back( new( mem )QVariant( m_expectedVariants[i] ) );
		}

		QVERIFY( allocator.isFull() );
		QCOMPARE( allocator.size(), kCapacity );
		QVERIFY( !allocator.allocOrNull() );

		for( unsigned i = 0; i < kCapacity; ++i ) {
			QCOMPARE( *constructedVariants[i], m_expectedVariants[i] );
		}

		// Alter the free() calls order (LIFO, FIFO)
		if( attemptNum % 2 ) {
			for( int i = 0; i < constructedVariants.size(); ++i ) {
				QVariant *variant = constructedVariants[i];
				variant->~QVariant();
				allocator.free( variant );
				// Make sure other items remain untouched
				for( int j = i + 1; j != constructedVariants.size(); ++j ) {
					QCOMPARE( *constructedVariants[j], m_expectedVariants[j] );
				}
			}
		} else {
			for( int i = constructedVariants.size() - 1; i >= 0; --i ) {
				QVariant *variant = constructedVariants[i];
				variant->~QVariant();
				allocator.free( variant );
				for( int j = 0; j < i; ++j ) {
					QCOMPARE( *constructedVariants[j], m_expectedVariants[j] );
				}
			}
		}

		QCOMPARE( allocator.size(), 0u );
		QVERIFY( !allocator.isFull() );
	}
}

void FreelistAllocatorTest::test_allocAndFree() {
	for( unsigned alignment: { 8, 16, 32, 64, 4096 } ) {
		runAllocatorTest( alignment );
	}
}

void FreelistAllocatorTest::test_singleChunk() {
	sfx::HeapBasedFreelistAllocator allocator( sizeof( uint64_t ), 1 );
	for( unsigned attemptNum = 0; attemptNum < 3; ++attemptNum ) {
		uint8_t *mem = allocator.allocOrNull();
		QVERIFY( mem );
		QVERIFY( allocator.isFull() );
		QVERIFY( !allocator.allocOrNull() );
		allocator.free( mem );
		QVERIFY( !allocator.isFull() );
	}
}

void FreelistAllocatorTest::test_ownership() {
	sfx::HeapBasedFreelistAllocator allocator( 48, 4 );
	uint8_t *mem = allocator.allocOrNull();
	QVERIFY( mem );
	QVERIFY( allocator.mayOwn( mem ) );

	uint64_t foreignValue = 0;
	QVERIFY( !allocator.mayOwn( &foreignValue ) );

	allocator.free( mem );
	QCOMPARE( allocator.size(), 0u );
}

void FreelistAllocatorTest::test_tinyChunks() {
	// Chunks that are smaller than a link to the next free chunk
	sfx::HeapBasedFreelistAllocator allocator( 1, 3, 1 );
	uint8_t *chunks[3];
	for( uint8_t *&chunk: chunks ) {
		chunk = allocator.allocOrNull();
		QVERIFY( chunk );
		*chunk = 0xFF;
	}
	QVERIFY( chunks[0] < chunks[1] && chunks[1] < chunks[2] );
	QVERIFY( (size_t)( chunks[1] - chunks[0] ) >= sizeof( void * ) );
	QVERIFY( !allocator.allocOrNull() );

	// The last freed chunk gets reused first
	allocator.free( chunks[0] );
	allocator.free( chunks[2] );
	QCOMPARE( allocator.allocOrNull(), chunks[2] );
	QCOMPARE( allocator.allocOrNull(), chunks[0] );
	QCOMPARE( *chunks[1], (uint8_t)0xFF );
}
