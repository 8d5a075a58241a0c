#include "delayedactions.h"
#include "../common/links.h"
#include "../common/sfxexceptions.h"

#include <cstdlib>
#include <new>

namespace sfx {

DelayedActionScheduler::~DelayedActionScheduler() {
	ActionNode *nextNode = nullptr;
	for( ActionNode *node = m_nodesHead; node; node = nextNode ) {
		nextNode = node->next;
		unlinkAndFreeNode( node );
	}
}

auto DelayedActionScheduler::allocNode() -> ActionNode * {
	bool isHeapAllocated = false;
	void *mem = m_nodesAllocator.allocOrNull();
	if( !mem ) [[unlikely]] {
		// Scheduled actions never get dropped
		mem = std::malloc( sizeof( ActionNode ) );
		if( !mem ) {
			failWithBadAlloc();
		}
		isHeapAllocated = true;
	}
	return new( mem )ActionNode { .isHeapAllocated = isHeapAllocated };
}

void DelayedActionScheduler::unlinkAndFreeNode( ActionNode *node ) {
	if( node == m_nodesTail ) {
		m_nodesTail = node->prev;
	}
	sfx::unlink( node, &m_nodesHead );
	const bool isHeapAllocated = node->isHeapAllocated;
	node->~ActionNode();
	if( isHeapAllocated ) [[unlikely]] {
		std::free( node );
	} else {
		m_nodesAllocator.free( node );
	}
	m_numPendingActions--;
}

void DelayedActionScheduler::schedule( unsigned delayMillis, ActionFn fn, void *arg, uint64_t tag ) {
	ActionNode *const node = allocNode();
	node->triggerAt = m_lastTime + delayMillis;
	node->fn        = fn;
	node->arg       = arg;
	node->tag       = tag;

	// Find the last node that triggers not later than the new one
	ActionNode *insertAfter = m_nodesTail;
	while( insertAfter && insertAfter->triggerAt > node->triggerAt ) {
		insertAfter = insertAfter->prev;
	}

	if( insertAfter ) {
		sfx::linkAfter( node, insertAfter );
	} else {
		sfx::link( node, &m_nodesHead );
	}
	if( !node->next ) {
		m_nodesTail = node;
	}
	m_numPendingActions++;
}

void DelayedActionScheduler::runAndFreeHead() {
	ActionNode *const node = m_nodesHead;
	const ActionFn fn      = node->fn;
	void *const arg        = node->arg;
	const uint64_t tag     = node->tag;
	// The action may schedule other ones, so the node must be released first
	unlinkAndFreeNode( node );
	fn( arg, tag );
}

void DelayedActionScheduler::runDueActions( int64_t currTime ) {
	m_lastTime = currTime;
	while( m_nodesHead && m_nodesHead->triggerAt <= currTime ) {
		runAndFreeHead();
	}
}

void DelayedActionScheduler::clear() {
	while( m_nodesHead ) {
		runAndFreeHead();
	}
}

}
