#ifndef SFX_71bfa566_cc10_4fc8_b90e_cf4061b8b7ab_H
#define SFX_71bfa566_cc10_4fc8_b90e_cf4061b8b7ab_H

#include <cassert>

namespace sfx {

// Helpers for intrusive doubly-linked lists of items that have "prev" and "next" members.

template <typename T>
inline auto link( T *item, T **listHead ) -> T * {
	item->next = *listHead;
	item->prev = nullptr;
	if( *listHead ) {
		( *listHead )->prev = item;
	}
	*listHead = item;
	return item;
}

template <typename T>
inline auto unlink( T *item, T **listHead ) -> T * {
	if( auto *next = item->next ) {
		next->prev = item->prev;
	}
	if( auto *prev = item->prev ) {
		prev->next = item->next;
	} else {
		assert( item == *listHead );
		*listHead = item->next;
	}
	item->prev = nullptr;
	item->next = nullptr;
	return item;
}

/// Links the item right after the existing list element {@code after}.
template <typename T>
inline auto linkAfter( T *item, T *after ) -> T * {
	assert( after && after != item );
	item->prev = after;
	item->next = after->next;
	if( after->next ) {
		after->next->prev = item;
	}
	after->next = item;
	return item;
}

}

#endif
