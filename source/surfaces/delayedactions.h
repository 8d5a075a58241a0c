#ifndef SFX_b9fa9649_2704_4f58_927d_ab7c1df4bd47_H
#define SFX_b9fa9649_2704_4f58_927d_ab7c1df4bd47_H

#include "../common/freelistallocator.h"

#include <cstdint>

namespace sfx {

/// A time-ordered queue of deferred actions driven by the host frame time.
class DelayedActionScheduler {
public:
	using ActionFn = void (*)( void *arg, uint64_t tag );

	DelayedActionScheduler() = default;
	// Pending actions get discarded
	~DelayedActionScheduler();

	DelayedActionScheduler( const DelayedActionScheduler & ) = delete;
	auto operator=( const DelayedActionScheduler & ) -> DelayedActionScheduler & = delete;

	/// Schedules the action to run once the frame time reaches the last drain time plus the delay.
	void schedule( unsigned delayMillis, ActionFn fn, void *arg, uint64_t tag = 0 );

	/// Runs due actions in the order of their trigger time. Actions with the same trigger time run in scheduling order.
	void runDueActions( int64_t currTime );

	/// Runs all pending actions regardless of their trigger time.
	void clear();

	[[nodiscard]]
	auto size() const -> unsigned { return m_numPendingActions; }
	[[nodiscard]]
	auto getLastTime() const -> int64_t { return m_lastTime; }
private:
	struct ActionNode {
		ActionNode *prev { nullptr }, *next { nullptr };
		int64_t triggerAt { 0 };
		ActionFn fn { nullptr };
		void *arg { nullptr };
		uint64_t tag { 0 };
		bool isHeapAllocated { false };
	};

	[[nodiscard]]
	auto allocNode() -> ActionNode *;
	void unlinkAndFreeNode( ActionNode *node );
	void runAndFreeHead();

	HeapBasedFreelistAllocator m_nodesAllocator { sizeof( ActionNode ), 64 };

	// Sorted by the trigger time
	ActionNode *m_nodesHead { nullptr };
	ActionNode *m_nodesTail { nullptr };
	unsigned m_numPendingActions { 0 };

	int64_t m_lastTime { 0 };
};

}

#endif
