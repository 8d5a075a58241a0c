#include "outputmessages.h"
#include "enumtokenmatcher.h"
#include "configvars.h"
#include "freelistallocator.h"

#include <cstdio>
#include <memory>
#include <mutex>
#include <new>

using sfx::operator""_asView;

// We dislike the idea to add "null" values to the base enum definitions, as well as making them flags per se.
// Thus, we have to define the mapping from sequential values to flags manually.

enum class MessageDomainFlags : unsigned {
	None     = 0u,
	Common   = 1u << (unsigned)sfx::MessageDomain::Common,
	Surfaces = 1u << (unsigned)sfx::MessageDomain::Surfaces,
	Effects  = 1u << (unsigned)sfx::MessageDomain::Effects,
};

enum class MessageCategoryFlags : unsigned {
	None    = 0u,
	Debug   = 1u << (unsigned)sfx::MessageCategory::Debug,
	Notice  = 1u << (unsigned)sfx::MessageCategory::Notice,
	Warning = 1u << (unsigned)sfx::MessageCategory::Warning,
	Error   = 1u << (unsigned)sfx::MessageCategory::Error,
};

class DomainMatcher : public sfx::EnumTokenMatcher<MessageDomainFlags, DomainMatcher> {
public:
	DomainMatcher() : sfx::EnumTokenMatcher<MessageDomainFlags, DomainMatcher>( {
		{ "None"_asView, MessageDomainFlags::None },
		{ "COM"_asView, MessageDomainFlags::Common },
		{ "SURF"_asView, MessageDomainFlags::Surfaces },
		{ "FX"_asView, MessageDomainFlags::Effects },
	}) {}
};

class CategoryMatcher : public sfx::EnumTokenMatcher<MessageCategoryFlags, CategoryMatcher> {
public:
	CategoryMatcher() : sfx::EnumTokenMatcher<MessageCategoryFlags, CategoryMatcher>( {
		{ "None"_asView, MessageCategoryFlags::None },
		{ "Debug"_asView, MessageCategoryFlags::Debug },
		{ "Info"_asView, MessageCategoryFlags::Notice },
		{ "Warning"_asView, MessageCategoryFlags::Warning },
		{ "Error"_asView, MessageCategoryFlags::Error },
	}) {}
};

static sfx::EnumFlagsConfigVar<MessageDomainFlags, DomainMatcher> v_outputDomainMask( "sfx_outputDomainMask"_asView, {
	.byDefault = (MessageDomainFlags)~0u, .desc = "Domains of printed messages",
});

static sfx::EnumFlagsConfigVar<MessageCategoryFlags, CategoryMatcher> v_outputCategoryMask( "sfx_outputCategoryMask"_asView, {
	.byDefault = (MessageCategoryFlags)~0u, .desc = "Categories of printed messages",
});

static sfx::BoolConfigVar v_enableOutputDomainPrefix( "sfx_enableOutputDomainPrefix"_asView, {
	.byDefault = true, .desc = "Whether printed lines get prefixed by a tag of their domain",
});

static sfx::BoolConfigVar v_developer( "sfx_developer"_asView, {
	.byDefault = false, .desc = "Enables printing debug messages",
});

static const char *kPrintedPrefixForDomain[3] { "COM", "SURF", "FX" };
static const char *kPrintedPrefixForCategory[4] { "", "", "Warning: ", "Error: " };

class alignas( 16 ) MessageStreamsAllocator {
	std::mutex m_mutex;
	sfx::HeapBasedFreelistAllocator m_allocator;
	sfx::OutputMessageSink *m_sink { nullptr };

	static constexpr unsigned kMaxLineLength = 1024;
	static constexpr size_t kSize = kMaxLineLength + sizeof( sfx::OutputMessageStream );
	static constexpr size_t kCapacity = 64;

	static constexpr size_t kCategoryCount = std::size( kPrintedPrefixForCategory );
	static constexpr size_t kDomainCount = std::size( kPrintedPrefixForDomain );
	static constexpr size_t kNullStreamsCount = kCategoryCount * kDomainCount;

	alignas( sfx::OutputMessageStream ) uint8_t m_nullStreamsStorage[kNullStreamsCount * sizeof( sfx::OutputMessageStream )];

	[[nodiscard]]
	auto nullStreams() -> sfx::OutputMessageStream * {
		return (sfx::OutputMessageStream *)m_nullStreamsStorage;
	}
public:
	MessageStreamsAllocator() : m_allocator( kSize, kCapacity ) {
		for( unsigned domainIndex = 0; domainIndex < kDomainCount; ++domainIndex ) {
			const auto domain( (sfx::MessageDomain)( domainIndex ) );
			for( unsigned categoryIndex = 0; categoryIndex < kCategoryCount; ++categoryIndex ) {
				const auto category( (sfx::MessageCategory)( categoryIndex ) );
				void *mem = nullStreams() + domainIndex * kCategoryCount + categoryIndex;
				new( mem )sfx::OutputMessageStream( nullptr, 0, domain, category );
			}
		}
	}

	~MessageStreamsAllocator() {
		for( size_t i = 0; i < kNullStreamsCount; ++i ) {
			nullStreams()[i].~OutputMessageStream();
		}
	}

	[[nodiscard]]
	auto nullStreamFor( sfx::MessageDomain domain, sfx::MessageCategory category ) -> sfx::OutputMessageStream * {
		const auto indexForDomain   = (unsigned)domain;
		const auto indexForCategory = (unsigned)category;
		return nullStreams() + indexForDomain * kCategoryCount + indexForCategory;
	}

	[[nodiscard]]
	bool isANullStream( sfx::OutputMessageStream *stream ) {
		return (size_t)( stream - nullStreams() ) < kNullStreamsCount;
	}

	[[nodiscard]]
	auto alloc( sfx::MessageDomain domain, sfx::MessageCategory category ) -> sfx::OutputMessageStream * {
		[[maybe_unused]] std::lock_guard<std::mutex> lock( m_mutex );
		if( !m_allocator.isFull() ) [[likely]] {
			uint8_t *mem = m_allocator.allocOrNull();
			auto *buffer = (char *)( mem + sizeof( sfx::OutputMessageStream ) );
			return new( mem )sfx::OutputMessageStream( buffer, kMaxLineLength, domain, category );
		} else if( auto *mem = (uint8_t *)::malloc( kSize ) ) {
			auto *buffer = (char *)( mem + sizeof( sfx::OutputMessageStream ) );
			return new( mem )sfx::OutputMessageStream( buffer, kMaxLineLength, domain, category );
		} else {
			return nullStreamFor( domain, category );
		}
	}

	void free( sfx::OutputMessageStream *stream ) {
		if( !isANullStream( stream ) ) [[likely]] {
			[[maybe_unused]] std::lock_guard<std::mutex> lock( m_mutex );
			stream->~OutputMessageStream();
			if( m_allocator.mayOwn( stream ) ) [[likely]] {
				m_allocator.free( stream );
			} else {
				::free( stream );
			}
		}
	}

	[[nodiscard]]
	auto setSink( sfx::OutputMessageSink *sink ) -> sfx::OutputMessageSink * {
		[[maybe_unused]] std::lock_guard<std::mutex> lock( m_mutex );
		sfx::OutputMessageSink *oldSink = m_sink;
		m_sink = sink;
		return oldSink;
	}

	void print( sfx::MessageDomain domain, sfx::MessageCategory category, const char *data, unsigned length ) {
		[[maybe_unused]] std::lock_guard<std::mutex> lock( m_mutex );
		if( m_sink ) {
			m_sink->acceptMessage( domain, category, sfx::StringView( data, length, sfx::StringView::ZeroTerminated ) );
		} else {
			const char *categoryPrefix = kPrintedPrefixForCategory[(unsigned)category];
			if( v_enableOutputDomainPrefix.initialized() && v_enableOutputDomainPrefix.get() ) {
				const char *domainPrefix = kPrintedPrefixForDomain[(unsigned)domain];
				std::fprintf( stderr, "[%s] %s%s\n", domainPrefix, categoryPrefix, data );
			} else {
				std::fprintf( stderr, "%s%s\n", categoryPrefix, data );
			}
		}
	}
};

static MessageStreamsAllocator g_logLineStreamsAllocator;

[[nodiscard]]
static bool isMessageAcceptedByFilters( sfx::MessageDomain domain, sfx::MessageCategory category ) {
	if( v_outputDomainMask.initialized() ) [[likely]] {
		if( !v_outputDomainMask.isAnyBitSet( (MessageDomainFlags)( 1u << (unsigned)domain ) ) ) {
			return false;
		}
	}
	if( v_outputCategoryMask.initialized() ) [[likely]] {
		if( !v_outputCategoryMask.isAnyBitSet( (MessageCategoryFlags)( 1u << (unsigned)category ) ) ) {
			return false;
		}
	}
	// Debug messages are additionally controlled by the developer var
	if( category == sfx::MessageCategory::Debug ) {
		return v_developer.initialized() && v_developer.get();
	}
	return true;
}

auto sfx::createMessageStream( sfx::MessageDomain domain, sfx::MessageCategory category ) -> sfx::OutputMessageStream * {
	if( isMessageAcceptedByFilters( domain, category ) ) {
		return ::g_logLineStreamsAllocator.alloc( domain, category );
	}
	return ::g_logLineStreamsAllocator.nullStreamFor( domain, category );
}

void sfx::submitMessageStream( sfx::OutputMessageStream *stream ) {
	if( !::g_logLineStreamsAllocator.isANullStream( stream ) ) {
		const unsigned length = sfx::min( stream->m_limit - 1, stream->m_offset );
		stream->m_data[length] = '\0';
		::g_logLineStreamsAllocator.print( stream->m_domain, stream->m_category, stream->m_data, length );
	}
	::g_logLineStreamsAllocator.free( stream );
}

auto sfx::setOutputMessageSink( sfx::OutputMessageSink *sink ) -> sfx::OutputMessageSink * {
	return ::g_logLineStreamsAllocator.setSink( sink );
}
