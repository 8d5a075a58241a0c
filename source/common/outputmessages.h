#ifndef SFX_57151fe6_b5fb_4278_ae09_78dc35af5af8_H
#define SFX_57151fe6_b5fb_4278_ae09_78dc35af5af8_H

#include "textstreamwriter.h"
#include "sfxstringview.h"

#include <cassert>

class MessageStreamsAllocator;

namespace sfx {

enum class MessageDomain : uint8_t {
	Common,
	Surfaces,
	Effects,
};

enum class MessageCategory : uint8_t {
	Debug,
	Notice,
	Warning,
	Error,
};

class OutputMessageStream {
	friend auto createMessageStream( MessageDomain, MessageCategory ) -> OutputMessageStream *;
	friend void submitMessageStream( OutputMessageStream * );

	friend class ::MessageStreamsAllocator;
public:
	OutputMessageStream( char *data, unsigned limit, MessageDomain domain, MessageCategory category ) noexcept
		: m_data( data ), m_limit( limit ), m_domain( domain ), m_category( category ) {}

	[[nodiscard]]
	auto reserve( size_t size ) noexcept -> char * {
		return ( m_offset + size < m_limit ) ? m_data + m_offset : nullptr;
	}

	void advance( size_t size ) noexcept {
		m_offset += (unsigned)size;
		assert( m_offset <= m_limit );
	}
private:
	char *const m_data;
	const unsigned m_limit { 0 };
	unsigned m_offset { 0 };
	const MessageDomain m_domain;
	const MessageCategory m_category;
};

[[nodiscard]]
auto createMessageStream( MessageDomain, MessageCategory ) -> OutputMessageStream *;

void submitMessageStream( OutputMessageStream * );

/// Receives complete lines that have passed filters.
/// Calls are serialized by the library.
class OutputMessageSink {
public:
	virtual ~OutputMessageSink() = default;
	virtual void acceptMessage( MessageDomain domain, MessageCategory category, const sfx::StringView &line ) = 0;
};

/// Installs a sink for all further messages. Returns the previous one.
/// Passing nullptr restores the default output to stderr.
[[maybe_unused]]
auto setOutputMessageSink( OutputMessageSink *sink ) -> OutputMessageSink *;

class PendingOutputMessage {
public:
	explicit PendingOutputMessage( sfx::OutputMessageStream *stream ) : m_stream( stream ), m_writer( stream ) {}
	~PendingOutputMessage() { submitMessageStream( m_stream ); }

	[[nodiscard]]
	auto getWriter() -> TextStreamWriter & { return m_writer; }
private:
	sfx::OutputMessageStream *const m_stream;
	sfx::TextStreamWriter m_writer;
};

}

#define sfxMessage( domain, category ) \
	sfx::PendingOutputMessage( sfx::createMessageStream( sfx::MessageDomain::domain, sfx::MessageCategory::category ) ).getWriter()

#define comDebug()     sfxMessage( Common, Debug )
#define comNotice()    sfxMessage( Common, Notice )
#define comWarning()   sfxMessage( Common, Warning )
#define comError()     sfxMessage( Common, Error )

#define surfDebug()    sfxMessage( Surfaces, Debug )
#define surfNotice()   sfxMessage( Surfaces, Notice )
#define surfWarning()  sfxMessage( Surfaces, Warning )
#define surfError()    sfxMessage( Surfaces, Error )

#define fxDebug()      sfxMessage( Effects, Debug )
#define fxNotice()     sfxMessage( Effects, Notice )
#define fxWarning()    sfxMessage( Effects, Warning )
#define fxError()      sfxMessage( Effects, Error )

#endif
