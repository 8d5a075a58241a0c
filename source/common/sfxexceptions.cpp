#include "sfxexceptions.h"

#include <new>
#include <stdexcept>

namespace sfx {

[[noreturn]]
void failWithBadAlloc( const char * ) {
	throw std::bad_alloc();
}

[[noreturn]]
void failWithRuntimeError( const char *message ) {
	throw std::runtime_error( message ? message : "" );
}

[[noreturn]]
void failWithInvalidArgument( const char *message ) {
	throw std::invalid_argument( message ? message : "" );
}

}
