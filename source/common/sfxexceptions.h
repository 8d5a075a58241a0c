#ifndef SFX_294d8cda_1248_4206_99b1_e3593a08e654_H
#define SFX_294d8cda_1248_4206_99b1_e3593a08e654_H

namespace sfx {

[[noreturn]]
void failWithBadAlloc( const char *message = nullptr );
[[noreturn]]
void failWithRuntimeError( const char *message = nullptr );
[[noreturn]]
void failWithInvalidArgument( const char *message = nullptr );

}

#endif
