#ifndef SFX_cd7b11ae_5535_404d_ab82_77751b429240_H
#define SFX_cd7b11ae_5535_404d_ab82_77751b429240_H

#include "../common/enumtokenmatcher.h"

#include <cstdint>

namespace sfx {

enum class ImpactKind : uint8_t {
	Bullet,
	Pellet,
	Footstep,
	Landing,
	Explosion,
	Melee,
};

class ImpactKindMatcher : public sfx::EnumTokenMatcher<ImpactKind, ImpactKindMatcher> {
public:
	ImpactKindMatcher() : sfx::EnumTokenMatcher<ImpactKind, ImpactKindMatcher>( {
		{ sfx::StringView( "Bullet" ), ImpactKind::Bullet },
		{ sfx::StringView( "Pellet" ), ImpactKind::Pellet },
		{ sfx::StringView( "Footstep" ), ImpactKind::Footstep },
		{ sfx::StringView( "Landing" ), ImpactKind::Landing },
		{ sfx::StringView( "Explosion" ), ImpactKind::Explosion },
		{ sfx::StringView( "Melee" ), ImpactKind::Melee },
	}) {}
};

[[nodiscard]]
inline auto getImpactKindName( ImpactKind kind ) -> sfx::StringView {
	return ImpactKindMatcher::instance().getName( kind ).value_or( sfx::StringView( "Unknown" ) );
}

}

#endif
