#ifndef SFX_b2f21fcd_fab0_47f8_90e6_c132581df4d7_H
#define SFX_b2f21fcd_fab0_47f8_90e6_c132581df4d7_H

#include "materialprofile.h"

#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>

namespace sfx {

/// Maps textures to material profiles.
/// The registry does not own profiles. They must stay alive and unmodified while they are registered.
class MaterialRegistry {
public:
	/// Malformed profiles get rejected with an error message.
	/// @throws std::invalid_argument if the default profile is malformed
	MaterialRegistry( std::span<const MaterialProfile> profiles, const MaterialProfile &defaultProfile );

	/// Returns nullptr if the texture is not registered
	[[nodiscard]]
	auto resolve( const sfx::StringView &texture ) const -> const MaterialProfile *;

	/// Falls back to the default profile if the texture is absent or is not registered
	[[nodiscard]]
	auto resolveOrDefault( const std::optional<sfx::StringView> &texture ) const -> const MaterialProfile &;

	[[nodiscard]]
	auto getDefaultProfile() const -> const MaterialProfile & { return *m_table->defaultProfile; }

	[[nodiscard]]
	auto size() const -> size_t { return m_table->profilesForTextures.size(); }
	[[nodiscard]]
	auto getNumRejectedProfiles() const -> unsigned { return m_table->numRejectedProfiles; }

	/// Rebuilds the table and replaces the current one wholesale.
	/// The current table stays intact if building of the new one fails.
	void reload( std::span<const MaterialProfile> profiles, const MaterialProfile &defaultProfile );
private:
	struct Table {
		std::unordered_map<std::string_view, const MaterialProfile *> profilesForTextures;
		const MaterialProfile *defaultProfile { nullptr };
		unsigned numRejectedProfiles { 0 };
	};

	[[nodiscard]]
	static auto buildTable( std::span<const MaterialProfile> profiles, const MaterialProfile &defaultProfile )
		-> std::shared_ptr<const Table>;

	std::shared_ptr<const Table> m_table;
};

}

#endif
