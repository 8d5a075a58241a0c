#include "materialregistry.h"
#include "../common/outputmessages.h"
#include "../common/sfxexceptions.h"

namespace sfx {

MaterialRegistry::MaterialRegistry( std::span<const MaterialProfile> profiles, const MaterialProfile &defaultProfile )
	: m_table( buildTable( profiles, defaultProfile ) ) {}

void MaterialRegistry::reload( std::span<const MaterialProfile> profiles, const MaterialProfile &defaultProfile ) {
	std::shared_ptr<const Table> newTable = buildTable( profiles, defaultProfile );
	m_table.swap( newTable );
	surfNotice() << "Reloaded material profiles:" << (uint64_t)m_table->profilesForTextures.size() << "registered,"
		<< m_table->numRejectedProfiles << "rejected";
}

auto MaterialRegistry::buildTable( std::span<const MaterialProfile> profiles, const MaterialProfile &defaultProfile )
	-> std::shared_ptr<const Table> {
	if( const std::optional<std::string> problem = defaultProfile.validate( false ) ) {
		std::string message( "The default material profile " );
		message += defaultProfile.name;
		message += " is malformed: ";
		message += *problem;
		sfx::failWithInvalidArgument( message.data() );
	}

	auto table = std::make_shared<Table>();
	table->defaultProfile = std::addressof( defaultProfile );
	table->profilesForTextures.reserve( profiles.size() );

	for( const MaterialProfile &profile: profiles ) {
		if( const std::optional<std::string> problem = profile.validate() ) {
			surfError() << "Rejecting the material profile" << profile.name << ":" << unquoted( *problem );
			table->numRejectedProfiles++;
			continue;
		}
		const std::string_view key( profile.texture );
		const auto [it, inserted] = table->profilesForTextures.try_emplace( key, std::addressof( profile ) );
		if( !inserted ) {
			// Later entries win
			surfWarning() << "The material profile" << profile.name << "overrides" << it->second->name
				<< "for the texture" << profile.texture;
			it->second = std::addressof( profile );
		}
	}

	return table;
}

auto MaterialRegistry::resolve( const sfx::StringView &texture ) const -> const MaterialProfile * {
	const Table &table = *m_table;
	if( const auto it = table.profilesForTextures.find( texture.asStdView() ); it != table.profilesForTextures.end() ) {
		return it->second;
	}
	return nullptr;
}

auto MaterialRegistry::resolveOrDefault( const std::optional<sfx::StringView> &texture ) const -> const MaterialProfile & {
	if( texture ) {
		if( const MaterialProfile *profile = resolve( *texture ) ) {
			return *profile;
		}
	}
	return *m_table->defaultProfile;
}

}
