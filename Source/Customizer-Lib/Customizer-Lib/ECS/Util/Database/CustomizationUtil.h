#pragma once
#include "Customizer-Lib/Gameplay/Database/Customization.h"

#include <Base/Types.h>

#include <entt/fwd.hpp>

#include <vector>

namespace Database
{
    class TableLoader;
}

namespace ECS
{
    namespace Singletons
    {
        struct CustomizationSingleton;
    }
}

namespace ECSUtil::Customization
{
    // Builds a fresh catalog from the loader. On failure customizationSingleton is reset to an empty, unavailable catalog.
    bool Build(Database::TableLoader& loader, bool customizationEnabled, ECS::Singletons::CustomizationSingleton& customizationSingleton);

    // Rebuilds the catalog stored in the registry context, gated by the customizationEnabled CVar
    bool Refresh(entt::registry& registry, Database::TableLoader& loader);

    bool IsAvailable(const ECS::Singletons::CustomizationSingleton& customizationSingleton);
    bool IsCharacterModel(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID);

    bool GetChrModelID(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32& chrModelID);
    bool GetTextureLayoutID(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 chrModelID, u32& textureLayoutID);
    bool GetTextureLayoutIDForMesh(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32& textureLayoutID);

    bool GetOptions(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 chrModelID, std::vector<Database::Customization::OptionEntry>& options);
    bool GetChoices(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 optionID, std::vector<Database::Customization::ChoiceEntry>& choices);

    bool GetGeosetKey(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 choiceID, u32& geosetKey);
    bool GetGeosetsForSelections(const ECS::Singletons::CustomizationSingleton& customizationSingleton, const std::vector<u32>& selections, std::vector<u32>& geosetKeys);

    bool GetCreatureDisplays(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, std::vector<Database::Customization::CreatureDisplay>& displays);

    bool GetMaterial(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 materialID, Database::Customization::MaterialEntry& material);
    bool GetTextureTargetForMaterial(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 materialID, u32& textureTargetID);
    bool GetTextureLayer(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 textureLayoutID, u32 textureTargetID, Database::Customization::TextureLayer& textureLayer);
    bool GetFileDataID(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 materialResourcesID, u32& fileDataID);

    void ReportDiagnostic(const ECS::Singletons::CustomizationSingleton& customizationSingleton, const Database::Customization::Diagnostic& diagnostic);

    // Group and variant read as two digit, zero padded, concatenated decimal. (1, 5) -> 105, (12, 3) -> 1203
    u32 CreateGeosetKey(u8 geosetType, u8 geosetID);
    u32 CreateExtraGeosetKey(u8 geosetIndex, u8 geosetValue);
}
