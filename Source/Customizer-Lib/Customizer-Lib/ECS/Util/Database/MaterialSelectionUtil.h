#pragma once
#include "Customizer-Lib/Gameplay/Database/Customization.h"

#include <Base/Types.h>

#include <robinhood/robinhood.h>

#include <vector>

namespace ECS
{
    namespace Singletons
    {
        struct CustomizationSingleton;
    }
}

namespace ECSUtil::MaterialSelection
{
    // Picks the material of choiceID whose related choice is part of currentSelections, or the first material if none is
    bool GetTexture(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32 choiceID, const std::vector<u32>& currentSelections, Database::Customization::TextureSelection& textureSelection);

    // TextureType -> FileDataID for every selected choice that resolves to a texture
    bool GetTexturesForSelections(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, const std::vector<u32>& currentSelections, robin_hood::unordered_map<i32, u32>& textureTypeToFileDataID);
}
