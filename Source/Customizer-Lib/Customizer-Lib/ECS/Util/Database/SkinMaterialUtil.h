#pragma once
#include "Customizer-Lib/Gameplay/Database/Customization.h"

#include <Base/Types.h>

#include <vector>

namespace ECS
{
    namespace Singletons
    {
        struct CustomizationSingleton;
    }
}

namespace ECSUtil::SkinMaterial
{
    // Resolves every texture layer the choice paints into the model's skin atlas, sorted by layer
    bool GetSkinMaterials(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32 choiceID, std::vector<Database::Customization::SkinMaterial>& skinMaterials);
}
