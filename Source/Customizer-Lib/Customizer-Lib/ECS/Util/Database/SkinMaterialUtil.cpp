#include "SkinMaterialUtil.h"
#include "CustomizationUtil.h"

#include "Customizer-Lib/ECS/Singletons/Database/CustomizationSingleton.h"

#include <tracy/Tracy.hpp>

#include <map>
#include <utility>

namespace ECSUtil::SkinMaterial
{
    using namespace Database::Customization;

    bool GetSkinMaterials(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32 choiceID, std::vector<Database::Customization::SkinMaterial>& skinMaterials)
    {
        ZoneScoped;

        u32 textureLayoutID = 0;
        if (!ECSUtil::Customization::GetTextureLayoutIDForMesh(customizationSingleton, meshFileID, textureLayoutID))
            return false;

        auto elementsItr = customizationSingleton.choiceIDToMaterialElements.find(choiceID);
        if (elementsItr == customizationSingleton.choiceIDToMaterialElements.end() || elementsItr->second.empty())
            return false;

        static const std::map<i32, TextureSection> noSections;
        const std::map<i32, TextureSection>* textureSections = &noSections;

        auto sectionsItr = customizationSingleton.textureLayoutIDToSections.find(textureLayoutID);
        if (sectionsItr != customizationSingleton.textureLayoutIDToSections.end())
            textureSections = &sectionsItr->second;

        // A material writing to a layer replaces whatever an earlier material wrote to that layer
        std::map<i32, std::vector<Database::Customization::SkinMaterial>> layerToSkinMaterials;

        for (const ElementEntry& element : elementsItr->second)
        {
            MaterialEntry material;
            if (!ECSUtil::Customization::GetMaterial(customizationSingleton, element.materialID, material))
                continue;

            // Expected for some model and target combinations
            TextureLayer textureLayer;
            if (!ECSUtil::Customization::GetTextureLayer(customizationSingleton, textureLayoutID, material.textureTargetID, textureLayer))
            {
                ECSUtil::Customization::ReportDiagnostic(customizationSingleton, { DiagnosticType::MissingTextureLayer, choiceID, material.textureTargetID });
                continue;
            }

            u32 fileDataID = 0;
            if (!ECSUtil::Customization::GetFileDataID(customizationSingleton, material.materialResourcesID, fileDataID))
            {
                ECSUtil::Customization::ReportDiagnostic(customizationSingleton, { DiagnosticType::MissingTextureFile, choiceID, material.materialResourcesID });
                continue;
            }

            Database::Customization::SkinMaterial skinMaterial;
            skinMaterial.layer = textureLayer.layer;
            skinMaterial.textureType = textureLayer.textureType;
            skinMaterial.fileDataID = fileDataID;

            std::vector<Database::Customization::SkinMaterial> layerSkinMaterials;

            // The full atlas does not depend on sections, so layouts without any still emit it
            if (textureLayer.textureSectionTypeBitMask == FULL_ATLAS_SECTION_MASK)
            {
                skinMaterial.sectionType = FULL_ATLAS_SECTION_MASK;
                skinMaterial.x = 0;
                skinMaterial.y = 0;
                skinMaterial.width = FULL_ATLAS_WIDTH;
                skinMaterial.height = FULL_ATLAS_HEIGHT;

                layerSkinMaterials.push_back(skinMaterial);
            }
            else
            {
                u32 sectionMask = static_cast<u32>(textureLayer.textureSectionTypeBitMask);

                for (const auto& [sectionType, textureSection] : *textureSections)
                {
                    if (sectionType < 0 || sectionType > 31)
                        continue;

                    if ((sectionMask & (1u << static_cast<u32>(sectionType))) == 0)
                        continue;

                    skinMaterial.sectionType = sectionType;
                    skinMaterial.x = textureSection.x;
                    skinMaterial.y = textureSection.y;
                    skinMaterial.width = textureSection.width;
                    skinMaterial.height = textureSection.height;

                    layerSkinMaterials.push_back(skinMaterial);
                }
            }

            if (!layerSkinMaterials.empty())
                layerToSkinMaterials[textureLayer.layer] = std::move(layerSkinMaterials);
        }

        if (layerToSkinMaterials.empty())
            return false;

        skinMaterials.clear();

        for (const auto& [layer, layerSkinMaterials] : layerToSkinMaterials)
            skinMaterials.insert(skinMaterials.end(), layerSkinMaterials.begin(), layerSkinMaterials.end());

        return true;
    }
}
