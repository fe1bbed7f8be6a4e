#include "MaterialSelectionUtil.h"
#include "CustomizationUtil.h"

#include "Customizer-Lib/ECS/Singletons/Database/CustomizationSingleton.h"

#include <tracy/Tracy.hpp>

namespace ECSUtil::MaterialSelection
{
    using namespace Database::Customization;

    bool SelectMaterial(const std::vector<ElementEntry>& elements, const std::vector<u32>& currentSelections, u32& materialID)
    {
        for (u32 selectedChoiceID : currentSelections)
        {
            if (selectedChoiceID == 0)
                continue;

            for (const ElementEntry& element : elements)
            {
                if (element.relatedChoiceID == selectedChoiceID)
                {
                    materialID = element.materialID;
                    return true;
                }
            }
        }

        return false;
    }

    bool GetTexture(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32 choiceID, const std::vector<u32>& currentSelections, TextureSelection& textureSelection)
    {
        ZoneScoped;

        if (!ECSUtil::Customization::IsAvailable(customizationSingleton))
            return false;

        auto elementsItr = customizationSingleton.choiceIDToMaterialElements.find(choiceID);
        if (elementsItr == customizationSingleton.choiceIDToMaterialElements.end() || elementsItr->second.empty())
            return false;

        const std::vector<ElementEntry>& elements = elementsItr->second;

        u32 materialID = 0;
        bool isFallback = false;

        if (!SelectMaterial(elements, currentSelections, materialID))
        {
            materialID = elements[0].materialID;
            isFallback = true;

            ECSUtil::Customization::ReportDiagnostic(customizationSingleton, { DiagnosticType::FallbackMaterial, choiceID, materialID });
        }

        MaterialEntry material;
        if (!ECSUtil::Customization::GetMaterial(customizationSingleton, materialID, material))
            return false;

        u32 textureLayoutID = 0;
        if (!ECSUtil::Customization::GetTextureLayoutIDForMesh(customizationSingleton, meshFileID, textureLayoutID))
            return false;

        TextureLayer textureLayer;
        if (!ECSUtil::Customization::GetTextureLayer(customizationSingleton, textureLayoutID, material.textureTargetID, textureLayer))
        {
            ECSUtil::Customization::ReportDiagnostic(customizationSingleton, { DiagnosticType::MissingTextureLayer, choiceID, material.textureTargetID });
            return false;
        }

        u32 fileDataID = 0;
        if (!ECSUtil::Customization::GetFileDataID(customizationSingleton, material.materialResourcesID, fileDataID))
        {
            ECSUtil::Customization::ReportDiagnostic(customizationSingleton, { DiagnosticType::MissingTextureFile, choiceID, material.materialResourcesID });
            return false;
        }

        textureSelection.textureType = textureLayer.textureType;
        textureSelection.fileDataID = fileDataID;
        textureSelection.textureSectionTypeBitMask = textureLayer.textureSectionTypeBitMask;
        textureSelection.materialID = materialID;
        textureSelection.isFallback = isFallback;
        return true;
    }

    bool GetTexturesForSelections(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, const std::vector<u32>& currentSelections, robin_hood::unordered_map<i32, u32>& textureTypeToFileDataID)
    {
        ZoneScoped;

        if (!ECSUtil::Customization::IsCharacterModel(customizationSingleton, meshFileID))
            return false;

        textureTypeToFileDataID.clear();

        for (u32 choiceID : currentSelections)
        {
            TextureSelection textureSelection;
            if (!GetTexture(customizationSingleton, meshFileID, choiceID, currentSelections, textureSelection))
                continue;

            textureTypeToFileDataID[textureSelection.textureType] = textureSelection.fileDataID;
        }

        return true;
    }
}
