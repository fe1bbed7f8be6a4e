#include "CustomizationUtil.h"

#include "Customizer-Lib/Database/Table.h"
#include "Customizer-Lib/Database/TableLoader.h"
#include "Customizer-Lib/ECS/Singletons/Database/CustomizationSingleton.h"

#include <Base/CVarSystem/CVarSystem.h>
#include <Base/Util/DebugHandler.h>

#include <entt/entt.hpp>
#include <tracy/Tracy.hpp>

#include <string>
#include <utility>

AutoCVar_Int CVAR_CustomizationEnabled(CVarCategory::Database, "customizationEnabled", "enables loading the character customization tables", 1, CVarFlags::EditCheckbox);

namespace ECSUtil::Customization
{
    using namespace Database::Customization;

    template <typename T>
    bool LoadTable(Database::TableLoader& loader, Database::Table<T>& table)
    {
        if (!loader.Load(table))
        {
            NC_LOG_ERROR("CustomizationUtil : Failed to load '{0}'", T::Name);
            return false;
        }

        return true;
    }

    void LogDiagnostic(const Diagnostic& diagnostic)
    {
        switch (diagnostic.type)
        {
            case DiagnosticType::FallbackMaterial:
            {
                NC_LOG_WARNING("CustomizationUtil : No material of choice {0} matches the current selections, falling back to material {1}", diagnostic.choiceID, diagnostic.value);
                break;
            }

            case DiagnosticType::MissingTextureLayer:
            {
                NC_LOG_WARNING("CustomizationUtil : TextureTarget {0} of choice {1} has no texture layer", diagnostic.value, diagnostic.choiceID);
                break;
            }

            case DiagnosticType::MissingTextureFile:
            {
                NC_LOG_WARNING("CustomizationUtil : MaterialResources {0} of choice {1} has no texture file", diagnostic.value, diagnostic.choiceID);
                break;
            }
        }
    }

    bool BuildCreatureDisplays(Database::TableLoader& loader, ECS::Singletons::CustomizationSingleton& customizationSingleton, Database::Table<CreatureDisplayInfo>& creatureDisplayInfoStorage, Database::Table<CreatureModelData>& creatureModelDataStorage)
    {
        ZoneScopedN("Customization::BuildCreatureDisplays");

        robin_hood::unordered_map<u32, std::vector<u32>> displayIDToExtraGeosets;
        if (loader.HasTable(TableHash::CreatureDisplayInfoGeosetData))
        {
            Database::Table<CreatureDisplayInfoGeosetData> geosetDataStorage;
            if (!LoadTable(loader, geosetDataStorage))
                return false;

            displayIDToExtraGeosets.reserve(geosetDataStorage.GetNumRows());
            geosetDataStorage.Each([&](u32 id, const CreatureDisplayInfoGeosetData& row)
            {
                displayIDToExtraGeosets[row.creatureDisplayInfoID].push_back(CreateExtraGeosetKey(row.geosetIndex, row.geosetValue));
                return true;
            });
        }

        if (loader.HasTable(TableHash::CreatureDisplayInfo))
        {
            if (!LoadTable(loader, creatureDisplayInfoStorage))
                return false;
        }

        if (loader.HasTable(TableHash::CreatureModelData))
        {
            if (!LoadTable(loader, creatureModelDataStorage))
                return false;
        }

        robin_hood::unordered_map<u32, std::vector<u32>> modelIDToDisplayIDs;
        modelIDToDisplayIDs.reserve(creatureModelDataStorage.GetNumRows());
        creatureDisplayInfoStorage.Each([&](u32 id, const CreatureDisplayInfo& row)
        {
            modelIDToDisplayIDs[row.modelID].push_back(id);
            return true;
        });

        // Grouped by model row first, so meshes shared by several models list each model's displays together
        customizationSingleton.meshFileIDToCreatureDisplays.reserve(creatureModelDataStorage.GetNumRows());
        creatureModelDataStorage.Each([&](u32 modelID, const CreatureModelData& creatureModelData)
        {
            auto displayItr = modelIDToDisplayIDs.find(modelID);
            if (displayItr == modelIDToDisplayIDs.end())
                return true;

            std::vector<CreatureDisplay>& displays = customizationSingleton.meshFileIDToCreatureDisplays[creatureModelData.fileDataID];

            for (u32 displayID : displayItr->second)
            {
                const CreatureDisplayInfo* creatureDisplayInfo = creatureDisplayInfoStorage.TryGet(displayID);

                CreatureDisplay& display = displays.emplace_back();
                display.id = displayID;
                display.modelID = modelID;

                for (u32 textureFileDataID : creatureDisplayInfo->textureVariationFileDataIDs)
                {
                    if (textureFileDataID > 0)
                        display.textureFileDataIDs.push_back(textureFileDataID);
                }

                if (creatureModelData.creatureGeosetDataID > 0)
                {
                    display.hasExtraGeosets = true;

                    auto geosetItr = displayIDToExtraGeosets.find(displayID);
                    if (geosetItr != displayIDToExtraGeosets.end())
                        display.extraGeosets = geosetItr->second;
                }
            }

            return true;
        });

        NC_LOG_INFO("CustomizationUtil : Loaded textures for {0} creatures", customizationSingleton.meshFileIDToCreatureDisplays.size());
        return true;
    }

    bool BuildTextureFileData(Database::TableLoader& loader, ECS::Singletons::CustomizationSingleton& customizationSingleton)
    {
        ZoneScopedN("Customization::BuildTextureFileData");

        if (!loader.HasTable(TableHash::TextureFileData))
            return true;

        Database::Table<TextureFileData> textureFileDataStorage;
        if (!LoadTable(loader, textureFileDataStorage))
            return false;

        customizationSingleton.materialResourcesIDToFileDataID.reserve(textureFileDataStorage.GetNumRows());
        textureFileDataStorage.Each([&](u32 id, const TextureFileData& row)
        {
            // TODO: Index other usage types once a caller needs more than the base texture
            if (row.usageType != 0)
                return true;

            customizationSingleton.materialResourcesIDToFileDataID[row.materialResourcesID] = id;
            return true;
        });

        return true;
    }

    bool BuildCharacterCustomization(Database::TableLoader& loader, ECS::Singletons::CustomizationSingleton& customizationSingleton, const Database::Table<CreatureDisplayInfo>& creatureDisplayInfoStorage, const Database::Table<CreatureModelData>& creatureModelDataStorage)
    {
        ZoneScopedN("Customization::BuildCharacterCustomization");

        Database::Table<ChrModel> chrModelStorage;
        Database::Table<ChrCustomizationOption> optionStorage;
        Database::Table<ChrCustomizationChoice> choiceStorage;
        Database::Table<ChrCustomizationMaterial> materialStorage;
        Database::Table<ChrCustomizationElement> elementStorage;
        Database::Table<ChrCustomizationGeoset> geosetStorage;
        Database::Table<ChrModelTextureLayer> textureLayerStorage;
        Database::Table<CharComponentTextureSection> textureSectionStorage;

        if (!LoadTable(loader, chrModelStorage) ||
            !LoadTable(loader, optionStorage) ||
            !LoadTable(loader, choiceStorage))
        {
            return false;
        }

        // Models
        {
            u32 numChrModelRows = chrModelStorage.GetNumRows();
            customizationSingleton.meshFileIDToChrModelID.reserve(numChrModelRows);
            customizationSingleton.chrModelIDToTextureLayoutID.reserve(numChrModelRows);

            chrModelStorage.Each([&](u32 chrModelID, const ChrModel& row)
            {
                if (row.charComponentTextureLayoutID != 0)
                    customizationSingleton.chrModelIDToTextureLayoutID[chrModelID] = row.charComponentTextureLayoutID;

                const CreatureDisplayInfo* creatureDisplayInfo = creatureDisplayInfoStorage.TryGet(row.displayID);
                if (!creatureDisplayInfo)
                    return true;

                const CreatureModelData* creatureModelData = creatureModelDataStorage.TryGet(creatureDisplayInfo->modelID);
                if (!creatureModelData)
                    return true;

                customizationSingleton.meshFileIDToChrModelID[creatureModelData->fileDataID] = chrModelID;
                return true;
            });
        }

        // Options and choices
        {
            robin_hood::unordered_map<u32, std::vector<ChoiceEntry>> optionIDToChoiceList;
            optionIDToChoiceList.reserve(optionStorage.GetNumRows());

            choiceStorage.Each([&](u32 choiceID, const ChrCustomizationChoice& row)
            {
                ChoiceEntry& choice = optionIDToChoiceList[row.chrCustomizationOptionID].emplace_back();
                choice.id = choiceID;

                // Not every choice has an authored name
                if (!row.name.empty())
                    choice.label = row.name;
                else
                    choice.label = "Choice " + std::to_string(row.orderIndex);

                return true;
            });

            customizationSingleton.optionIDToChoices.reserve(optionStorage.GetNumRows());
            optionStorage.Each([&](u32 optionID, const ChrCustomizationOption& row)
            {
                if (!chrModelStorage.Has(row.chrModelID))
                    return true;

                OptionEntry& option = customizationSingleton.chrModelIDToOptions[row.chrModelID].emplace_back();
                option.id = optionID;
                option.name = row.name;

                std::vector<ChoiceEntry>& choices = customizationSingleton.optionIDToChoices[optionID];

                auto itr = optionIDToChoiceList.find(optionID);
                if (itr != optionIDToChoiceList.end())
                    choices = std::move(itr->second);

                return true;
            });
        }

        if (!LoadTable(loader, materialStorage) ||
            !LoadTable(loader, elementStorage))
        {
            return false;
        }

        // Elements
        {
            u32 numElementRows = elementStorage.GetNumRows();
            customizationSingleton.choiceIDToGeosetID.reserve(numElementRows);
            customizationSingleton.choiceIDToMaterialElements.reserve(numElementRows);
            customizationSingleton.materialIDToMaterial.reserve(materialStorage.GetNumRows());

            elementStorage.Each([&](u32 elementID, const ChrCustomizationElement& row)
            {
                u32 choiceID = row.chrCustomizationChoiceID;

                if (row.chrCustomizationGeosetID != 0)
                    customizationSingleton.choiceIDToGeosetID[choiceID] = row.chrCustomizationGeosetID;

                if (row.chrCustomizationMaterialID != 0)
                {
                    ElementEntry& element = customizationSingleton.choiceIDToMaterialElements[choiceID].emplace_back();
                    element.elementID = elementID;
                    element.materialID = row.chrCustomizationMaterialID;
                    element.relatedChoiceID = row.relatedChrCustomizationChoiceID;

                    if (const ChrCustomizationMaterial* material = materialStorage.TryGet(row.chrCustomizationMaterialID))
                    {
                        MaterialEntry& materialEntry = customizationSingleton.materialIDToMaterial[row.chrCustomizationMaterialID];
                        materialEntry.textureTargetID = material->chrModelTextureTargetID;
                        materialEntry.materialResourcesID = material->materialResourcesID;
                    }
                }

                return true;
            });
        }

        if (!LoadTable(loader, geosetStorage))
            return false;

        // Geosets
        {
            customizationSingleton.geosetIDToGeosetKey.reserve(geosetStorage.GetNumRows());
            geosetStorage.Each([&](u32 geosetID, const ChrCustomizationGeoset& row)
            {
                customizationSingleton.geosetIDToGeosetKey[geosetID] = CreateGeosetKey(row.geosetType, row.geosetID);
                return true;
            });
        }

        if (!LoadTable(loader, textureLayerStorage))
            return false;

        // Texture layers, keyed by the first texture target only
        {
            u32 numLayersWithSecondTarget = 0;

            textureLayerStorage.Each([&](u32 id, const ChrModelTextureLayer& row)
            {
                if (row.charComponentTextureLayoutID == 0)
                    return true;

                i32 textureTargetID = row.chrModelTextureTargetID[0];
                i32 secondTextureTargetID = row.chrModelTextureTargetID[1];

                if (secondTextureTargetID != 0 && secondTextureTargetID != textureTargetID)
                    numLayersWithSecondTarget++;

                TextureLayer& textureLayer = customizationSingleton.textureLayoutIDToLayers[row.charComponentTextureLayoutID][static_cast<u32>(textureTargetID)];
                textureLayer.textureType = row.textureType;
                textureLayer.layer = row.layer;
                textureLayer.textureSectionTypeBitMask = row.textureSectionTypeBitMask;
                return true;
            });

            if (numLayersWithSecondTarget > 0)
            {
                NC_LOG_INFO("CustomizationUtil : {0} texture layers have a second texture target that is not indexed", numLayersWithSecondTarget);
            }
        }

        if (!LoadTable(loader, textureSectionStorage))
            return false;

        // Texture sections
        {
            textureSectionStorage.Each([&](u32 id, const CharComponentTextureSection& row)
            {
                if (row.charComponentTextureLayoutID == 0)
                    return true;

                TextureSection& textureSection = customizationSingleton.textureLayoutIDToSections[row.charComponentTextureLayoutID][row.sectionType];
                textureSection.sectionType = row.sectionType;
                textureSection.x = row.x;
                textureSection.y = row.y;
                textureSection.width = row.width;
                textureSection.height = row.height;
                return true;
            });
        }

        return true;
    }

    bool BuildCatalog(Database::TableLoader& loader, bool customizationEnabled, ECS::Singletons::CustomizationSingleton& customizationSingleton)
    {
        NC_LOG_INFO("CustomizationUtil : Loading creature textures...");

        Database::Table<CreatureDisplayInfo> creatureDisplayInfoStorage;
        Database::Table<CreatureModelData> creatureModelDataStorage;

        if (!BuildCreatureDisplays(loader, customizationSingleton, creatureDisplayInfoStorage, creatureModelDataStorage))
            return false;

        if (!BuildTextureFileData(loader, customizationSingleton))
            return false;

        // The customization tables do not exist in older data
        if (!customizationEnabled || !loader.HasTable(TableHash::ChrModel))
            return true;

        NC_LOG_INFO("CustomizationUtil : Loading character customization tables...");

        if (!BuildCharacterCustomization(loader, customizationSingleton, creatureDisplayInfoStorage, creatureModelDataStorage))
            return false;

        customizationSingleton.isCustomizationAvailable = true;
        NC_LOG_INFO("CustomizationUtil : Loaded character customization for {0} models", customizationSingleton.chrModelIDToOptions.size());
        return true;
    }

    bool Build(Database::TableLoader& loader, bool customizationEnabled, ECS::Singletons::CustomizationSingleton& customizationSingleton)
    {
        ZoneScopedN("Customization::Build");

        auto onDiagnostic = customizationSingleton.onDiagnostic;
        if (!onDiagnostic)
            onDiagnostic = &LogDiagnostic;

        ECS::Singletons::CustomizationSingleton result;
        result.onDiagnostic = onDiagnostic;

        if (!BuildCatalog(loader, customizationEnabled, result))
        {
            // Never publish a partially built catalog
            customizationSingleton = ECS::Singletons::CustomizationSingleton();
            customizationSingleton.onDiagnostic = onDiagnostic;
            return false;
        }

        customizationSingleton = std::move(result);
        return true;
    }

    bool Refresh(entt::registry& registry, Database::TableLoader& loader)
    {
        auto& ctx = registry.ctx();

        ECS::Singletons::CustomizationSingleton customizationSingleton;
        if (ctx.contains<ECS::Singletons::CustomizationSingleton>())
        {
            customizationSingleton.onDiagnostic = ctx.get<ECS::Singletons::CustomizationSingleton>().onDiagnostic;
            ctx.erase<ECS::Singletons::CustomizationSingleton>();
        }

        bool customizationEnabled = CVAR_CustomizationEnabled.Get() != 0;
        if (!Build(loader, customizationEnabled, customizationSingleton))
            return false;

        ctx.emplace<ECS::Singletons::CustomizationSingleton>(std::move(customizationSingleton));
        return true;
    }

    bool IsAvailable(const ECS::Singletons::CustomizationSingleton& customizationSingleton)
    {
        return customizationSingleton.isCustomizationAvailable;
    }

    bool IsCharacterModel(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        return customizationSingleton.meshFileIDToChrModelID.contains(meshFileID);
    }

    bool GetChrModelID(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32& chrModelID)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        auto itr = customizationSingleton.meshFileIDToChrModelID.find(meshFileID);
        if (itr == customizationSingleton.meshFileIDToChrModelID.end())
            return false;

        chrModelID = itr->second;
        return true;
    }

    bool GetTextureLayoutID(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 chrModelID, u32& textureLayoutID)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        auto itr = customizationSingleton.chrModelIDToTextureLayoutID.find(chrModelID);
        if (itr == customizationSingleton.chrModelIDToTextureLayoutID.end())
            return false;

        textureLayoutID = itr->second;
        return true;
    }

    bool GetTextureLayoutIDForMesh(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, u32& textureLayoutID)
    {
        u32 chrModelID = 0;
        if (!GetChrModelID(customizationSingleton, meshFileID, chrModelID))
            return false;

        return GetTextureLayoutID(customizationSingleton, chrModelID, textureLayoutID);
    }

    bool GetOptions(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 chrModelID, std::vector<OptionEntry>& options)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        auto itr = customizationSingleton.chrModelIDToOptions.find(chrModelID);
        if (itr == customizationSingleton.chrModelIDToOptions.end())
            return false;

        options = itr->second;
        return true;
    }

    bool GetChoices(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 optionID, std::vector<ChoiceEntry>& choices)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        auto itr = customizationSingleton.optionIDToChoices.find(optionID);
        if (itr == customizationSingleton.optionIDToChoices.end())
            return false;

        choices = itr->second;
        return true;
    }

    bool GetGeosetKey(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 choiceID, u32& geosetKey)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        auto choiceItr = customizationSingleton.choiceIDToGeosetID.find(choiceID);
        if (choiceItr == customizationSingleton.choiceIDToGeosetID.end())
            return false;

        auto geosetItr = customizationSingleton.geosetIDToGeosetKey.find(choiceItr->second);
        if (geosetItr == customizationSingleton.geosetIDToGeosetKey.end())
            return false;

        geosetKey = geosetItr->second;
        return true;
    }

    bool GetGeosetsForSelections(const ECS::Singletons::CustomizationSingleton& customizationSingleton, const std::vector<u32>& selections, std::vector<u32>& geosetKeys)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        geosetKeys.clear();

        for (u32 choiceID : selections)
        {
            u32 geosetKey = 0;
            if (GetGeosetKey(customizationSingleton, choiceID, geosetKey))
                geosetKeys.push_back(geosetKey);
        }

        return true;
    }

    bool GetCreatureDisplays(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 meshFileID, std::vector<CreatureDisplay>& displays)
    {
        auto itr = customizationSingleton.meshFileIDToCreatureDisplays.find(meshFileID);
        if (itr == customizationSingleton.meshFileIDToCreatureDisplays.end())
            return false;

        displays = itr->second;
        return true;
    }

    bool GetMaterial(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 materialID, MaterialEntry& material)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        auto itr = customizationSingleton.materialIDToMaterial.find(materialID);
        if (itr == customizationSingleton.materialIDToMaterial.end())
            return false;

        material = itr->second;
        return true;
    }

    bool GetTextureTargetForMaterial(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 materialID, u32& textureTargetID)
    {
        MaterialEntry material;
        if (!GetMaterial(customizationSingleton, materialID, material))
            return false;

        textureTargetID = material.textureTargetID;
        return true;
    }

    bool GetTextureLayer(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 textureLayoutID, u32 textureTargetID, TextureLayer& textureLayer)
    {
        if (!customizationSingleton.isCustomizationAvailable)
            return false;

        auto layoutItr = customizationSingleton.textureLayoutIDToLayers.find(textureLayoutID);
        if (layoutItr == customizationSingleton.textureLayoutIDToLayers.end())
            return false;

        auto layerItr = layoutItr->second.find(textureTargetID);
        if (layerItr == layoutItr->second.end())
            return false;

        textureLayer = layerItr->second;
        return true;
    }

    bool GetFileDataID(const ECS::Singletons::CustomizationSingleton& customizationSingleton, u32 materialResourcesID, u32& fileDataID)
    {
        auto itr = customizationSingleton.materialResourcesIDToFileDataID.find(materialResourcesID);
        if (itr == customizationSingleton.materialResourcesIDToFileDataID.end())
            return false;

        fileDataID = itr->second;
        return true;
    }

    void ReportDiagnostic(const ECS::Singletons::CustomizationSingleton& customizationSingleton, const Diagnostic& diagnostic)
    {
        if (customizationSingleton.onDiagnostic)
            customizationSingleton.onDiagnostic(diagnostic);
    }

    u32 CreateGeosetKey(u8 geosetType, u8 geosetID)
    {
        // Variants above 99 push the group further left instead of being truncated
        u32 multiplier = geosetID >= 100 ? 1000 : 100;
        return (static_cast<u32>(geosetType) * multiplier) + geosetID;
    }

    u32 CreateExtraGeosetKey(u8 geosetIndex, u8 geosetValue)
    {
        return ((geosetIndex + 1) * 100) + geosetValue;
    }
}
