#pragma once
#include "Customizer-Lib/Gameplay/Database/Customization.h"

#include <Base/Types.h>

#include <robinhood/robinhood.h>

#include <functional>
#include <map>
#include <vector>

namespace ECS
{
    namespace Singletons
    {
        struct CustomizationSingleton
        {
        public:
            CustomizationSingleton() {}

            bool isCustomizationAvailable = false;

            // Creature skins, built whenever the creature tables exist
            robin_hood::unordered_map<u32, std::vector<Database::Customization::CreatureDisplay>> meshFileIDToCreatureDisplays;
            robin_hood::unordered_map<u32, u32> materialResourcesIDToFileDataID;

            // Character customization, only built when customization is available
            robin_hood::unordered_map<u32, u32> meshFileIDToChrModelID;
            robin_hood::unordered_map<u32, u32> chrModelIDToTextureLayoutID;

            robin_hood::unordered_map<u32, std::vector<Database::Customization::OptionEntry>> chrModelIDToOptions;
            robin_hood::unordered_map<u32, std::vector<Database::Customization::ChoiceEntry>> optionIDToChoices;

            robin_hood::unordered_map<u32, u32> choiceIDToGeosetID;
            robin_hood::unordered_map<u32, u32> geosetIDToGeosetKey;

            robin_hood::unordered_map<u32, std::vector<Database::Customization::ElementEntry>> choiceIDToMaterialElements;
            robin_hood::unordered_map<u32, Database::Customization::MaterialEntry> materialIDToMaterial;

            // TextureLayoutID -> TextureTargetID -> Layer
            robin_hood::unordered_map<u32, robin_hood::unordered_map<u32, Database::Customization::TextureLayer>> textureLayoutIDToLayers;

            // TextureLayoutID -> SectionType -> Section, ordered by section type
            robin_hood::unordered_map<u32, std::map<i32, Database::Customization::TextureSection>> textureLayoutIDToSections;

            std::function<void(const Database::Customization::Diagnostic& diagnostic)> onDiagnostic;
        };
    }
}
