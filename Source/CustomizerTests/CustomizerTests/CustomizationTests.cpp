#include "CustomizerTests/TestTables.h"

#include <Base/CVarSystem/CVarSystem.h>
#include <Base/Types.h>

#include <Customizer-Lib/Database/MemoryTableLoader.h>
#include <Customizer-Lib/ECS/Singletons/Database/CustomizationSingleton.h>
#include <Customizer-Lib/ECS/Util/Database/CustomizationUtil.h>
#include <Customizer-Lib/ECS/Util/Database/MaterialSelectionUtil.h>
#include <Customizer-Lib/ECS/Util/Database/SkinMaterialUtil.h>

#include <entt/entt.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace Database::Customization;

namespace
{
    class FailingElementLoader : public Database::MemoryTableLoader
    {
    public:
        using Database::MemoryTableLoader::Load;

        bool Load(Database::Table<ChrCustomizationElement>& table) override
        {
            return false;
        }
    };

    ECS::Singletons::CustomizationSingleton BuildTestCatalog()
    {
        Database::MemoryTableLoader loader;
        TestTables::Fill(loader);

        ECS::Singletons::CustomizationSingleton customizationSingleton;
        REQUIRE(ECSUtil::Customization::Build(loader, true, customizationSingleton));
        return customizationSingleton;
    }

    // Restores the CVar when a section ends, including when a REQUIRE fails
    struct ScopedCVarValue
    {
    public:
        ScopedCVarValue(i32* cvar, i32 value) : _cvar(cvar), _previousValue(*cvar)
        {
            *_cvar = value;
        }

        ~ScopedCVarValue()
        {
            *_cvar = _previousValue;
        }

    private:
        i32* _cvar;
        i32 _previousValue;
    };
}

TEST_CASE("Character models resolve through display and model data", "[Customization]")
{
    ECS::Singletons::CustomizationSingleton customizationSingleton = BuildTestCatalog();

    REQUIRE(ECSUtil::Customization::IsAvailable(customizationSingleton));

    REQUIRE(ECSUtil::Customization::IsCharacterModel(customizationSingleton, TestTables::ChrModelMeshFileID));
    REQUIRE(ECSUtil::Customization::IsCharacterModel(customizationSingleton, TestTables::NoLayoutMeshFileID));
    REQUIRE_FALSE(ECSUtil::Customization::IsCharacterModel(customizationSingleton, TestTables::CreatureMeshFileID));

    u32 chrModelID = 0;
    REQUIRE(ECSUtil::Customization::GetChrModelID(customizationSingleton, TestTables::ChrModelMeshFileID, chrModelID));
    REQUIRE(chrModelID == 1);
    REQUIRE_FALSE(ECSUtil::Customization::GetChrModelID(customizationSingleton, 1234, chrModelID));

    u32 textureLayoutID = 0;
    REQUIRE(ECSUtil::Customization::GetTextureLayoutID(customizationSingleton, 1, textureLayoutID));
    REQUIRE(textureLayoutID == 10);

    // Layout 0 is no layout
    REQUIRE_FALSE(ECSUtil::Customization::GetTextureLayoutID(customizationSingleton, 2, textureLayoutID));
    REQUIRE_FALSE(ECSUtil::Customization::GetTextureLayoutIDForMesh(customizationSingleton, TestTables::NoLayoutMeshFileID, textureLayoutID));
}

TEST_CASE("Options and choices keep source order", "[Customization]")
{
    ECS::Singletons::CustomizationSingleton customizationSingleton = BuildTestCatalog();

    std::vector<OptionEntry> options;
    REQUIRE(ECSUtil::Customization::GetOptions(customizationSingleton, 1, options));
    REQUIRE(options.size() == 3);
    REQUIRE(options[0].id == TestTables::SkinColorOptionID);
    REQUIRE(options[0].name == "Skin Color");
    REQUIRE(options[1].id == TestTables::FaceOptionID);
    REQUIRE(options[2].id == TestTables::HairStyleOptionID);

    std::vector<ChoiceEntry> choices;
    REQUIRE(ECSUtil::Customization::GetChoices(customizationSingleton, TestTables::SkinColorOptionID, choices));
    REQUIRE(choices.size() == 4);
    REQUIRE(choices[0].id == TestTables::SkinChoiceID);
    REQUIRE(choices[1].id == TestTables::MissingLayerChoiceID);
    REQUIRE(choices[2].id == TestTables::PaleSkinChoiceID);
    REQUIRE(choices[3].id == TestTables::MissingFileChoiceID);

    SECTION("Unnamed choices get a label from their order index")
    {
        REQUIRE(choices[0].label == "Choice 0");
        REQUIRE(choices[1].label == "Dark");
        REQUIRE(choices[2].label == "Pale");
        REQUIRE(choices[3].label == "Choice 2");
    }

    SECTION("Options of unknown models are not indexed")
    {
        REQUIRE_FALSE(ECSUtil::Customization::GetOptions(customizationSingleton, 99, options));
        REQUIRE_FALSE(ECSUtil::Customization::GetChoices(customizationSingleton, TestTables::OrphanOptionID, choices));
    }
}

TEST_CASE("Building twice from the same tables gives the same catalog", "[Customization]")
{
    ECS::Singletons::CustomizationSingleton first = BuildTestCatalog();
    ECS::Singletons::CustomizationSingleton second = BuildTestCatalog();

    std::vector<ChoiceEntry> firstChoices;
    std::vector<ChoiceEntry> secondChoices;
    REQUIRE(ECSUtil::Customization::GetChoices(first, TestTables::FaceOptionID, firstChoices));
    REQUIRE(ECSUtil::Customization::GetChoices(second, TestTables::FaceOptionID, secondChoices));

    REQUIRE(firstChoices.size() == secondChoices.size());
    for (size_t i = 0; i < firstChoices.size(); i++)
    {
        REQUIRE(firstChoices[i].id == secondChoices[i].id);
        REQUIRE(firstChoices[i].label == secondChoices[i].label);
    }

    std::vector<SkinMaterial> firstSkinMaterials;
    std::vector<SkinMaterial> secondSkinMaterials;
    REQUIRE(ECSUtil::SkinMaterial::GetSkinMaterials(first, TestTables::ChrModelMeshFileID, TestTables::SkinChoiceID, firstSkinMaterials));
    REQUIRE(ECSUtil::SkinMaterial::GetSkinMaterials(second, TestTables::ChrModelMeshFileID, TestTables::SkinChoiceID, secondSkinMaterials));
    REQUIRE(firstSkinMaterials == secondSkinMaterials);
}

TEST_CASE("Geoset keys", "[Customization]")
{
    SECTION("Group and variant are concatenated as two digit numbers")
    {
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(1, 5) == 105);
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(12, 3) == 1203);
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(0, 0) == 0);
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(0, 7) == 7);
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(1, 123) == 1123);
    }

    SECTION("Largest group and variant")
    {
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(0, 255) == 255);
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(255, 99) == 25599);
        REQUIRE(ECSUtil::Customization::CreateGeosetKey(255, 255) == 255255);

        Database::MemoryTableLoader loader;
        TestTables::Fill(loader);
        TestTables::Add(loader, 60, ChrCustomizationGeoset{ .geosetType = 255, .geosetID = 255 });

        ECS::Singletons::CustomizationSingleton customizationSingleton;
        REQUIRE(ECSUtil::Customization::Build(loader, true, customizationSingleton));

        u32 geosetKey = 0;
        REQUIRE(ECSUtil::Customization::GetGeosetKey(customizationSingleton, TestTables::LongHairChoiceID, geosetKey));
        REQUIRE(geosetKey == 255255);
    }

    SECTION("Creature extra geosets reserve the hundreds for the index")
    {
        REQUIRE(ECSUtil::Customization::CreateExtraGeosetKey(0, 2) == 102);
        REQUIRE(ECSUtil::Customization::CreateExtraGeosetKey(3, 1) == 401);
        REQUIRE(ECSUtil::Customization::CreateExtraGeosetKey(11, 0) == 1200);
    }

    SECTION("Choices resolve to the key of their geoset")
    {
        ECS::Singletons::CustomizationSingleton customizationSingleton = BuildTestCatalog();

        u32 geosetKey = 0;
        REQUIRE(ECSUtil::Customization::GetGeosetKey(customizationSingleton, TestTables::LongHairChoiceID, geosetKey));
        REQUIRE(geosetKey == 105);

        REQUIRE(ECSUtil::Customization::GetGeosetKey(customizationSingleton, TestTables::ShortHairChoiceID, geosetKey));
        REQUIRE(geosetKey == 1203);

        geosetKey = 42;
        REQUIRE_FALSE(ECSUtil::Customization::GetGeosetKey(customizationSingleton, TestTables::SkinChoiceID, geosetKey));
        REQUIRE(geosetKey == 42);

        std::vector<u32> geosetKeys;
        REQUIRE(ECSUtil::Customization::GetGeosetsForSelections(customizationSingleton, { TestTables::ShortHairChoiceID, TestTables::SkinChoiceID, TestTables::LongHairChoiceID }, geosetKeys));
        REQUIRE(geosetKeys == std::vector<u32>{ 1203, 105 });
    }
}

TEST_CASE("Creature displays are grouped by mesh", "[Customization]")
{
    ECS::Singletons::CustomizationSingleton customizationSingleton = BuildTestCatalog();

    std::vector<CreatureDisplay> displays;
    REQUIRE(ECSUtil::Customization::GetCreatureDisplays(customizationSingleton, TestTables::CreatureMeshFileID, displays));
    REQUIRE(displays.size() == 2);

    REQUIRE(displays[0].id == 201);
    REQUIRE(displays[0].textureFileDataIDs == std::vector<u32>{ 3001, 3002 });
    REQUIRE(displays[0].hasExtraGeosets);
    REQUIRE(displays[0].extraGeosets == std::vector<u32>{ 102, 401 });

    REQUIRE(displays[1].id == 202);
    REQUIRE(displays[1].hasExtraGeosets);
    REQUIRE(displays[1].extraGeosets.empty());

    REQUIRE(ECSUtil::Customization::GetCreatureDisplays(customizationSingleton, TestTables::ChrModelMeshFileID, displays));
    REQUIRE(displays.size() == 1);
    REQUIRE(displays[0].id == 200);
    REQUIRE(displays[0].textureFileDataIDs.empty());
    REQUIRE_FALSE(displays[0].hasExtraGeosets);

    REQUIRE_FALSE(ECSUtil::Customization::GetCreatureDisplays(customizationSingleton, 1234, displays));
}

TEST_CASE("Creature displays of a shared mesh follow model row order", "[Customization]")
{
    Database::MemoryTableLoader loader;
    TestTables::Fill(loader);

    // Second model on the creature mesh, whose display row comes before a later display of the first model
    TestTables::Add(loader, 104, CreatureModelData{ .fileDataID = TestTables::CreatureMeshFileID, .creatureGeosetDataID = 0 });
    TestTables::Add(loader, 206, CreatureDisplayInfo{ .modelID = 104, .textureVariationFileDataIDs = { 3005, 0, 0, 0 } });
    TestTables::Add(loader, 207, CreatureDisplayInfo{ .modelID = 101, .textureVariationFileDataIDs = { 3006, 0, 0, 0 } });

    ECS::Singletons::CustomizationSingleton customizationSingleton;
    REQUIRE(ECSUtil::Customization::Build(loader, true, customizationSingleton));

    std::vector<CreatureDisplay> displays;
    REQUIRE(ECSUtil::Customization::GetCreatureDisplays(customizationSingleton, TestTables::CreatureMeshFileID, displays));
    REQUIRE(displays.size() == 4);

    REQUIRE(displays[0].id == 201);
    REQUIRE(displays[1].id == 202);
    REQUIRE(displays[2].id == 207);
    REQUIRE(displays[2].hasExtraGeosets);

    REQUIRE(displays[3].id == 206);
    REQUIRE(displays[3].modelID == 104);
    REQUIRE_FALSE(displays[3].hasExtraGeosets);
}

TEST_CASE("Materials and texture files", "[Customization]")
{
    ECS::Singletons::CustomizationSingleton customizationSingleton = BuildTestCatalog();

    u32 textureTargetID = 0;
    REQUIRE(ECSUtil::Customization::GetTextureTargetForMaterial(customizationSingleton, 13, textureTargetID));
    REQUIRE(textureTargetID == 3);
    REQUIRE_FALSE(ECSUtil::Customization::GetTextureTargetForMaterial(customizationSingleton, 999, textureTargetID));

    // Only the base usage type is indexed
    u32 fileDataID = 0;
    REQUIRE(ECSUtil::Customization::GetFileDataID(customizationSingleton, 500, fileDataID));
    REQUIRE(fileDataID == 8000);
    REQUIRE_FALSE(ECSUtil::Customization::GetFileDataID(customizationSingleton, 599, fileDataID));

    // Layers are indexed by their first texture target
    TextureLayer textureLayer;
    REQUIRE(ECSUtil::Customization::GetTextureLayer(customizationSingleton, 10, 4, textureLayer));
    REQUIRE(textureLayer.textureSectionTypeBitMask == FULL_ATLAS_SECTION_MASK);
    REQUIRE_FALSE(ECSUtil::Customization::GetTextureLayer(customizationSingleton, 10, 5, textureLayer));
}

TEST_CASE("Disabled customization reports everything as unavailable", "[Customization]")
{
    Database::MemoryTableLoader loader;
    TestTables::Fill(loader);

    SECTION("Feature flag unset")
    {
        ECS::Singletons::CustomizationSingleton customizationSingleton;
        REQUIRE(ECSUtil::Customization::Build(loader, false, customizationSingleton));
        REQUIRE_FALSE(ECSUtil::Customization::IsAvailable(customizationSingleton));

        u32 value = 0;
        std::vector<OptionEntry> options;
        std::vector<ChoiceEntry> choices;
        std::vector<SkinMaterial> skinMaterials;
        TextureSelection textureSelection;

        REQUIRE_FALSE(ECSUtil::Customization::IsCharacterModel(customizationSingleton, TestTables::ChrModelMeshFileID));
        REQUIRE_FALSE(ECSUtil::Customization::GetChrModelID(customizationSingleton, TestTables::ChrModelMeshFileID, value));
        REQUIRE_FALSE(ECSUtil::Customization::GetTextureLayoutID(customizationSingleton, 1, value));
        REQUIRE_FALSE(ECSUtil::Customization::GetOptions(customizationSingleton, 1, options));
        REQUIRE_FALSE(ECSUtil::Customization::GetChoices(customizationSingleton, TestTables::SkinColorOptionID, choices));
        REQUIRE_FALSE(ECSUtil::Customization::GetGeosetKey(customizationSingleton, TestTables::LongHairChoiceID, value));
        REQUIRE_FALSE(ECSUtil::SkinMaterial::GetSkinMaterials(customizationSingleton, TestTables::ChrModelMeshFileID, TestTables::SkinChoiceID, skinMaterials));
        REQUIRE_FALSE(ECSUtil::MaterialSelection::GetTexture(customizationSingleton, TestTables::ChrModelMeshFileID, TestTables::SkinChoiceID, {}, textureSelection));

        // Creature skins do not depend on customization
        std::vector<CreatureDisplay> displays;
        REQUIRE(ECSUtil::Customization::GetCreatureDisplays(customizationSingleton, TestTables::CreatureMeshFileID, displays));
    }

    SECTION("Customization tables missing from the data")
    {
        loader.Unregister<ChrModel>();

        ECS::Singletons::CustomizationSingleton customizationSingleton;
        REQUIRE(ECSUtil::Customization::Build(loader, true, customizationSingleton));
        REQUIRE_FALSE(ECSUtil::Customization::IsAvailable(customizationSingleton));
        REQUIRE_FALSE(ECSUtil::Customization::IsCharacterModel(customizationSingleton, TestTables::ChrModelMeshFileID));
    }
}

TEST_CASE("A failed table load publishes no catalog", "[Customization]")
{
    ECS::Singletons::CustomizationSingleton customizationSingleton = BuildTestCatalog();
    REQUIRE(ECSUtil::Customization::IsAvailable(customizationSingleton));

    FailingElementLoader loader;
    TestTables::Fill(loader);

    REQUIRE_FALSE(ECSUtil::Customization::Build(loader, true, customizationSingleton));
    REQUIRE_FALSE(ECSUtil::Customization::IsAvailable(customizationSingleton));

    u32 chrModelID = 0;
    std::vector<CreatureDisplay> displays;
    REQUIRE_FALSE(ECSUtil::Customization::GetChrModelID(customizationSingleton, TestTables::ChrModelMeshFileID, chrModelID));
    REQUIRE_FALSE(ECSUtil::Customization::GetCreatureDisplays(customizationSingleton, TestTables::CreatureMeshFileID, displays));
}

TEST_CASE("Refresh stores the catalog in the registry context", "[Customization]")
{
    entt::registry registry;
    auto& ctx = registry.ctx();

    i32* customizationEnabled = CVarSystem::Get()->GetIntCVar(CVarCategory::Database, "customizationEnabled");
    REQUIRE(customizationEnabled != nullptr);

    SECTION("Enabled")
    {
        ScopedCVarValue enabled(customizationEnabled, 1);

        Database::MemoryTableLoader loader;
        TestTables::Fill(loader);

        REQUIRE(ECSUtil::Customization::Refresh(registry, loader));
        REQUIRE(ctx.contains<ECS::Singletons::CustomizationSingleton>());
        REQUIRE(ECSUtil::Customization::IsAvailable(ctx.get<ECS::Singletons::CustomizationSingleton>()));
    }

    SECTION("Disabled through the CVar")
    {
        ScopedCVarValue disabled(customizationEnabled, 0);

        Database::MemoryTableLoader loader;
        TestTables::Fill(loader);

        REQUIRE(ECSUtil::Customization::Refresh(registry, loader));
        REQUIRE(ctx.contains<ECS::Singletons::CustomizationSingleton>());
        REQUIRE_FALSE(ECSUtil::Customization::IsAvailable(ctx.get<ECS::Singletons::CustomizationSingleton>()));
    }

    SECTION("Failed load removes the previous catalog")
    {
        ScopedCVarValue enabled(customizationEnabled, 1);

        Database::MemoryTableLoader loader;
        TestTables::Fill(loader);
        REQUIRE(ECSUtil::Customization::Refresh(registry, loader));

        FailingElementLoader failingLoader;
        TestTables::Fill(failingLoader);

        REQUIRE_FALSE(ECSUtil::Customization::Refresh(registry, failingLoader));
        REQUIRE_FALSE(ctx.contains<ECS::Singletons::CustomizationSingleton>());
    }
}
