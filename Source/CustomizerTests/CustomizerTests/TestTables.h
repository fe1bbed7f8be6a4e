#pragma once
#include <Customizer-Lib/Database/MemoryTableLoader.h>
#include <Customizer-Lib/Gameplay/Database/Customization.h>

#include <Base/Types.h>

#include <string>

namespace TestTables
{
    using namespace Database::Customization;

    // Character model 1 (mesh 5000) uses texture layout 10
    constexpr u32 ChrModelMeshFileID = 5000;
    // Creature mesh with two skins, not a character model
    constexpr u32 CreatureMeshFileID = 5001;
    // Character model 2 (mesh 5002) has no texture layout
    constexpr u32 NoLayoutMeshFileID = 5002;
    // Character model 3 (mesh 5003) uses texture layout 11, which has no sections
    constexpr u32 NoSectionsMeshFileID = 5003;

    constexpr u32 SkinColorOptionID = 20;
    constexpr u32 FaceOptionID = 21;
    constexpr u32 HairStyleOptionID = 22;
    constexpr u32 OrphanOptionID = 23;

    // Skin color choices, material 10 without a related choice
    constexpr u32 SkinChoiceID = 5;
    // Whole atlas material
    constexpr u32 PaleSkinChoiceID = 6;
    // Material without a texture file
    constexpr u32 MissingFileChoiceID = 7;
    // Material whose texture target has no layer
    constexpr u32 MissingLayerChoiceID = 9;

    // Face materials 11 (related 7) and 12 (related 9)
    constexpr u32 FaceChoiceID = 30;
    // Materials 11 and 17 both write layer 1
    constexpr u32 OverlappingFaceChoiceID = 31;
    constexpr u32 EmptyFaceChoiceID = 32;

    // Geoset 60 (1, 5) and material 13
    constexpr u32 LongHairChoiceID = 40;
    // Geoset 61 (12, 3) only
    constexpr u32 ShortHairChoiceID = 41;

    template <typename T>
    inline void Add(Database::MemoryTableLoader& loader, u32 id, const T& row)
    {
        loader.Register<T>().Replace(id, row);
    }

    inline CharComponentTextureSection Section(u32 layoutID, i32 sectionType, i32 x, i32 y, i32 width, i32 height)
    {
        CharComponentTextureSection section;
        section.charComponentTextureLayoutID = layoutID;
        section.sectionType = sectionType;
        section.x = x;
        section.y = y;
        section.width = width;
        section.height = height;
        return section;
    }

    inline ChrModelTextureLayer Layer(u32 layoutID, i32 textureTargetID, i32 secondTextureTargetID, i32 layer, i32 textureType, i32 sectionMask)
    {
        ChrModelTextureLayer textureLayer;
        textureLayer.charComponentTextureLayoutID = layoutID;
        textureLayer.chrModelTextureTargetID = { textureTargetID, secondTextureTargetID };
        textureLayer.layer = layer;
        textureLayer.textureType = textureType;
        textureLayer.textureSectionTypeBitMask = sectionMask;
        return textureLayer;
    }

    inline ChrCustomizationElement Element(u32 choiceID, u32 relatedChoiceID, u32 geosetID, u32 materialID)
    {
        ChrCustomizationElement element;
        element.chrCustomizationChoiceID = choiceID;
        element.relatedChrCustomizationChoiceID = relatedChoiceID;
        element.chrCustomizationGeosetID = geosetID;
        element.chrCustomizationMaterialID = materialID;
        return element;
    }

    inline ChrCustomizationChoice Choice(const std::string& name, u32 optionID, i32 orderIndex)
    {
        ChrCustomizationChoice choice;
        choice.name = name;
        choice.chrCustomizationOptionID = optionID;
        choice.orderIndex = orderIndex;
        return choice;
    }

    inline void Fill(Database::MemoryTableLoader& loader)
    {
        Add(loader, 100, CreatureModelData{ .fileDataID = ChrModelMeshFileID, .creatureGeosetDataID = 0 });
        Add(loader, 101, CreatureModelData{ .fileDataID = CreatureMeshFileID, .creatureGeosetDataID = 7 });
        Add(loader, 102, CreatureModelData{ .fileDataID = NoLayoutMeshFileID, .creatureGeosetDataID = 0 });
        Add(loader, 103, CreatureModelData{ .fileDataID = NoSectionsMeshFileID, .creatureGeosetDataID = 0 });

        Add(loader, 200, CreatureDisplayInfo{ .modelID = 100, .textureVariationFileDataIDs = { 0, 0, 0, 0 } });
        Add(loader, 201, CreatureDisplayInfo{ .modelID = 101, .textureVariationFileDataIDs = { 3001, 0, 3002, 0 } });
        Add(loader, 202, CreatureDisplayInfo{ .modelID = 101, .textureVariationFileDataIDs = { 3003, 0, 0, 0 } });
        Add(loader, 203, CreatureDisplayInfo{ .modelID = 102, .textureVariationFileDataIDs = { 0, 0, 0, 0 } });
        Add(loader, 204, CreatureDisplayInfo{ .modelID = 103, .textureVariationFileDataIDs = { 0, 0, 0, 0 } });
        Add(loader, 205, CreatureDisplayInfo{ .modelID = 999, .textureVariationFileDataIDs = { 3004, 0, 0, 0 } });

        Add(loader, 1, CreatureDisplayInfoGeosetData{ .creatureDisplayInfoID = 201, .geosetIndex = 0, .geosetValue = 2 });
        Add(loader, 2, CreatureDisplayInfoGeosetData{ .creatureDisplayInfoID = 201, .geosetIndex = 3, .geosetValue = 1 });

        Add(loader, 1, ChrModel{ .displayID = 200, .charComponentTextureLayoutID = 10 });
        Add(loader, 2, ChrModel{ .displayID = 203, .charComponentTextureLayoutID = 0 });
        Add(loader, 3, ChrModel{ .displayID = 204, .charComponentTextureLayoutID = 11 });

        Add(loader, SkinColorOptionID, ChrCustomizationOption{ .name = "Skin Color", .chrModelID = 1 });
        Add(loader, FaceOptionID, ChrCustomizationOption{ .name = "Face", .chrModelID = 1 });
        Add(loader, HairStyleOptionID, ChrCustomizationOption{ .name = "Hair Style", .chrModelID = 1 });
        Add(loader, OrphanOptionID, ChrCustomizationOption{ .name = "Orphan", .chrModelID = 99 });

        // Source order differs from order index on purpose
        Add(loader, SkinChoiceID, Choice("", SkinColorOptionID, 0));
        Add(loader, MissingLayerChoiceID, Choice("Dark", SkinColorOptionID, 3));
        Add(loader, PaleSkinChoiceID, Choice("Pale", SkinColorOptionID, 1));
        Add(loader, MissingFileChoiceID, Choice("", SkinColorOptionID, 2));
        Add(loader, FaceChoiceID, Choice("Face 1", FaceOptionID, 0));
        Add(loader, OverlappingFaceChoiceID, Choice("Face 2", FaceOptionID, 1));
        Add(loader, EmptyFaceChoiceID, Choice("Face 3", FaceOptionID, 2));
        Add(loader, LongHairChoiceID, Choice("Long", HairStyleOptionID, 0));
        Add(loader, ShortHairChoiceID, Choice("", HairStyleOptionID, 4));
        Add(loader, 50, Choice("Orphan Choice", OrphanOptionID, 0));

        Add(loader, 1000, Element(SkinChoiceID, 0, 0, 10));
        Add(loader, 1001, Element(FaceChoiceID, MissingFileChoiceID, 0, 11));
        Add(loader, 1002, Element(FaceChoiceID, MissingLayerChoiceID, 0, 12));
        Add(loader, 1003, Element(LongHairChoiceID, 0, 60, 0));
        Add(loader, 1004, Element(ShortHairChoiceID, 0, 61, 0));
        Add(loader, 1005, Element(LongHairChoiceID, 0, 0, 13));
        Add(loader, 1006, Element(PaleSkinChoiceID, 0, 0, 14));
        Add(loader, 1007, Element(MissingLayerChoiceID, 0, 0, 15));
        Add(loader, 1008, Element(MissingFileChoiceID, 0, 0, 16));
        Add(loader, 1009, Element(OverlappingFaceChoiceID, 0, 0, 11));
        Add(loader, 1010, Element(OverlappingFaceChoiceID, 0, 0, 17));

        Add(loader, 10, ChrCustomizationMaterial{ .chrModelTextureTargetID = 1, .materialResourcesID = 500 });
        Add(loader, 11, ChrCustomizationMaterial{ .chrModelTextureTargetID = 2, .materialResourcesID = 501 });
        Add(loader, 12, ChrCustomizationMaterial{ .chrModelTextureTargetID = 2, .materialResourcesID = 502 });
        Add(loader, 13, ChrCustomizationMaterial{ .chrModelTextureTargetID = 3, .materialResourcesID = 503 });
        Add(loader, 14, ChrCustomizationMaterial{ .chrModelTextureTargetID = 4, .materialResourcesID = 504 });
        Add(loader, 15, ChrCustomizationMaterial{ .chrModelTextureTargetID = 99, .materialResourcesID = 505 });
        Add(loader, 16, ChrCustomizationMaterial{ .chrModelTextureTargetID = 1, .materialResourcesID = 599 });
        Add(loader, 17, ChrCustomizationMaterial{ .chrModelTextureTargetID = 6, .materialResourcesID = 506 });

        Add(loader, 60, ChrCustomizationGeoset{ .geosetType = 1, .geosetID = 5 });
        Add(loader, 61, ChrCustomizationGeoset{ .geosetType = 12, .geosetID = 3 });

        Add(loader, 1, Layer(10, 1, 0, 0, 1, 0b101));
        Add(loader, 2, Layer(10, 2, 0, 1, 1, 0b100));
        Add(loader, 3, Layer(10, 3, 0, 2, 6, 0b011));
        Add(loader, 4, Layer(10, 4, 5, 3, 1, -1));
        Add(loader, 5, Layer(10, 6, 0, 1, 1, 0b1000));
        Add(loader, 6, Layer(11, 4, 0, 3, 1, -1));

        Add(loader, 1, Section(10, 0, 0, 0, 512, 512));
        Add(loader, 2, Section(10, 2, 512, 0, 512, 256));
        Add(loader, 3, Section(10, 3, 512, 256, 256, 128));

        Add(loader, 8000, TextureFileData{ .materialResourcesID = 500, .usageType = 0 });
        Add(loader, 8100, TextureFileData{ .materialResourcesID = 500, .usageType = 1 });
        Add(loader, 8001, TextureFileData{ .materialResourcesID = 501, .usageType = 0 });
        Add(loader, 8002, TextureFileData{ .materialResourcesID = 502, .usageType = 0 });
        Add(loader, 8003, TextureFileData{ .materialResourcesID = 503, .usageType = 0 });
        Add(loader, 8004, TextureFileData{ .materialResourcesID = 504, .usageType = 0 });
        Add(loader, 8005, TextureFileData{ .materialResourcesID = 505, .usageType = 0 });
        Add(loader, 8006, TextureFileData{ .materialResourcesID = 506, .usageType = 0 });
    }
}
