#pragma once
#include <Base/Types.h>
#include <Base/Util/StringUtils.h>

#include <array>
#include <string>
#include <vector>

namespace Database::Customization
{
    // Rows as produced by the table loader, one struct per table
    struct CreatureDisplayInfo
    {
    public:
        static inline const std::string Name = "CreatureDisplayInfo";
        static constexpr u32 NameHash = "CreatureDisplayInfo"_h;

        u32 modelID = 0;
        std::array<u32, 4> textureVariationFileDataIDs = { 0, 0, 0, 0 };
    };

    struct CreatureDisplayInfoGeosetData
    {
    public:
        static inline const std::string Name = "CreatureDisplayInfoGeosetData";
        static constexpr u32 NameHash = "CreatureDisplayInfoGeosetData"_h;

        u32 creatureDisplayInfoID = 0;
        u8 geosetIndex = 0;
        u8 geosetValue = 0;
    };

    struct CreatureModelData
    {
    public:
        static inline const std::string Name = "CreatureModelData";
        static constexpr u32 NameHash = "CreatureModelData"_h;

        u32 fileDataID = 0;
        u32 creatureGeosetDataID = 0;
    };

    struct ChrModel
    {
    public:
        static inline const std::string Name = "ChrModel";
        static constexpr u32 NameHash = "ChrModel"_h;

        u32 displayID = 0;
        u32 charComponentTextureLayoutID = 0;
    };

    struct ChrCustomizationOption
    {
    public:
        static inline const std::string Name = "ChrCustomizationOption";
        static constexpr u32 NameHash = "ChrCustomizationOption"_h;

        std::string name;
        u32 chrModelID = 0;
    };

    struct ChrCustomizationChoice
    {
    public:
        static inline const std::string Name = "ChrCustomizationChoice";
        static constexpr u32 NameHash = "ChrCustomizationChoice"_h;

        std::string name;
        u32 chrCustomizationOptionID = 0;
        i32 orderIndex = 0;
    };

    struct ChrCustomizationElement
    {
    public:
        static inline const std::string Name = "ChrCustomizationElement";
        static constexpr u32 NameHash = "ChrCustomizationElement"_h;

        u32 chrCustomizationChoiceID = 0;
        u32 relatedChrCustomizationChoiceID = 0;
        u32 chrCustomizationGeosetID = 0;
        u32 chrCustomizationMaterialID = 0;
    };

    struct ChrCustomizationMaterial
    {
    public:
        static inline const std::string Name = "ChrCustomizationMaterial";
        static constexpr u32 NameHash = "ChrCustomizationMaterial"_h;

        u32 chrModelTextureTargetID = 0;
        u32 materialResourcesID = 0;
    };

    struct ChrCustomizationGeoset
    {
    public:
        static inline const std::string Name = "ChrCustomizationGeoset";
        static constexpr u32 NameHash = "ChrCustomizationGeoset"_h;

        u8 geosetType = 0;
        u8 geosetID = 0;
    };

    struct ChrModelTextureLayer
    {
    public:
        static inline const std::string Name = "ChrModelTextureLayer";
        static constexpr u32 NameHash = "ChrModelTextureLayer"_h;

        i32 textureType = 0;
        i32 layer = 0;
        i32 flags = 0;
        i32 textureSectionTypeBitMask = 0;
        std::array<i32, 2> chrModelTextureTargetID = { 0, 0 };
        u32 charComponentTextureLayoutID = 0;
    };

    struct CharComponentTextureSection
    {
    public:
        static inline const std::string Name = "CharComponentTextureSections";
        static constexpr u32 NameHash = "CharComponentTextureSections"_h;

        u32 charComponentTextureLayoutID = 0;
        i32 sectionType = 0;
        i32 x = 0;
        i32 y = 0;
        i32 width = 0;
        i32 height = 0;
    };

    struct TextureFileData
    {
    public:
        static inline const std::string Name = "TextureFileData";
        static constexpr u32 NameHash = "TextureFileData"_h;

        u32 materialResourcesID = 0;
        u8 usageType = 0;
    };

    // Catalog entries
    struct CreatureDisplay
    {
    public:
        u32 id = 0;
        u32 modelID = 0;
        std::vector<u32> textureFileDataIDs;

        // Only meaningful when the model has creature geoset data
        bool hasExtraGeosets = false;
        std::vector<u32> extraGeosets;
    };

    struct OptionEntry
    {
    public:
        u32 id = 0;
        std::string name;
    };

    struct ChoiceEntry
    {
    public:
        u32 id = 0;
        std::string label;
    };

    struct ElementEntry
    {
    public:
        u32 elementID = 0;
        u32 materialID = 0;
        u32 relatedChoiceID = 0;
    };

    struct MaterialEntry
    {
    public:
        u32 textureTargetID = 0;
        u32 materialResourcesID = 0;
    };

    struct TextureLayer
    {
    public:
        i32 textureType = 0;
        i32 layer = 0;
        i32 textureSectionTypeBitMask = 0;
    };

    struct TextureSection
    {
    public:
        i32 sectionType = 0;
        i32 x = 0;
        i32 y = 0;
        i32 width = 0;
        i32 height = 0;
    };

    static constexpr i32 FULL_ATLAS_SECTION_MASK = -1;
    static constexpr i32 FULL_ATLAS_WIDTH = 1024;
    static constexpr i32 FULL_ATLAS_HEIGHT = 512;

    // Resolved output
    struct SkinMaterial
    {
    public:
        i32 layer = 0;
        i32 textureType = 0;
        u32 fileDataID = 0;

        // FULL_ATLAS_SECTION_MASK when the layer covers the whole atlas
        i32 sectionType = 0;
        i32 x = 0;
        i32 y = 0;
        i32 width = 0;
        i32 height = 0;

        bool operator==(const SkinMaterial& other) const = default;
    };

    struct TextureSelection
    {
    public:
        i32 textureType = 0;
        u32 fileDataID = 0;
        i32 textureSectionTypeBitMask = 0;

        u32 materialID = 0;
        bool isFallback = false;

        bool operator==(const TextureSelection& other) const = default;
    };

    enum class DiagnosticType : u8
    {
        FallbackMaterial = 0,
        MissingTextureLayer = 1,
        MissingTextureFile = 2
    };

    struct Diagnostic
    {
    public:
        DiagnosticType type = DiagnosticType::FallbackMaterial;
        u32 choiceID = 0;

        // MaterialID for FallbackMaterial, TextureTargetID for MissingTextureLayer, MaterialResourcesID for MissingTextureFile
        u32 value = 0;
    };
}
