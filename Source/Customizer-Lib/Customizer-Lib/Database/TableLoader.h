#pragma once
#include "Customizer-Lib/Database/Table.h"
#include "Customizer-Lib/Gameplay/Database/Customization.h"

#include <Base/Types.h>
#include <Base/Util/StringUtils.h>

// This exist because without it, MSVC will complain about requiring a narrow conversion
constexpr u32 GetTableHash(u32 hash)
{
    return hash;
}

enum class TableHash : u32
{
    CreatureDisplayInfo                 = GetTableHash("CreatureDisplayInfo"_h),
    CreatureDisplayInfoGeosetData       = GetTableHash("CreatureDisplayInfoGeosetData"_h),
    CreatureModelData                   = GetTableHash("CreatureModelData"_h),
    ChrModel                            = GetTableHash("ChrModel"_h),
    ChrCustomizationOption              = GetTableHash("ChrCustomizationOption"_h),
    ChrCustomizationChoice              = GetTableHash("ChrCustomizationChoice"_h),
    ChrCustomizationElement             = GetTableHash("ChrCustomizationElement"_h),
    ChrCustomizationMaterial            = GetTableHash("ChrCustomizationMaterial"_h),
    ChrCustomizationGeoset              = GetTableHash("ChrCustomizationGeoset"_h),
    ChrModelTextureLayer                = GetTableHash("ChrModelTextureLayer"_h),
    CharComponentTextureSections        = GetTableHash("CharComponentTextureSections"_h),
    TextureFileData                     = GetTableHash("TextureFileData"_h)
};

namespace Database
{
    // Supplies decoded rows per table. Load returns false when the table could not be decoded.
    class TableLoader
    {
    public:
        virtual ~TableLoader() = default;

        virtual bool HasTable(TableHash hash) const = 0;

        virtual bool Load(Table<Customization::CreatureDisplayInfo>& table) = 0;
        virtual bool Load(Table<Customization::CreatureDisplayInfoGeosetData>& table) = 0;
        virtual bool Load(Table<Customization::CreatureModelData>& table) = 0;
        virtual bool Load(Table<Customization::ChrModel>& table) = 0;
        virtual bool Load(Table<Customization::ChrCustomizationOption>& table) = 0;
        virtual bool Load(Table<Customization::ChrCustomizationChoice>& table) = 0;
        virtual bool Load(Table<Customization::ChrCustomizationElement>& table) = 0;
        virtual bool Load(Table<Customization::ChrCustomizationMaterial>& table) = 0;
        virtual bool Load(Table<Customization::ChrCustomizationGeoset>& table) = 0;
        virtual bool Load(Table<Customization::ChrModelTextureLayer>& table) = 0;
        virtual bool Load(Table<Customization::CharComponentTextureSection>& table) = 0;
        virtual bool Load(Table<Customization::TextureFileData>& table) = 0;
    };
}
