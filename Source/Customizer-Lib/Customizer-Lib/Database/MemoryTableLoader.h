#pragma once
#include "Customizer-Lib/Database/TableLoader.h"

#include <Base/Types.h>

#include <robinhood/robinhood.h>

#include <tuple>

namespace Database
{
    // Serves tables that were decoded elsewhere and handed over in memory
    class MemoryTableLoader : public TableLoader
    {
    public:
        MemoryTableLoader() { }

        // Registers the table so HasTable reports it, and returns it for filling
        template <typename T>
        Table<T>& Register()
        {
            _registered.insert(static_cast<TableHash>(T::NameHash));
            return std::get<Table<T>>(_tables);
        }

        template <typename T>
        void Unregister()
        {
            _registered.erase(static_cast<TableHash>(T::NameHash));
            std::get<Table<T>>(_tables).Clear();
        }

        bool HasTable(TableHash hash) const override
        {
            return _registered.contains(hash);
        }

        bool Load(Table<Customization::CreatureDisplayInfo>& table) override { return Copy(table); }
        bool Load(Table<Customization::CreatureDisplayInfoGeosetData>& table) override { return Copy(table); }
        bool Load(Table<Customization::CreatureModelData>& table) override { return Copy(table); }
        bool Load(Table<Customization::ChrModel>& table) override { return Copy(table); }
        bool Load(Table<Customization::ChrCustomizationOption>& table) override { return Copy(table); }
        bool Load(Table<Customization::ChrCustomizationChoice>& table) override { return Copy(table); }
        bool Load(Table<Customization::ChrCustomizationElement>& table) override { return Copy(table); }
        bool Load(Table<Customization::ChrCustomizationMaterial>& table) override { return Copy(table); }
        bool Load(Table<Customization::ChrCustomizationGeoset>& table) override { return Copy(table); }
        bool Load(Table<Customization::ChrModelTextureLayer>& table) override { return Copy(table); }
        bool Load(Table<Customization::CharComponentTextureSection>& table) override { return Copy(table); }
        bool Load(Table<Customization::TextureFileData>& table) override { return Copy(table); }

    private:
        // Loading a table that was never registered is a failure, the same way a missing file would be
        template <typename T>
        bool Copy(Table<T>& table) const
        {
            if (!HasTable(static_cast<TableHash>(T::NameHash)))
                return false;

            table = std::get<Table<T>>(_tables);
            return true;
        }

    private:
        std::tuple<
            Table<Customization::CreatureDisplayInfo>,
            Table<Customization::CreatureDisplayInfoGeosetData>,
            Table<Customization::CreatureModelData>,
            Table<Customization::ChrModel>,
            Table<Customization::ChrCustomizationOption>,
            Table<Customization::ChrCustomizationChoice>,
            Table<Customization::ChrCustomizationElement>,
            Table<Customization::ChrCustomizationMaterial>,
            Table<Customization::ChrCustomizationGeoset>,
            Table<Customization::ChrModelTextureLayer>,
            Table<Customization::CharComponentTextureSection>,
            Table<Customization::TextureFileData>> _tables;

        robin_hood::unordered_set<TableHash> _registered;
    };
}
