#pragma once
#include <Base/Types.h>

#include <robinhood/robinhood.h>

#include <string>
#include <utility>
#include <vector>

namespace Database
{
    // Ordered, keyed collection of typed rows for a single table. Rows keep the order they were added in.
    template <typename T>
    class Table
    {
    public:
        Table() { }

        static const std::string& GetName() { return T::Name; }
        static constexpr u32 GetNameHash() { return T::NameHash; }

        void Reserve(u32 numRows)
        {
            _rows.reserve(numRows);
            _idToIndex.reserve(numRows);
        }

        void Clear()
        {
            _rows.clear();
            _idToIndex.clear();
        }

        // Adds the row, or replaces it in place if the id already exists
        void Replace(u32 id, const T& row)
        {
            auto itr = _idToIndex.find(id);
            if (itr != _idToIndex.end())
            {
                _rows[itr->second].second = row;
                return;
            }

            u32 index = static_cast<u32>(_rows.size());
            _rows.emplace_back(id, row);
            _idToIndex[id] = index;
        }

        bool Has(u32 id) const
        {
            return _idToIndex.contains(id);
        }

        const T* TryGet(u32 id) const
        {
            auto itr = _idToIndex.find(id);
            if (itr == _idToIndex.end())
                return nullptr;

            return &_rows[itr->second].second;
        }

        u32 GetNumRows() const
        {
            return static_cast<u32>(_rows.size());
        }

        // Callback returns false to stop iterating
        template <typename Func>
        void Each(Func&& callback) const
        {
            for (const auto& [id, row] : _rows)
            {
                if (!callback(id, row))
                    break;
            }
        }

    private:
        std::vector<std::pair<u32, T>> _rows;
        robin_hood::unordered_map<u32, u32> _idToIndex;
    };
}
