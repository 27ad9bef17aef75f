module;

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

module Topology:Properties.Impl;

import :Properties;

namespace Topology
{
    PropertySet::PropertySet(const PropertySet& other) : m_Rows(other.m_Rows)
    {
        m_Columns.reserve(other.m_Columns.size());
        for (const auto& column : other.m_Columns) m_Columns.push_back(column->Clone());
    }

    PropertySet& PropertySet::operator=(const PropertySet& other)
    {
        if (this == &other) return *this;

        PropertySet copy(other);
        *this = std::move(copy);
        return *this;
    }

    std::vector<std::string> PropertySet::Properties() const
    {
        std::vector<std::string> names;
        names.reserve(m_Columns.size());
        for (const auto& column : m_Columns) names.push_back(column->Name());
        return names;
    }

    void PropertySet::Resize(std::size_t rows)
    {
        m_Rows = rows;
        for (auto& column : m_Columns) column->Resize(rows);
    }

    void PropertySet::Reset(std::size_t row)
    {
        for (auto& column : m_Columns) column->ResetRow(row);
    }

    Internal::ColumnBase* PropertySet::Find(std::string_view name) const
    {
        for (const auto& column : m_Columns)
            if (column->Name() == name) return column.get();
        return nullptr;
    }

    bool PropertySet::Erase(const Internal::ColumnBase* column)
    {
        auto it = std::find_if(m_Columns.begin(), m_Columns.end(),
                               [column](const auto& owned) { return owned.get() == column; });
        if (it == m_Columns.end()) return false;
        m_Columns.erase(it);
        return true;
    }
}
