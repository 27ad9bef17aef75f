module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

export module Topology:Properties;

import :Cells;

export namespace Topology
{
    namespace Internal
    {
        using TypeID = std::uintptr_t;

        template <typename T>
        struct TypeInfo
        {
            static TypeID ID()
            {
                // The address of this static variable is unique per type T
                static char s_ID;
                return reinterpret_cast<std::uintptr_t>(&s_ID);
            }
        };

        // One named payload column. Rows are registry slot indices.
        class ColumnBase
        {
        public:
            explicit ColumnBase(std::string name) : m_Name(std::move(name)) {}
            virtual ~ColumnBase() = default;

            ColumnBase(const ColumnBase&) = delete;
            ColumnBase& operator=(const ColumnBase&) = delete;

            [[nodiscard]] const std::string& Name() const noexcept { return m_Name; }

            [[nodiscard]] virtual std::unique_ptr<ColumnBase> Clone() const = 0;
            [[nodiscard]] virtual TypeID Type() const noexcept = 0;
            virtual void Resize(std::size_t rows) = 0;
            virtual void ResetRow(std::size_t row) = 0;

        private:
            std::string m_Name;
        };

        template <class T>
        class Column final : public ColumnBase
        {
        public:
            Column(std::string name, T defaultValue, std::size_t rows)
                : ColumnBase(std::move(name)), m_Rows(rows, defaultValue), m_Default(std::move(defaultValue))
            {
            }

            [[nodiscard]] std::unique_ptr<ColumnBase> Clone() const override
            {
                auto copy = std::make_unique<Column<T>>(Name(), m_Default, 0);
                copy->m_Rows = m_Rows;
                return copy;
            }

            [[nodiscard]] TypeID Type() const noexcept override { return TypeInfo<T>::ID(); }
            void Resize(std::size_t rows) override { m_Rows.resize(rows, m_Default); }

            void ResetRow(std::size_t row) override
            {
                assert(row < m_Rows.size());
                m_Rows[row] = m_Default;
            }

            [[nodiscard]] std::vector<T>& Rows() noexcept { return m_Rows; }
            [[nodiscard]] const T& DefaultValue() const noexcept { return m_Default; }

        private:
            std::vector<T> m_Rows;
            T m_Default;
        };
    } // namespace Internal

    // Payload column addressed by CellId. The id is not generation-checked
    // here; callers validate ids against the Complex before touching payloads.
    // A CellProperty stays usable for as long as its column exists in the set
    // it came from; copying the set copies the columns, not the handles.
    template <class T>
    class CellProperty
    {
    public:
        CellProperty() = default;

        [[nodiscard]] bool IsValid() const noexcept { return m_Column != nullptr; }
        explicit operator bool() const noexcept { return IsValid(); }

        [[nodiscard]] std::string_view Name() const
        {
            assert(m_Column != nullptr);
            return m_Column->Name();
        }

        [[nodiscard]] decltype(auto) operator[](CellId id) const
        {
            assert(m_Column != nullptr);
            assert(id.Index < m_Column->Rows().size());
            return m_Column->Rows()[id.Index];
        }

        [[nodiscard]] std::vector<T>& Vector() const
        {
            assert(m_Column != nullptr);
            return m_Column->Rows();
        }

        [[nodiscard]] const T& DefaultValue() const
        {
            assert(m_Column != nullptr);
            return m_Column->DefaultValue();
        }

        void Reset() noexcept { m_Column = nullptr; }

    private:
        friend class PropertySet;

        explicit CellProperty(Internal::Column<T>* column) : m_Column(column) {}

        Internal::Column<T>* m_Column{nullptr};
    };

    // Named, typed per-cell columns owned by a CellRegistry. Every column has
    // exactly Size() rows, one per registry slot; rows of destroyed cells keep
    // their value until the slot is reused, at which point they are reset to
    // the column default.
    class PropertySet
    {
    public:
        PropertySet() = default;
        ~PropertySet() = default;

        PropertySet(const PropertySet& other);
        PropertySet& operator=(const PropertySet& other);
        PropertySet(PropertySet&&) noexcept = default;
        PropertySet& operator=(PropertySet&&) noexcept = default;

        [[nodiscard]] std::size_t Size() const noexcept { return m_Rows; }
        [[nodiscard]] bool Exists(std::string_view name) const { return Find(name) != nullptr; }
        [[nodiscard]] std::vector<std::string> Properties() const;

        void Resize(std::size_t rows);
        void Reset(std::size_t row);

        // Returns an invalid property if the name is already taken.
        template <class T>
        [[nodiscard]] CellProperty<T> Add(std::string name, T defaultValue = T());

        // Returns an invalid property if the name is missing or holds another type.
        template <class T>
        [[nodiscard]] CellProperty<T> Get(std::string_view name) const;

        template <class T>
        [[nodiscard]] CellProperty<T> GetOrAdd(std::string name, T defaultValue = T());

        // Drops the column and invalidates the given handle.
        template <class T>
        bool Remove(CellProperty<T>& property);

    private:
        [[nodiscard]] Internal::ColumnBase* Find(std::string_view name) const;
        bool Erase(const Internal::ColumnBase* column);

        std::vector<std::unique_ptr<Internal::ColumnBase>> m_Columns;
        std::size_t m_Rows{0};
    };

    template <class T>
    CellProperty<T> PropertySet::Add(std::string name, T defaultValue)
    {
        if (Exists(name)) return CellProperty<T>();

        auto column = std::make_unique<Internal::Column<T>>(std::move(name), std::move(defaultValue), m_Rows);
        auto* raw = column.get();
        m_Columns.push_back(std::move(column));
        return CellProperty<T>(raw);
    }

    template <class T>
    CellProperty<T> PropertySet::Get(std::string_view name) const
    {
        Internal::ColumnBase* column = Find(name);
        if (column == nullptr || column->Type() != Internal::TypeInfo<T>::ID()) return CellProperty<T>();
        return CellProperty<T>(static_cast<Internal::Column<T>*>(column));
    }

    template <class T>
    CellProperty<T> PropertySet::GetOrAdd(std::string name, T defaultValue)
    {
        if (Exists(name)) return Get<T>(name);
        return Add<T>(std::move(name), std::move(defaultValue));
    }

    template <class T>
    bool PropertySet::Remove(CellProperty<T>& property)
    {
        if (!property || !Erase(property.m_Column)) return false;
        property.Reset();
        return true;
    }
}
