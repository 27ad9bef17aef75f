module;
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <format>
#include <functional>
#include <ostream>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle template
    // -------------------------------------------------------------------------
    // Use this for references into slot-based storage that need to be validated.
    // The Tag type parameter ensures handles of different storage types
    // cannot be accidentally mixed up at compile time.
    //
    // A slot index is recycled only after its generation has been bumped, so a
    // handle kept across a destroy/create pair compares unequal to the new
    // occupant and is rejected by the owning storage.
    //
    // Example Usage:
    //   struct CellTag {};
    //   using CellId = Core::StrongHandle<CellTag>;
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        auto operator<=>(const StrongHandle&) const = default;
    };

    template <typename Tag>
    std::ostream& operator<<(std::ostream& os, const StrongHandle<Tag>& h)
    {
        if (!h.IsValid()) return os << "#invalid";
        return os << '#' << h.Index << '.' << h.Generation;
    }
}

// Allow StrongHandle to be used in unordered containers
namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            // Pack into 64-bit integer (assuming 32-bit index/gen)
            uint64_t val = (static_cast<uint64_t>(h.Generation) << 32) | h.Index;

            // MurmurHash3 Mix / WyHash Mix (Very fast, high avalanche)
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };

    // Lets log statements print handles directly: Log::Warn("cell {}", id).
    template <typename Tag>
    struct formatter<Core::StrongHandle<Tag>> : formatter<string_view>
    {
        auto format(const Core::StrongHandle<Tag>& h, format_context& ctx) const
        {
            if (!h.IsValid()) return format_to(ctx.out(), "#invalid");
            return format_to(ctx.out(), "#{}.{}", h.Index, h.Generation);
        }
    };
}
