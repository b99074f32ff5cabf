// kiln

#pragma once

#include <compare>
#include <cstdint>

namespace kiln {
    static constexpr struct
    {
        constexpr explicit operator uint32_t() const noexcept { return ~uint32_t{0u}; }
    } knInvalidIndex;

    // Typed position in a knArray. Comparing against knInvalidIndex tests for "not found".
    template <typename DerivedT>
    class knIndex
    {
    public:
        using underlying_type = uint32_t;

        constexpr explicit knIndex(underlying_type value) noexcept : value_(value) {}
        constexpr knIndex(decltype(knInvalidIndex)) noexcept : value_(invalid_value) {}

        constexpr underlying_type value() const noexcept { return value_; }
        constexpr explicit operator underlying_type() const noexcept { return value_; }

        constexpr std::strong_ordering operator<=>(knIndex const&) const noexcept = default;
        constexpr bool operator==(knIndex const&) const noexcept = default;

    private:
        static constexpr underlying_type invalid_value = ~underlying_type{0};

        underlying_type value_ = invalid_value;
    };
} // namespace kiln

// clang-format off
#define KN_DEFINE_INDEX(name) \
    class name final : public knIndex<class name> { public: using knIndex::knIndex; }
// clang-format on
