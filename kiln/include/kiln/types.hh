// kiln

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>

namespace kiln {
    // identifies a node of a scene graph view; default-constructed ids are invalid
    class knNodeId final
    {
    public:
        constexpr knNodeId() noexcept = default;
        constexpr explicit knNodeId(uint32_t value) noexcept : value_(value) {}

        constexpr uint32_t value() const noexcept { return value_; }

        constexpr std::strong_ordering operator<=>(knNodeId const&) const noexcept = default;
        constexpr bool operator==(knNodeId const&) const noexcept = default;

    private:
        uint32_t value_ = ~uint32_t{0};
    };

    static constexpr knNodeId knInvalidNodeId{};

    struct knName
    {
        char const* name = nullptr;
        char const* nameEnd = nullptr;
    };

    template <typename T>
    struct knSpan
    {
        knSpan() noexcept = default;
        template <size_t N>
        knSpan(T (&arr)[N]) noexcept : items(arr), count(N)
        {
        }
        knSpan(T* start, T* end) noexcept : items(start), count(static_cast<uint32_t>(end - start)) {}
        knSpan(T* start, uint32_t size) noexcept : items(start), count(size) {}

        T* items = nullptr;
        uint32_t count = 0;

        T* begin() const noexcept { return items; }
        T* end() const noexcept { return items + count; }

        bool empty() const noexcept { return count == 0; }
        T& operator[](uint32_t index) const noexcept { return items[index]; }
    };

    struct knVector2
    {
        float x = 0.f;
        float y = 0.f;

        constexpr bool operator==(knVector2 const&) const noexcept = default;
    };

    struct knVector3
    {
        float x = 0.f;
        float y = 0.f;
        float z = 0.f;

        constexpr bool operator==(knVector3 const&) const noexcept = default;
    };

    struct knMatrix3x2
    {
        float m11 = 1.f;
        float m12 = 0.f;
        float m21 = 0.f;
        float m22 = 1.f;
        float m31 = 0.f;
        float m32 = 0.f;

        constexpr bool operator==(knMatrix3x2 const&) const noexcept = default;
    };

    struct knColor
    {
        uint8_t a = 0xff;
        uint8_t r = 0;
        uint8_t g = 0;
        uint8_t b = 0;

        constexpr bool operator==(knColor const&) const noexcept = default;
    };

    // 100ns ticks
    struct knTimeSpan
    {
        int64_t ticks = 0;

        constexpr bool operator==(knTimeSpan const&) const noexcept = default;
    };

    constexpr knTimeSpan knMilliseconds(int64_t ms) noexcept { return knTimeSpan{ms * 10'000}; }

    enum class knStrokeCap : uint8_t
    {
        Flat,
        Square,
        Round,
        Triangle,
    };

    enum class knStrokeLineJoin : uint8_t
    {
        Miter,
        Bevel,
        Round,
        MiterOrBevel,
    };

    enum class knGeometryCombine : uint8_t
    {
        Union,
        Exclude,
        Intersect,
        Xor,
    };

    enum class knFilledRegionDetermination : uint8_t
    {
        Alternate,
        Winding,
    };

    enum class knFigureLoop : uint8_t
    {
        Open,
        Closed,
    };
} // namespace kiln
