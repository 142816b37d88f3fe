#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace dragkit
{

// Hash used to derive identities from payload values. Specialize for
// caller types that have no std::hash.
template <typename T>
struct KeyHash
{
    uint64_t operator()(const T& value) const { return static_cast<uint64_t>(std::hash<T>{}(value)); }
};

inline constexpr uint64_t hash_combine(uint64_t seed, uint64_t value)
{
    return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 12) + (seed >> 4));
}

template <typename A, typename B>
struct KeyHash<std::pair<A, B>>
{
    uint64_t operator()(const std::pair<A, B>& p) const
    {
        return hash_combine(KeyHash<A>{}(p.first), KeyHash<B>{}(p.second));
    }
};

template <typename T>
struct KeyHash<std::optional<T>>
{
    uint64_t operator()(const std::optional<T>& v) const
    {
        return v ? hash_combine(1, KeyHash<T>{}(*v)) : 0;
    }
};

template <typename... Ts>
struct KeyHash<std::tuple<Ts...>>
{
    uint64_t operator()(const std::tuple<Ts...>& t) const
    {
        uint64_t seed = sizeof...(Ts);
        std::apply([&seed](const auto&... v)
                   { ((seed = hash_combine(seed, KeyHash<std::decay_t<decltype(v)>>{}(v))), ...); },
                   t);
        return seed;
    }
};

// Stable 64-bit identity for a drag-and-drop context or a draggable element.
class Id
{
   public:
    constexpr Id() = default;

    static constexpr Id null() { return Id{}; }
    static constexpr Id from_value(uint64_t value) { return Id{value}; }

    // FNV-1a; stable across runs.
    static constexpr Id from(std::string_view name)
    {
        uint64_t h = 0xcbf29ce484222325ull;
        for (char c : name)
        {
            h ^= static_cast<uint8_t>(c);
            h *= 0x100000001b3ull;
        }
        return Id{h == 0 ? 1 : h};
    }

    // Child identity derived from this one and `value`.
    template <typename T>
    Id with(const T& value) const
    {
        uint64_t h = hash_combine(value_, KeyHash<T>{}(value));
        return Id{h == 0 ? 1 : h};
    }

    Id with(std::string_view name) const { return with(Id::from(name).value()); }
    Id with(const char* name) const { return with(std::string_view(name)); }
    Id with(const std::string& name) const { return with(std::string_view(name)); }

    constexpr uint64_t value() const { return value_; }
    constexpr bool     is_null() const { return value_ == 0; }

    constexpr bool operator==(const Id&) const = default;

   private:
    constexpr explicit Id(uint64_t value) : value_(value) {}

    uint64_t value_ = 0;
};

}   // namespace dragkit

template <>
struct std::hash<dragkit::Id>
{
    size_t operator()(const dragkit::Id& id) const noexcept { return static_cast<size_t>(id.value()); }
};
