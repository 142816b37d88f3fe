#pragma once

#include <algorithm>
#include <cstddef>
#include <dragkit/id.hpp>
#include <dragkit/logger.hpp>
#include <dragkit/response.hpp>
#include <iterator>
#include <type_traits>
#include <utility>

namespace dragkit
{

// Whether the payload goes before or after the target element.
enum class Placement
{
    Before,
    After,
};

// A target value paired with a placement, the target type of reorder contexts.
template <typename T>
struct Placed
{
    T         target;
    Placement placement = Placement::Before;

    bool operator==(const Placed&) const = default;
};

template <typename T>
inline constexpr bool is_placed_v = false;

template <typename T>
inline constexpr bool is_placed_v<Placed<T>> = true;

template <typename T>
struct KeyHash<Placed<T>>
{
    uint64_t operator()(const Placed<T>& p) const
    {
        return hash_combine(KeyHash<T>{}(p.target), static_cast<uint64_t>(p.placement));
    }
};

// Index the element at `source` ends up at when dropped on the `placement`
// side of `target`. Removing the source shifts later indices down by one,
// so a Before-drop past the source and an After-drop ahead of it are
// adjusted to keep the same visual boundary.
size_t resolve_reorder(size_t source, size_t target, Placement placement);

// Moves the element at `source` to `final_index` with a single rotation of
// the range between them. Returns true if the container changed.
template <typename Container>
bool apply_reorder(Container& items, size_t source, size_t final_index)
{
    const auto size = static_cast<size_t>(std::size(items));
    if (source >= size || final_index >= size)
    {
        DRAGKIT_LOG_WARN("reorder",
                         "Rejected move {} -> {} on a sequence of {} elements",
                         source,
                         final_index,
                         size);
        return false;
    }
    if (source == final_index)
        return false;

    auto first = std::begin(items);
    if (source < final_index)
    {
        // [source, final] left by one
        std::rotate(std::next(first, static_cast<std::ptrdiff_t>(source)),
                    std::next(first, static_cast<std::ptrdiff_t>(source + 1)),
                    std::next(first, static_cast<std::ptrdiff_t>(final_index + 1)));
    }
    else
    {
        // [final, source] right by one
        std::rotate(std::next(first, static_cast<std::ptrdiff_t>(final_index)),
                    std::next(first, static_cast<std::ptrdiff_t>(source)),
                    std::next(first, static_cast<std::ptrdiff_t>(source + 1)));
    }
    return true;
}

// Move produced by a reorder context over a flat sequence.
template <typename I = size_t>
using ReorderMove = DndMove<I, Placed<I>>;

// (source, final) indices for a reorder move. Negative indices of a signed
// `I` map past any container size and are rejected by apply_reorder().
template <typename I>
std::pair<size_t, size_t> list_reorder_indices(const ReorderMove<I>& move)
{
    static_assert(std::is_integral_v<I>, "reorder moves need integral indices");
    const auto source = static_cast<size_t>(move.payload);
    const auto target = static_cast<size_t>(move.target.target);
    return {source, resolve_reorder(source, target, move.target.placement)};
}

// Applies a reorder move to `items`. Returns true if the container changed.
template <typename I, typename Container>
bool reorder(const ReorderMove<I>& move, Container& items)
{
    auto [source, final_index] = list_reorder_indices(move);
    return apply_reorder(items, source, final_index);
}

}   // namespace dragkit
