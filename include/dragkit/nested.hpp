#pragma once

#include <cstddef>
#include <dragkit/id.hpp>
#include <dragkit/logger.hpp>
#include <dragkit/reorder.hpp>
#include <optional>
#include <vector>

namespace dragkit
{

// Position of an element inside a list of lists.
struct NestedIndex
{
    size_t container = 0;
    size_t index     = 0;

    bool operator==(const NestedIndex&) const = default;
};

// Drop destination inside a list of lists. An empty `index` denotes the end
// of the container, e.g. the drop zone drawn over an empty list.
struct NestedSlot
{
    size_t                container = 0;
    std::optional<size_t> index;

    bool operator==(const NestedSlot&) const = default;
};

template <>
struct KeyHash<NestedIndex>
{
    uint64_t operator()(const NestedIndex& i) const
    {
        return hash_combine(static_cast<uint64_t>(i.container), static_cast<uint64_t>(i.index));
    }
};

template <>
struct KeyHash<NestedSlot>
{
    uint64_t operator()(const NestedSlot& s) const
    {
        return hash_combine(static_cast<uint64_t>(s.container), KeyHash<std::optional<size_t>>{}(s.index));
    }
};

using NestedMove = DndMove<NestedIndex, Placed<NestedSlot>>;

// Applies a move between (or within) the inner lists of `lists`.
//
// Within one list this is the same rotation as reorder(). Across lists the
// element is removed from its source and inserted at the target index
// (Before) or just past it (After), or appended when the slot has no index.
// A source list left empty is kept. Returns true if anything changed.
template <typename T>
bool apply_nested_move(std::vector<std::vector<T>>& lists, const NestedMove& move)
{
    const NestedIndex& from = move.payload;
    const NestedSlot&  to   = move.target.target;

    if (from.container >= lists.size() || to.container >= lists.size()
        || from.index >= lists[from.container].size())
    {
        DRAGKIT_LOG_WARN("reorder",
                         "Rejected nested move ({}, {}) -> container {}",
                         from.container,
                         from.index,
                         to.container);
        return false;
    }

    if (from.container == to.container && to.index)
    {
        return reorder(ReorderMove<size_t>{from.index, {*to.index, move.target.placement}},
                       lists[from.container]);
    }

    auto& source = lists[from.container];
    auto& dest   = lists[to.container];

    size_t insert_at = dest.size();
    if (to.index)
    {
        insert_at = move.target.placement == Placement::Before ? *to.index : *to.index + 1;
        if (insert_at > dest.size())
        {
            DRAGKIT_LOG_WARN("reorder",
                             "Rejected nested move: slot {} past end of container {} ({} elements)",
                             insert_at,
                             to.container,
                             dest.size());
            return false;
        }
    }

    T element = std::move(source[from.index]);
    source.erase(source.begin() + static_cast<std::ptrdiff_t>(from.index));
    if (insert_at > dest.size())   // same container, appending after the erase
        insert_at = dest.size();
    dest.insert(dest.begin() + static_cast<std::ptrdiff_t>(insert_at), std::move(element));
    return true;
}

}   // namespace dragkit
