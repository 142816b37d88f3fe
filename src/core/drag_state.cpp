#include <dragkit/drag_state.hpp>

namespace dragkit
{

std::optional<DragState> DragStateStore::load(Id context) const
{
    auto it = states_.find(context);
    if (it == states_.end())
        return std::nullopt;
    return it->second;
}

void DragStateStore::store(Id context, const DragState& state)
{
    states_[context] = state;
}

void DragStateStore::clear(Id context)
{
    states_.erase(context);
}

std::optional<DragState> DragStateStore::take(Id context)
{
    auto node = states_.extract(context);
    if (node.empty())
        return std::nullopt;
    return node.mapped();
}

bool DragStateStore::raise_marker(Id context)
{
    return !unfinished_.insert(context).second;
}

void DragStateStore::lower_marker(Id context)
{
    unfinished_.erase(context);
}

void DragStateStore::reset()
{
    states_.clear();
    unfinished_.clear();
}

}   // namespace dragkit
