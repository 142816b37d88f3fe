#include <dragkit/reorder.hpp>

namespace dragkit
{

size_t resolve_reorder(size_t source, size_t target, Placement placement)
{
    // Only ever steps one towards `source`, so it cannot wrap.
    if (target > source && placement == Placement::Before)
        return target - 1;
    if (target < source && placement == Placement::After)
        return target + 1;
    return target;
}

}   // namespace dragkit
