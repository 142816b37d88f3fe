#pragma once

#include <dragkit/id.hpp>
#include <dragkit/ui.hpp>

namespace dragkit
{

// Grab handle painted as two columns of three dots. Senses drags only, so
// hovering it shows the grab cursor.
class ReorderHandle
{
   public:
    Response show(Ui& ui, Id id) const;
};

}   // namespace dragkit
