#pragma once

// Umbrella header: everything needed to drive drag-and-drop from a UI.

#include <dragkit/dnd.hpp>
#include <dragkit/drag_state.hpp>
#include <dragkit/geometry.hpp>
#include <dragkit/id.hpp>
#include <dragkit/lifecycle_guard.hpp>
#include <dragkit/logger.hpp>
#include <dragkit/nested.hpp>
#include <dragkit/reorder.hpp>
#include <dragkit/reorder_handle.hpp>
#include <dragkit/response.hpp>
#include <dragkit/style.hpp>
#include <dragkit/ui.hpp>
