#pragma once

#include <optional>
#include <utility>
#include <variant>

namespace dragkit
{

// A payload together with where it is being moved to.
template <typename Payload, typename Target>
struct DndMove
{
    Payload payload;
    Target  target;

    bool operator==(const DndMove&) const = default;
};

// ─── Outcome alternatives ────────────────────────────────────────────────────

// Nothing is being dragged in this context.
struct Inactive
{
    bool operator==(const Inactive&) const = default;
};

// A drag is in progress; the target is unset while nothing is hovered.
template <typename Payload, typename Target>
struct MidDrag
{
    DndMove<Payload, std::optional<Target>> move;

    bool operator==(const MidDrag&) const = default;
};

// The payload was released over `move.target` this frame.
template <typename Payload, typename Target>
struct DoneDragging
{
    DndMove<Payload, Target> move;

    bool operator==(const DoneDragging&) const = default;
};

// Result of Dnd::finish(). Produced once per frame.
template <typename Payload, typename Target>
class DndResponse
{
   public:
    using Variant =
        std::variant<Inactive, MidDrag<Payload, Target>, DoneDragging<Payload, Target>>;

    DndResponse() = default;
    DndResponse(Inactive v) : value_(v) {}
    DndResponse(MidDrag<Payload, Target> v) : value_(std::move(v)) {}
    DndResponse(DoneDragging<Payload, Target> v) : value_(std::move(v)) {}

    bool is_inactive() const { return std::holds_alternative<Inactive>(value_); }
    bool is_mid_drag() const { return std::holds_alternative<MidDrag<Payload, Target>>(value_); }
    bool is_done() const { return std::holds_alternative<DoneDragging<Payload, Target>>(value_); }

    // The move, only on the frame the payload was dropped.
    std::optional<DndMove<Payload, Target>> if_done_dragging() const
    {
        if (const auto* done = std::get_if<DoneDragging<Payload, Target>>(&value_))
            return done->move;
        return std::nullopt;
    }

    const MidDrag<Payload, Target>* mid_drag() const
    {
        return std::get_if<MidDrag<Payload, Target>>(&value_);
    }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const
    {
        return std::visit(std::forward<Visitor>(visitor), value_);
    }

    const Variant& value() const { return value_; }

    bool operator==(const DndResponse&) const = default;

   private:
    Variant value_;
};

}   // namespace dragkit
