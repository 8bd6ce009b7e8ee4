#include "Orientation.hpp"

static_assert(inverse(Orientation::Rot90CW) == Orientation::Rot90CCW);
static_assert(inverse(Orientation::Rot90CCW) == Orientation::Rot90CW);
static_assert(inverse(Orientation::FlipP) == Orientation::FlipP);
static_assert(inverse(Orientation::FlipS) == Orientation::FlipS);
static_assert(inverse(Orientation::Rot180) == Orientation::Rot180);

static_assert(apply(Orientation::Rot90CCW, { 0, 0 }, 3, 5) == coords_t{ 0, 4 });
static_assert(apply(Orientation::Rot90CW, { 0, 0 }, 3, 5) == coords_t{ 2, 0 });
static_assert(apply(Orientation::Rot180, { 0, 0 }, 3, 5) == coords_t{ 2, 4 });

static_assert(edge_source(Orientation::Identity, Side::Top) == EdgeSource{ Side::Top, false });
static_assert(edge_source(Orientation::Rot90CCW, Side::Top) == EdgeSource{ Side::Right, false });
static_assert(edge_source(Orientation::Rot90CCW, Side::Left) == EdgeSource{ Side::Top, true });
static_assert(edge_source(Orientation::Rot180, Side::Right) == EdgeSource{ Side::Left, true });

auto fmt::formatter<Orientation>::format(Orientation c, format_context &ctx) const
    -> format_context::iterator {
    string_view name = "unknown";
    switch (c) {
        case Orientation::Identity: name = "Identity"; break;
        case Orientation::FlipX: name = "FlipX"; break;
        case Orientation::FlipY: name = "FlipY"; break;
        case Orientation::Rot180: name = "Rot180"; break;
        case Orientation::FlipP: name = "FlipP"; break;
        case Orientation::Rot90CCW: name = "Rot90CCW"; break;
        case Orientation::Rot90CW: name = "Rot90CW"; break;
        case Orientation::FlipS: name = "FlipS"; break;
    }
    return formatter<string_view>::format(name, ctx);
}
