#pragma once

#include <mark_model/types.hpp>

namespace mark_model {

// Starts a zero-length preview line fixed at `anchor`.
void begin_attach(Mark& m, Point anchor);
// Draws anchor to pointer directly, without intersecting the outline.
void update_preview(Mark& m, Point target);
// Terminus = nearest outline hit on the ray anchor -> center, or the center.
// Preview lines are left alone.
void recompute_geometry(Mark& m);
void confirm_attach(Mark& m);
void cancel_attach(Mark& m);
// The only mutator of an existing anchor.
void move_anchor(Mark& m, Point anchor);

// Reattaches a committed line from persisted endpoints; p1 becomes the anchor.
void restore_attach(Mark& m, Point p1, Point p2);

} // namespace mark_model
