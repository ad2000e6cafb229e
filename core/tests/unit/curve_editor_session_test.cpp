// ==============================================================================
// Tests for curve_editor_session.h
// ==============================================================================
// Pointer events are sent in display units against the default 500x500 canvas.
// ==============================================================================

#include <glide/core/curve_editor_session.h>

#include "test_helpers/recording_surface.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

using Catch::Approx;
using namespace Glide::Core;
using Glide::Testing::RecordingSurface;

namespace {

DisplayPoint pointPosition(const CurveEditorSession& session, size_t index) {
    return session.getCanvasTransform().toCanvas(session.model().point(index));
}

void pressOn(CurveEditorSession& session, size_t index, bool additive = false) {
    auto pos = pointPosition(session, index);
    session.press(pos.x, pos.y, additive);
}

} // namespace

// =============================================================================
// Selection
// =============================================================================

TEST_CASE("Press on a point selects it and starts a drag", "[session][press]") {
    CurveEditorSession session;
    pressOn(session, 1);

    REQUIRE(session.selection().contains(1));
    REQUIRE(session.selection().size() == 1);
    REQUIRE(session.isDragging());
}

TEST_CASE("Shift press toggles membership", "[session][press]") {
    CurveEditorSession session;
    pressOn(session, 1);
    session.release();
    pressOn(session, 2, true);
    session.release();

    REQUIRE(session.selection().size() == 2);

    pressOn(session, 1, true);
    REQUIRE(session.selection().size() == 1);
    REQUIRE(session.selection().contains(2));
}

TEST_CASE("Press away from every point clears the selection", "[session][press]") {
    CurveEditorSession session;
    pressOn(session, 1);
    session.release();

    session.press(250.0, 60.0, false);
    REQUIRE(session.selection().empty());
    REQUIRE_FALSE(session.isDragging());
}

TEST_CASE("Press on the locked low-speed point is ignored", "[session][press][lock]") {
    CurveEditorSession session;
    int changes = 0;
    session.setChangeCallback([&](const CurveEditorSession&) { ++changes; });

    pressOn(session, 1);
    session.release();
    changes = 0;

    pressOn(session, 0);
    REQUIRE(changes == 0);
    REQUIRE(session.selection().contains(1));
    REQUIRE_FALSE(session.selection().contains(0));
    REQUIRE_FALSE(session.isDragging());
}

TEST_CASE("Unlocked low-speed point can be selected", "[session][press][lock]") {
    CurveEditorSession session;
    session.setLowSpeedLocked(false);
    pressOn(session, 0);

    REQUIRE(session.selection().contains(0));
}

// =============================================================================
// Dragging
// =============================================================================

TEST_CASE("Dragging moves the point through the inverse transform", "[session][drag]") {
    CurveEditorSession session;
    pressOn(session, 1);

    auto target = session.getCanvasTransform().toCanvas(0.25, 2.0);
    session.drag(target.x, target.y);

    REQUIRE(session.model().point(1).input == Approx(0.25));
    REQUIRE(session.model().point(1).output == Approx(2.0));
}

TEST_CASE("Drag keeps the grab offset", "[session][drag]") {
    CurveEditorSession session;
    auto pos = pointPosition(session, 1);

    // Grab 3px right of the centre, then release the mouse where it was pressed
    session.press(pos.x + 3.0, pos.y, false);
    session.drag(pos.x + 3.0, pos.y);

    REQUIRE(session.model().point(1).input == Approx(0.5));
    REQUIRE(session.model().point(1).output == Approx(0.5));
}

TEST_CASE("Drag clamps against neighbours and bounds", "[session][drag]") {
    CurveEditorSession session;
    pressOn(session, 1);

    session.drag(1000.0, -1000.0);
    REQUIRE(session.model().point(1).input == Approx(1.0));
    REQUIRE(session.model().point(1).output == Approx(kOutputMax));

    session.drag(-1000.0, 1000.0);
    REQUIRE(session.model().point(1).input == Approx(0.0));
    REQUIRE(session.model().point(1).output == Approx(kOutputMin));
}

TEST_CASE("Drag after release does nothing", "[session][drag]") {
    CurveEditorSession session;
    pressOn(session, 2);
    session.release();

    auto before = session.model().points();
    session.drag(100.0, 100.0);
    REQUIRE(session.model().points() == before);
}

TEST_CASE("Locking mid-drag freezes the low-speed point", "[session][drag][lock]") {
    CurveEditorSession session;
    session.setLowSpeedLocked(false);
    pressOn(session, 0);
    session.setLowSpeedLocked(true);

    session.drag(200.0, 200.0);
    REQUIRE(session.model().point(0) == ControlPoint{0.0, 0.0});
}

// =============================================================================
// Buttons and Toggles
// =============================================================================

TEST_CASE("Increase and decrease adjust only the selection", "[session][adjust]") {
    CurveEditorSession session;
    pressOn(session, 1);
    session.release();

    session.increaseSelected();
    REQUIRE(session.model().point(1).output == Approx(0.6));
    REQUIRE(session.model().point(2).output == Approx(1.0));

    session.decreaseSelected();
    session.decreaseSelected();
    REQUIRE(session.model().point(1).output == Approx(0.4));
}

TEST_CASE("Changing options rebuilds the curve and clears the selection", "[session][options]") {
    CurveEditorSession session;
    pressOn(session, 2);

    session.setOptions({.windowsCurve = true});
    REQUIRE(session.model().size() == 4);
    REQUIRE(session.selection().empty());
    REQUIRE_FALSE(session.isDragging());

    session.setOptions({.nonlinearBoost = true, .accelerationCap = true});
    REQUIRE(session.model().points() ==
            std::vector<ControlPoint>{{0.0, 0.0}, {0.5, 1.5}, {1.0, 2.5}});
}

TEST_CASE("applyPreset maps to the matching toggles", "[session][options]") {
    CurveEditorSession session;
    session.applyPreset(CurvePreset::CappedHigh);

    REQUIRE(session.options().accelerationCap);
    REQUIRE_FALSE(session.options().nonlinearBoost);
    REQUIRE(session.model().point(2) == ControlPoint{1.0, 2.5});
}

TEST_CASE("Every mutation notifies the change callback", "[session][observer]") {
    CurveEditorSession session;
    int changes = 0;
    session.setChangeCallback([&](const CurveEditorSession& s) {
        REQUIRE(&s == &session);
        ++changes;
    });

    pressOn(session, 1);                // 1
    session.drag(300.0, 300.0);         // 2
    session.release();                  // no change
    session.increaseSelected();         // 3
    session.decreaseSelected();         // 4
    session.setOptions({});             // 5
    session.setHumanReadableLabels(false);  // 6

    REQUIRE(changes == 6);
}

// =============================================================================
// Rendering
// =============================================================================

TEST_CASE("Session render draws grid then curve", "[session][render]") {
    CurveEditorSession session;
    session.setHumanReadableLabels(false);

    RecordingSurface surface;
    session.render(surface);

    REQUIRE(surface.linesWithColor(Colors::kGrid).size() == 22);
    REQUIRE(surface.linesWithColor(Colors::kBlue).size() == 2);
    REQUIRE(surface.circles.size() == 3);
    REQUIRE(surface.texts[0].text == "Input Speed");
}
