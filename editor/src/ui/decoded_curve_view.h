#pragma once

// ==============================================================================
// DecodedCurveView - Read-only Plot of a Decoded Device Curve
// ==============================================================================
// Shows the samples produced by decodeCurve() as a polyline with an "(x, y)"
// caption on every sample ("Mouse Curve Graph" window).
// ==============================================================================

#include "draw_context_surface.h"

#include <glide/core/canvas_transform.h>
#include <glide/core/curve_renderer.h>
#include <glide/core/fixed_point_decoder.h>

#include "vstgui/lib/cview.h"
#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/ccolor.h"

#include <utility>
#include <vector>

namespace Glide::Editor {

class DecodedCurveView : public VSTGUI::CView {
public:
    explicit DecodedCurveView(const VSTGUI::CRect& size)
        : CView(size)
    {
    }

    void setSamples(std::vector<Core::CurveSample> samples) {
        samples_ = std::move(samples);
        invalid();
    }

    [[nodiscard]] const std::vector<Core::CurveSample>& getSamples() const { return samples_; }

    /// Plot mapping anchored at the view's top-left corner.
    [[nodiscard]] Core::PlotTransform plotTransform() const {
        Core::PlotTransform plot;
        VSTGUI::CRect vs = getViewSize();
        plot.originX += vs.left;
        plot.originY += vs.top;
        return plot;
    }

    void draw(VSTGUI::CDrawContext* context) override {
        context->setFillColor(VSTGUI::CColor(255, 255, 255, 255));
        context->drawRect(getViewSize(), VSTGUI::kDrawFilled);

        DrawContextSurface surface(context);
        Core::renderDecodedCurve(surface, samples_, plotTransform());

        setDirty(false);
    }

    CLASS_METHODS_NOCOPY(DecodedCurveView, CView)

private:
    std::vector<Core::CurveSample> samples_;
};

} // namespace Glide::Editor
