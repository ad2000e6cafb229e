#pragma once

// ==============================================================================
// DrawContextSurface - RenderSurface on a VSTGUI CDrawContext
// ==============================================================================
// Adapter used by the editor views: the core renderer emits primitives in
// view coordinates and this class forwards them to the draw context.
// ==============================================================================

#include <glide/core/render_surface.h>

#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/ccolor.h"
#include "vstgui/lib/cfont.h"
#include "vstgui/lib/cgraphicstransform.h"
#include "vstgui/lib/cpoint.h"
#include "vstgui/lib/crect.h"

#include <string>

namespace Glide::Editor {

[[nodiscard]] inline VSTGUI::CColor toCColor(const Core::RenderColor& color) {
    return VSTGUI::CColor(color.red, color.green, color.blue, color.alpha);
}

class DrawContextSurface final : public Core::RenderSurface {
public:
    static constexpr double kFontSize = 10.0;

    explicit DrawContextSurface(VSTGUI::CDrawContext* context)
        : context_(context)
        , font_(VSTGUI::makeOwned<VSTGUI::CFontDesc>("Arial", kFontSize))
    {
        context_->setDrawMode(VSTGUI::kAntiAliasing | VSTGUI::kNonIntegralMode);
    }

    void drawLine(const Core::DisplayPoint& from, const Core::DisplayPoint& to,
                  const Core::RenderColor& color, double width) override {
        context_->setFrameColor(toCColor(color));
        context_->setLineWidth(width);
        context_->drawLine(VSTGUI::CPoint(from.x, from.y), VSTGUI::CPoint(to.x, to.y));
    }

    void drawCircle(const Core::DisplayRect& bounds, const Core::RenderColor& fill,
                    const Core::RenderColor& outline, double outlineWidth) override {
        context_->setFillColor(toCColor(fill));
        context_->setFrameColor(toCColor(outline));
        context_->setLineWidth(outlineWidth);
        context_->drawEllipse(VSTGUI::CRect(bounds.left, bounds.top, bounds.right, bounds.bottom),
                              VSTGUI::kDrawFilledAndStroked);
    }

    void drawText(const Core::DisplayPoint& position, const std::string& text,
                  Core::TextAnchor anchor, const Core::RenderColor& color,
                  double angleDegrees) override {
        context_->setFont(font_);
        context_->setFontColor(toCColor(color));

        const double w = context_->getStringWidth(text.c_str());
        const double h = kFontSize + 4.0;

        VSTGUI::CRect rect;
        VSTGUI::CHoriTxtAlign align = VSTGUI::kCenterText;
        switch (anchor) {
            case Core::TextAnchor::Center:
                rect = VSTGUI::CRect(position.x - w * 0.5, position.y - h * 0.5,
                                     position.x + w * 0.5, position.y + h * 0.5);
                break;
            case Core::TextAnchor::North:
                rect = VSTGUI::CRect(position.x - w * 0.5, position.y,
                                     position.x + w * 0.5, position.y + h);
                break;
            case Core::TextAnchor::East:
                rect = VSTGUI::CRect(position.x - w, position.y - h * 0.5,
                                     position.x, position.y + h * 0.5);
                align = VSTGUI::kRightText;
                break;
            case Core::TextAnchor::SouthEast:
                rect = VSTGUI::CRect(position.x - w, position.y - h, position.x, position.y);
                align = VSTGUI::kRightText;
                break;
        }

        if (angleDegrees == 0.0) {
            context_->drawString(text.c_str(), rect, align);
            return;
        }

        // The anchor rectangle is laid out unrotated, then turned about the
        // anchor point. CGraphicsTransform rotates clockwise in view space.
        VSTGUI::CGraphicsTransform rotation;
        rotation.rotate(-angleDegrees, VSTGUI::CPoint(position.x, position.y));
        VSTGUI::CDrawContext::Transform scoped(*context_, rotation);
        context_->drawString(text.c_str(), rect, align);
    }

private:
    VSTGUI::CDrawContext* context_;
    VSTGUI::SharedPointer<VSTGUI::CFontDesc> font_;
};

} // namespace Glide::Editor
