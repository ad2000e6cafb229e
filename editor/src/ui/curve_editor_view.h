#pragma once

// ==============================================================================
// CurveEditorView - Interactive Control-Point Canvas
// ==============================================================================
// VSTGUI CControl that renders a CurveEditorSession and forwards mouse input
// to it:
// - Click a handle to select it (Shift toggles it in/out of the selection)
// - Drag a handle to move it between its neighbours
// - Click empty canvas to clear the selection
//
// The session is owned by the EditorController; the view only borrows it.
// The canvas transform follows the view rectangle, so the 20 px margin stays
// constant when the window is resized.
//
// Registered as "CurveEditor" via VSTGUI ViewCreator system.
// ==============================================================================

#include "draw_context_surface.h"

#include <glide/core/canvas_transform.h>
#include <glide/core/curve_editor_session.h>

#include "vstgui/lib/controls/ccontrol.h"
#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/ccolor.h"
#include "vstgui/uidescription/iviewcreator.h"
#include "vstgui/uidescription/uiviewfactory.h"
#include "vstgui/uidescription/uiviewcreator.h"
#include "vstgui/uidescription/uiattributes.h"
#include "vstgui/uidescription/detail/uiviewcreatorattributes.h"

namespace Glide::Editor {

class CurveEditorView : public VSTGUI::CControl {
public:
    static constexpr double kDefaultMargin = 20.0;

    CurveEditorView(const VSTGUI::CRect& size,
                    VSTGUI::IControlListener* listener,
                    int32_t tag)
        : CControl(size, listener, tag)
    {
    }

    CurveEditorView(const CurveEditorView& other)
        : CControl(other)
        , session_(other.session_)
        , margin_(other.margin_)
        , backgroundColor_(other.backgroundColor_)
    {
    }

    // =========================================================================
    // Session Binding
    // =========================================================================

    void setSession(Core::CurveEditorSession* session) {
        session_ = session;
        syncTransform();
        setDirty();
    }

    [[nodiscard]] Core::CurveEditorSession* getSession() const { return session_; }

    void setMargin(double margin) {
        margin_ = margin;
        syncTransform();
        setDirty();
    }
    [[nodiscard]] double getMargin() const { return margin_; }

    void setBackgroundColor(const VSTGUI::CColor& color) { backgroundColor_ = color; setDirty(); }
    [[nodiscard]] VSTGUI::CColor getBackgroundColor() const { return backgroundColor_; }

    /// Canvas mapping for the current view rectangle.
    [[nodiscard]] Core::CanvasTransform canvasTransform() const {
        VSTGUI::CRect vs = getViewSize();
        return Core::CanvasTransform{vs.left, vs.top, vs.getWidth(), vs.getHeight(), margin_};
    }

    // =========================================================================
    // CControl Overrides
    // =========================================================================

    void setViewSize(const VSTGUI::CRect& rect, bool invalid = true) override {
        CControl::setViewSize(rect, invalid);
        syncTransform();
    }

    void draw(VSTGUI::CDrawContext* context) override {
        context->setFillColor(backgroundColor_);
        context->drawRect(getViewSize(), VSTGUI::kDrawFilled);

        if (session_) {
            syncTransform();
            DrawContextSurface surface(context);
            session_->render(surface);
        }

        setDirty(false);
    }

    VSTGUI::CMouseEventResult onMouseDown(
        VSTGUI::CPoint& where,
        const VSTGUI::CButtonState& buttons) override {

        if (!session_ || (buttons & VSTGUI::kLButton) == 0)
            return VSTGUI::kMouseEventNotHandled;

        syncTransform();
        bool additive = (buttons.getModifierState() & VSTGUI::kShift) != 0;
        session_->press(where.x, where.y, additive);
        setDirty();

        // Keep receiving moves even when the click missed so onMouseUp arrives.
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseMoved(
        VSTGUI::CPoint& where,
        const VSTGUI::CButtonState& /*buttons*/) override {

        if (!session_ || !session_->isDragging())
            return VSTGUI::kMouseEventNotHandled;

        session_->drag(where.x, where.y);
        setDirty();
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseUp(
        VSTGUI::CPoint& /*where*/,
        const VSTGUI::CButtonState& /*buttons*/) override {

        if (!session_ || !session_->isDragging())
            return VSTGUI::kMouseEventNotHandled;

        session_->release();
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseCancel() override {
        if (session_) session_->release();
        return VSTGUI::kMouseEventHandled;
    }

    CLASS_METHODS(CurveEditorView, CControl)

private:
    void syncTransform() {
        if (session_) session_->setCanvasTransform(canvasTransform());
    }

    Core::CurveEditorSession* session_ = nullptr;
    double margin_ = kDefaultMargin;
    VSTGUI::CColor backgroundColor_{255, 255, 255, 255};
};

// ==============================================================================
// ViewCreator Registration
// ==============================================================================

struct CurveEditorViewCreator : VSTGUI::ViewCreatorAdapter {
    CurveEditorViewCreator() {
        VSTGUI::UIViewFactory::registerViewCreator(*this);
    }

    VSTGUI::IdStringPtr getViewName() const override { return "CurveEditor"; }

    VSTGUI::IdStringPtr getBaseViewName() const override {
        return VSTGUI::UIViewCreator::kCControl;
    }

    VSTGUI::UTF8StringPtr getDisplayName() const override {
        return "Curve Editor";
    }

    VSTGUI::CView* create(
        const VSTGUI::UIAttributes& /*attributes*/,
        const VSTGUI::IUIDescription* /*description*/) const override {
        return new CurveEditorView(VSTGUI::CRect(0, 0, 500, 500), nullptr, -1);
    }

    bool apply(VSTGUI::CView* view, const VSTGUI::UIAttributes& attributes,
               const VSTGUI::IUIDescription* description) const override {
        auto* editor = dynamic_cast<CurveEditorView*>(view);
        if (!editor)
            return false;

        VSTGUI::CColor color;
        if (VSTGUI::UIViewCreator::stringToColor(
                attributes.getAttributeValue("background-color"), color, description))
            editor->setBackgroundColor(color);

        double margin = 0.0;
        if (attributes.getDoubleAttribute("canvas-margin", margin))
            editor->setMargin(margin);

        return true;
    }

    bool getAttributeNames(
        VSTGUI::IViewCreator::StringList& attributeNames) const override {
        attributeNames.emplace_back("background-color");
        attributeNames.emplace_back("canvas-margin");
        return true;
    }

    AttrType getAttributeType(const std::string& attributeName) const override {
        if (attributeName == "background-color") return kColorType;
        if (attributeName == "canvas-margin") return kFloatType;
        return kUnknownType;
    }

    bool getAttributeValue(VSTGUI::CView* view,
                           const std::string& attributeName,
                           std::string& stringValue,
                           const VSTGUI::IUIDescription* desc) const override {
        auto* editor = dynamic_cast<CurveEditorView*>(view);
        if (!editor)
            return false;

        if (attributeName == "background-color") {
            VSTGUI::UIViewCreator::colorToString(
                editor->getBackgroundColor(), stringValue, desc);
            return true;
        }
        if (attributeName == "canvas-margin") {
            stringValue = VSTGUI::UIAttributes::doubleToString(editor->getMargin());
            return true;
        }
        return false;
    }
};

inline CurveEditorViewCreator gCurveEditorViewCreator;

} // namespace Glide::Editor
