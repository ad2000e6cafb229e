// =============================================================================
// Editor Controller - Wires the uidesc views to the curve session and device
// =============================================================================

#pragma once

#include "platform/device_binding.h"
#include "platform/editor_config.h"

#include <glide/core/curve_editor_session.h>
#include <glide/core/fixed_point_decoder.h>

#include "vstgui/uidescription/icontroller.h"
#include "vstgui/uidescription/iuidescription.h"
#include "vstgui/uidescription/uiattributes.h"
#include "vstgui/lib/cview.h"

#include <memory>
#include <vector>

namespace VSTGUI {
class CMultiLineTextLabel;
class COptionMenu;
} // namespace VSTGUI

namespace Glide::Editor {

class CurveEditorView;

// =============================================================================
// EditorController - Controller for the main window
// =============================================================================
class EditorController : public VSTGUI::IController {
public:
    EditorController(const Platform::EditorConfig& config,
                     std::unique_ptr<Platform::DeviceConfigurator> configurator);
    ~EditorController() override = default;

    /// Enumerate devices, fill the device menu, hook the session change
    /// callback and push the starting curve to the selected device.
    void initialize();

    /// Forget the frame-owned views. Called once their window has closed;
    /// the views are not touched.
    void detachViews();

    /// Push the current curve to the selected device and log the outcome.
    bool applyCurveToDevice();

    [[nodiscard]] const Core::CurveEditorSession& session() const { return session_; }
    [[nodiscard]] const Platform::DeviceBinding& deviceBinding() const { return binding_; }

    // IController interface
    VSTGUI::CView* createView(
        const VSTGUI::UIAttributes& attributes,
        const VSTGUI::IUIDescription* description) override;

    void valueChanged(VSTGUI::CControl* control) override;

    VSTGUI::CView* verifyView(
        VSTGUI::CView* view,
        const VSTGUI::UIAttributes& attributes,
        const VSTGUI::IUIDescription* description) override;

    VSTGUI::IController* createSubController(
        VSTGUI::UTF8StringPtr name,
        const VSTGUI::IUIDescription* description) override;

private:
    void onSessionChanged();
    void refreshValuesText();
    void populateDeviceMenu();

    Platform::EditorConfig config_;
    Core::CurveEditorSession session_;
    Platform::DeviceBinding binding_;

    // Views are owned by the frame
    CurveEditorView* curveView_ = nullptr;
    VSTGUI::CMultiLineTextLabel* valuesLabel_ = nullptr;
    VSTGUI::COptionMenu* deviceMenu_ = nullptr;
};

// =============================================================================
// DecodedCurveController - Controller for the "Mouse Curve Graph" window
// =============================================================================
class DecodedCurveController : public VSTGUI::IController {
public:
    explicit DecodedCurveController(std::vector<Core::CurveSample> samples);
    ~DecodedCurveController() override = default;

    VSTGUI::CView* createView(
        const VSTGUI::UIAttributes& attributes,
        const VSTGUI::IUIDescription* description) override;

    void valueChanged(VSTGUI::CControl* /*control*/) override {}

private:
    std::vector<Core::CurveSample> samples_;
};

} // namespace Glide::Editor
