// =============================================================================
// Editor Controller Implementation
// =============================================================================

#include "editor_controller.h"
#include "editor_tags.h"

#include "platform/device_enumeration.h"
#include "ui/curve_editor_view.h"
#include "ui/decoded_curve_view.h"
#include "ui/event_log_view.h"

#include <glide/core/curve_labels.h>

#include "vstgui/lib/controls/ccontrol.h"
#include "vstgui/lib/controls/coptionmenu.h"
#include "vstgui/lib/controls/ctextlabel.h"

#include <string>
#include <utility>

namespace Glide::Editor {

using namespace VSTGUI;

namespace {

bool isOn(const CControl* control) {
    return control->getValueNormalized() > 0.5f;
}

void setOn(CControl* control, bool on) {
    control->setValueNormalized(on ? 1.0f : 0.0f);
}

} // namespace

// =============================================================================
// EditorController Implementation
// =============================================================================

EditorController::EditorController(const Platform::EditorConfig& config,
                                   std::unique_ptr<Platform::DeviceConfigurator> configurator)
    : config_(config)
    , session_(Core::CanvasTransform{0.0, 0.0, config.canvasWidth, config.canvasHeight,
                                     config.canvasMargin},
               config.pointRadius, config.adjustStep)
    , binding_(std::move(configurator), config.preferredDevice)
{
    session_.setLowSpeedLocked(config_.lockLowSpeed);
    session_.setHumanReadableLabels(config_.humanReadableLabels);
}

void EditorController::initialize() {
    if (!binding_.isSupported()) {
        logInfo("Device configuration is not available on this platform");
    }

    std::error_code ec;
    if (!binding_.refreshDevices(ec)) {
        logError("Device enumeration failed: " + binding_.getLastError());
    } else if (binding_.devices().empty()) {
        logInfo(Platform::kNoDevicePlaceholder);
    } else {
        logInfo("Found " + std::to_string(binding_.devices().size()) + " pointer device(s), using " +
                binding_.currentDevice());
    }

    session_.setChangeCallback([this](const Core::CurveEditorSession&) { onSessionChanged(); });

    populateDeviceMenu();
    if (binding_.hasDevice()) {
        applyCurveToDevice();
    }
}

void EditorController::detachViews() {
    curveView_ = nullptr;
    valuesLabel_ = nullptr;
    deviceMenu_ = nullptr;
}

bool EditorController::applyCurveToDevice() {
    if (!binding_.hasDevice()) {
        return false;
    }

    std::error_code ec;
    if (!binding_.apply(session_.model(), ec)) {
        logError(ec.message() + ": " + binding_.getLastError());
        return false;
    }

    logInfo("Applied curve to " + binding_.currentDevice());
    return true;
}

void EditorController::onSessionChanged() {
    if (curveView_) {
        curveView_->invalid();
    }
    refreshValuesText();
    applyCurveToDevice();
}

void EditorController::refreshValuesText() {
    if (valuesLabel_) {
        valuesLabel_->setText(Core::formatValuesText(session_.model()).c_str());
    }
}

void EditorController::populateDeviceMenu() {
    if (!deviceMenu_) return;

    deviceMenu_->removeAllEntry();
    if (binding_.devices().empty()) {
        deviceMenu_->addEntry(Platform::kNoDevicePlaceholder);
        deviceMenu_->setCurrent(0);
        deviceMenu_->setMouseEnabled(false);
        return;
    }

    for (const auto& device : binding_.devices()) {
        deviceMenu_->addEntry(device.c_str());
    }
    deviceMenu_->setCurrent(binding_.currentIndex() >= 0 ? binding_.currentIndex() : 0);
    deviceMenu_->setMouseEnabled(true);
}

CView* EditorController::createView(
    const UIAttributes& attributes,
    const IUIDescription* /*description*/)
{
    if (auto customViewName = attributes.getAttributeValue(IUIDescription::kCustomViewName)) {
        if (*customViewName == "ValuesText") {
            auto* label = new CMultiLineTextLabel(CRect(0, 0, 500, 80));
            label->setLineLayout(CMultiLineTextLabel::LineLayout::wrap);
            label->setHoriAlign(kLeftText);
            valuesLabel_ = label;
            refreshValuesText();
            return label;
        }
        else if (*customViewName == "EventLog") {
            auto* logger = new EventLogView(CRect(0, 0, 300, 300));
            setGlobalLogger(logger);
            return logger;
        }
    }

    return nullptr;
}

CView* EditorController::verifyView(
    CView* view,
    const UIAttributes& /*attributes*/,
    const IUIDescription* /*description*/)
{
    if (auto* editor = dynamic_cast<CurveEditorView*>(view)) {
        curveView_ = editor;
        editor->setSession(&session_);
        return view;
    }

    if (auto* menu = dynamic_cast<COptionMenu*>(view)) {
        if (menu->getTag() == kTagDevice) {
            deviceMenu_ = menu;
            populateDeviceMenu();
        }
        return view;
    }

    if (auto* control = dynamic_cast<CControl*>(view)) {
        const auto& options = session_.options();
        switch (control->getTag()) {
            case kTagWindowsCurve:    setOn(control, options.windowsCurve); break;
            case kTagNonlinearBoost:  setOn(control, options.nonlinearBoost); break;
            case kTagAccelerationCap: setOn(control, options.accelerationCap); break;
            case kTagHumanLabels:     setOn(control, session_.humanReadableLabels()); break;
            case kTagLockLowSpeed:    setOn(control, session_.model().isLowSpeedLocked()); break;
            default: break;
        }
    }

    return view;
}

void EditorController::valueChanged(CControl* control) {
    auto options = session_.options();

    switch (control->getTag()) {
        case kTagWindowsCurve:
            options.windowsCurve = isOn(control);
            session_.setOptions(options);
            break;
        case kTagNonlinearBoost:
            options.nonlinearBoost = isOn(control);
            session_.setOptions(options);
            break;
        case kTagAccelerationCap:
            options.accelerationCap = isOn(control);
            session_.setOptions(options);
            break;
        case kTagHumanLabels:
            session_.setHumanReadableLabels(isOn(control));
            break;
        case kTagLockLowSpeed:
            session_.setLowSpeedLocked(isOn(control));
            break;
        case kTagIncrease:
            // Kick buttons report press and release; act on the press only
            if (isOn(control)) session_.increaseSelected();
            break;
        case kTagDecrease:
            if (isOn(control)) session_.decreaseSelected();
            break;
        case kTagDevice:
            if (auto* menu = dynamic_cast<COptionMenu*>(control)) {
                if (menu->getCurrentIndex() >= 0 &&
                    binding_.selectDevice(static_cast<size_t>(menu->getCurrentIndex()))) {
                    logInfo("Selected device " + binding_.currentDevice());
                    applyCurveToDevice();
                }
            }
            break;
        default:
            break;
    }
}

IController* EditorController::createSubController(
    UTF8StringPtr /*name*/,
    const IUIDescription* /*description*/)
{
    return nullptr;
}

// =============================================================================
// DecodedCurveController Implementation
// =============================================================================

DecodedCurveController::DecodedCurveController(std::vector<Core::CurveSample> samples)
    : samples_(std::move(samples))
{
}

CView* DecodedCurveController::createView(
    const UIAttributes& attributes,
    const IUIDescription* /*description*/)
{
    if (auto customViewName = attributes.getAttributeValue(IUIDescription::kCustomViewName)) {
        if (*customViewName == "DecodedCurve") {
            auto* view = new DecodedCurveView(CRect(0, 0, 500, 500));
            view->setSamples(samples_);
            return view;
        }
    }
    return nullptr;
}

} // namespace Glide::Editor
