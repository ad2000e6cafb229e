// =============================================================================
// Editor Delegate Implementation
// =============================================================================

#include "editor_delegate.h"
#include "editor_controller.h"

#include "platform/device_configurator.h"
#include "platform/editor_config.h"
#include "ui/event_log_view.h"

#include <glide/core/embedded_curves.h>
#include <glide/core/fixed_point_decoder.h>

#include "vstgui/standalone/include/iapplication.h"
#include "vstgui/standalone/include/iuidescwindow.h"
#include "vstgui/standalone/include/ialertbox.h"
#include "vstgui/standalone/include/helpers/uidesc/customization.h"

#include <system_error>
#include <utility>

namespace Glide::Editor {

using namespace VSTGUI;
using namespace VSTGUI::Standalone;

// =============================================================================
// Commands
// =============================================================================
static Command ApplyCurveCommand{"Device", "Apply Curve To Device"};
static Command ShowDecodedCurveCommand{CommandGroup::Window, "Show Decoded Curve"};
static Command ClearLogCommand{CommandGroup::Edit, "Clear Log"};

// =============================================================================
// EditorDelegate Implementation
// =============================================================================

EditorDelegate::EditorDelegate()
    : Application::DelegateAdapter({
        "Glide Curve Editor",
        "1.0.0",
        "io.glide.curveeditor"
    })
{
}

EditorDelegate::~EditorDelegate() = default;

void EditorDelegate::finishLaunching() {
    IApplication::instance().registerCommand(ApplyCurveCommand, 'a');
    IApplication::instance().registerCommand(ShowDecodedCurveCommand, 'd');
    IApplication::instance().registerCommand(ClearLogCommand, 'l');

    createMainWindow();
}

void EditorDelegate::createMainWindow() {
    auto config = Platform::loadEditorConfig();
    controller_ = std::make_shared<EditorController>(
        config, Platform::makeDeviceConfigurator(config.xinputExecutable));

    UIDesc::Config windowConfig;
    windowConfig.windowConfig.title = "Custom Pointer Acceleration Curve Editor";
    windowConfig.windowConfig.autoSaveFrameName = "GlideCurveEditorFrame";
    windowConfig.windowConfig.style.close().size().border();
    windowConfig.windowConfig.size = {540, 900};
    windowConfig.uiDescFileName = "curve_editor.uidesc";
    windowConfig.viewName = "view";

    auto customization = UIDesc::Customization::make();
    customization->addCreateViewControllerFunc(
        "EditorController",
        [this](const UTF8StringView&, IController* /*parent*/, const IUIDescription*) {
            return controller_.get();
        }
    );
    windowConfig.customization = customization;

    mainWindow_ = UIDesc::makeWindow(windowConfig);
    if (mainWindow_) {
        mainWindow_->show();
        mainWindow_->registerWindowListener(this);
    }

    // After the window exists so the event log receives the device report
    controller_->initialize();
}

void EditorDelegate::showDecodedCurveWindow() {
    if (decodedWindow_) {
        decodedWindow_->activate();
        return;
    }

    std::error_code ec;
    auto samples = Core::decodeCurve(Core::kSmoothMouseCurveX, Core::kSmoothMouseCurveY, ec);
    if (ec) {
        logError("Could not decode the embedded curve: " + ec.message());
        return;
    }

    decodedController_ = std::make_shared<DecodedCurveController>(std::move(samples));

    UIDesc::Config windowConfig;
    windowConfig.windowConfig.title = "Mouse Curve Graph";
    windowConfig.windowConfig.autoSaveFrameName = "GlideDecodedCurveFrame";
    windowConfig.windowConfig.style.close().border();
    windowConfig.windowConfig.size = {500, 500};
    windowConfig.uiDescFileName = "curve_editor.uidesc";
    windowConfig.viewName = "decoded";

    auto customization = UIDesc::Customization::make();
    customization->addCreateViewControllerFunc(
        "DecodedCurveController",
        [this](const UTF8StringView&, IController* /*parent*/, const IUIDescription*) {
            return decodedController_.get();
        }
    );
    windowConfig.customization = customization;

    decodedWindow_ = UIDesc::makeWindow(windowConfig);
    if (decodedWindow_) {
        decodedWindow_->show();
        decodedWindow_->registerWindowListener(this);
    } else {
        decodedController_.reset();
    }
}

void EditorDelegate::onClosed(const IWindow& window) {
    // The frame and its views are gone by now
    if (mainWindow_ && &window == mainWindow_.get()) {
        if (controller_) controller_->detachViews();
        controller_.reset();
        mainWindow_.reset();
    } else if (decodedWindow_ && &window == decodedWindow_.get()) {
        decodedController_.reset();
        decodedWindow_.reset();
    }

    // Quit when last window closes
    if (IApplication::instance().getWindows().empty()) {
        IApplication::instance().quit();
    }
}

bool EditorDelegate::canHandleCommand(const Command& command) {
    if (command == ApplyCurveCommand) return controller_ != nullptr;
    if (command == ShowDecodedCurveCommand) return true;
    if (command == ClearLogCommand) return true;
    return false;
}

bool EditorDelegate::handleCommand(const Command& command) {
    if (command == ApplyCurveCommand) {
        if (controller_ && !controller_->applyCurveToDevice() &&
            !controller_->deviceBinding().hasDevice()) {
            logError("No pointer device selected");
        }
        return true;
    }
    if (command == ShowDecodedCurveCommand) {
        showDecodedCurveWindow();
        return true;
    }
    if (command == ClearLogCommand) {
        if (auto* logger = getGlobalLogger()) {
            logger->clear();
        }
        return true;
    }
    return false;
}

void EditorDelegate::showAboutDialog() {
    AlertBoxConfig config;
    config.headline = "Glide Curve Editor";
    config.description = "Edit a custom pointer acceleration curve and apply it to a\n"
                         "libinput pointer device through xinput.";
    config.defaultButton = "OK";
    IApplication::instance().showAlertBox(config);
}

bool EditorDelegate::hasAboutDialog() {
    return true;
}

UTF8StringPtr EditorDelegate::getSharedUIResourceFilename() const {
    return nullptr;
}

} // namespace Glide::Editor
