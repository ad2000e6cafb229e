// =============================================================================
// Editor Delegate - Main application delegate for the curve editor
// =============================================================================

#pragma once

#include "vstgui/standalone/include/helpers/appdelegate.h"
#include "vstgui/standalone/include/helpers/windowlistener.h"
#include "vstgui/standalone/include/icommand.h"
#include "vstgui/standalone/include/iwindow.h"
#include <memory>

namespace Glide::Editor {

class EditorController;
class DecodedCurveController;

// =============================================================================
// EditorDelegate - Application delegate
// =============================================================================
class EditorDelegate : public VSTGUI::Standalone::Application::DelegateAdapter,
                       public VSTGUI::Standalone::ICommandHandler,
                       public VSTGUI::Standalone::WindowListenerAdapter
{
public:
    EditorDelegate();
    ~EditorDelegate() override;

    // Application::IDelegate
    void finishLaunching() override;
    void showAboutDialog() override;
    bool hasAboutDialog() override;
    VSTGUI::UTF8StringPtr getSharedUIResourceFilename() const override;

    // ICommandHandler
    bool canHandleCommand(const VSTGUI::Standalone::Command& command) override;
    bool handleCommand(const VSTGUI::Standalone::Command& command) override;

    // WindowListenerAdapter
    void onClosed(const VSTGUI::Standalone::IWindow& window) override;

private:
    void createMainWindow();
    void showDecodedCurveWindow();

    // Controllers live exactly as long as their windows
    std::shared_ptr<EditorController> controller_;
    std::shared_ptr<DecodedCurveController> decodedController_;
    VSTGUI::Standalone::WindowPtr mainWindow_;
    VSTGUI::Standalone::WindowPtr decodedWindow_;
};

} // namespace Glide::Editor
