// =============================================================================
// Glide Curve Editor - Main Entry Point
// =============================================================================
// Standalone application for shaping a custom pointer acceleration curve.
//
// Usage:
//   glide_editor
//
// Environment:
//   GLIDE_POINTER_DEVICE  device selected at startup (if present)
//   GLIDE_XINPUT          xinput executable to invoke
// =============================================================================

#include "editor_delegate.h"
#include "vstgui/standalone/include/appinit.h"

// =============================================================================
// Application Entry Point
// =============================================================================
// VSTGUI Standalone uses this static initialization pattern to set up the
// application before main() is called.

static VSTGUI::Standalone::Application::Init gAppDelegate(
    std::make_unique<Glide::Editor::EditorDelegate>(),
    {
        {VSTGUI::Standalone::Application::ConfigKey::ShowCommandsInContextMenu, 1}
    }
);
