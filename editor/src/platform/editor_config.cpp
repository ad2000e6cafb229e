#include "editor_config.h"

#include <cstdlib>

namespace Glide::Editor::Platform {

void applyEnvironmentOverrides(EditorConfig& config, const EnvironmentLookup& lookup) {
    if (!lookup) return;

    const char* device = lookup(kPointerDeviceEnvVar);
    if (device && device[0] != '\0') {
        config.preferredDevice = device;
    }

    const char* xinput = lookup(kXInputEnvVar);
    if (xinput && xinput[0] != '\0') {
        config.xinputExecutable = xinput;
    }
}

EditorConfig loadEditorConfig() {
    EditorConfig config;
    applyEnvironmentOverrides(config, [](const char* name) { return std::getenv(name); });
    return config;
}

} // namespace Glide::Editor::Platform
