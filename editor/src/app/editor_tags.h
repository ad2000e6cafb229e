#pragma once

// =============================================================================
// Control tags used by curve_editor.uidesc
// =============================================================================

#include <cstdint>

namespace Glide::Editor {

enum ControlTag : int32_t {
    kTagWindowsCurve = 1000,
    kTagNonlinearBoost = 1001,
    kTagAccelerationCap = 1002,
    kTagHumanLabels = 1003,
    kTagLockLowSpeed = 1004,

    kTagIncrease = 1010,
    kTagDecrease = 1011,

    kTagDevice = 1020,
};

} // namespace Glide::Editor
