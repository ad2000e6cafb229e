#include "device_binding.h"
#include "device_enumeration.h"

#include <glide/core/curve_labels.h>

#include <algorithm>
#include <utility>

namespace Glide::Editor::Platform {

DeviceBinding::DeviceBinding(std::unique_ptr<DeviceConfigurator> configurator,
                             std::string preferredDevice)
    : configurator_(std::move(configurator))
    , preferredDevice_(std::move(preferredDevice))
{
}

bool DeviceBinding::refreshDevices(std::error_code& ec) {
    devices_ = configurator_->listPointerDevices(ec);
    lastError_ = ec ? configurator_->getLastError() : std::string{};
    currentDevice_ = chooseInitialDevice(devices_, preferredDevice_);
    return !ec;
}

bool DeviceBinding::selectDevice(size_t index) {
    if (index >= devices_.size()) return false;
    currentDevice_ = devices_[index];
    return true;
}

int DeviceBinding::currentIndex() const {
    auto it = std::find(devices_.begin(), devices_.end(), currentDevice_);
    if (it == devices_.end()) return -1;
    return static_cast<int>(std::distance(devices_.begin(), it));
}

bool DeviceBinding::apply(const Core::CurveModel& model, std::error_code& ec) {
    ec.clear();
    if (!hasDevice()) {
        lastError_ = kNoDevicePlaceholder;
        return false;
    }

    if (!configurator_->applyCurve(currentDevice_, Core::formatDeviceValues(model), ec)) {
        lastError_ = configurator_->getLastError();
        return false;
    }
    lastError_.clear();
    return true;
}

} // namespace Glide::Editor::Platform
