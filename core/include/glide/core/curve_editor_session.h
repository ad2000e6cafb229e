// ==============================================================================
// CurveEditorSession - Command Handlers for the Curve Editor
// ==============================================================================
// Owns the CurveModel + SelectionSet pair of one interactive session and turns
// input events (press, drag, release, button clicks, toggles) into model
// mutations. Extracted from the editor view for testability (humble object
// pattern): no toolkit dependency, coordinates are display units.
//
// After every mutation the change callback fires; the editor redraws and
// pushes the curve to the pointer device from there.
// ==============================================================================

#pragma once

#include <glide/core/canvas_transform.h>
#include <glide/core/control_point.h>
#include <glide/core/curve_model.h>
#include <glide/core/curve_presets.h>
#include <glide/core/curve_renderer.h>
#include <glide/core/selection_set.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

namespace Glide {
namespace Core {

class CurveEditorSession {
public:
    using ChangeCallback = std::function<void(const CurveEditorSession&)>;

    struct DragState {
        std::optional<size_t> pointIndex;
        double offsetX = 0.0;
        double offsetY = 0.0;
    };

    CurveEditorSession() = default;

    explicit CurveEditorSession(const CanvasTransform& transform,
                                double pointRadius = kDefaultPointRadius,
                                double adjustStep = kOutputAdjustStep)
        : transform_(transform)
        , pointRadius_(pointRadius)
        , adjustStep_(adjustStep) {}

    // =========================================================================
    // Configuration
    // =========================================================================

    void setChangeCallback(ChangeCallback cb) { changeCallback_ = std::move(cb); }

    void setCanvasTransform(const CanvasTransform& transform) noexcept { transform_ = transform; }
    [[nodiscard]] const CanvasTransform& getCanvasTransform() const noexcept { return transform_; }

    [[nodiscard]] double getPointRadius() const noexcept { return pointRadius_; }

    // =========================================================================
    // Toggles
    // =========================================================================

    /// Rebuild the curve from the preset toggles. Clears the selection.
    void setOptions(const CurveOptions& options) {
        options_ = options;
        model_.applyOptions(options_);
        selection_.clear();
        drag_ = {};
        notifyChanged();
    }

    /// Rebuild the curve from a named preset. Clears the selection.
    void applyPreset(CurvePreset preset) { setOptions(optionsForPreset(preset)); }

    void setLowSpeedLocked(bool locked) noexcept { model_.setLowSpeedLocked(locked); }

    void setHumanReadableLabels(bool enabled) {
        humanReadableLabels_ = enabled;
        notifyChanged();
    }

    // =========================================================================
    // Pointer Events
    // =========================================================================

    /// @brief Mouse press at (x, y).
    /// @param additive true when the selection modifier (Shift) is held
    void press(double x, double y, bool additive) {
        auto index = model_.hitTest(x, y, pointRadius_, transform_);

        // A locked point swallows the click.
        if (index && model_.isLocked(*index)) return;

        if (index) {
            selection_.toggle(*index, additive);
            auto pos = transform_.toCanvas(model_.point(*index));
            drag_.pointIndex = index;
            drag_.offsetX = pos.x - x;
            drag_.offsetY = pos.y - y;
        } else {
            selection_.clear();
        }
        notifyChanged();
    }

    /// Mouse moved with the button held. Ignored unless a drag is active.
    void drag(double x, double y) {
        if (!drag_.pointIndex) return;
        size_t index = *drag_.pointIndex;
        if (model_.isLocked(index)) return;

        auto target = transform_.toFunction(x + drag_.offsetX, y + drag_.offsetY);
        model_.movePoint(index, target.input, target.output);
        notifyChanged();
    }

    void release() noexcept { drag_.pointIndex.reset(); }

    // =========================================================================
    // Buttons
    // =========================================================================

    void increaseSelected() {
        model_.adjustSelected(adjustStep_, selection_);
        notifyChanged();
    }

    void decreaseSelected() {
        model_.adjustSelected(-adjustStep_, selection_);
        notifyChanged();
    }

    // =========================================================================
    // Rendering
    // =========================================================================

    void render(RenderSurface& surface) const {
        renderGrid(surface, transform_, humanReadableLabels_);
        renderCurve(surface, transform_, model_, selection_, pointRadius_);
    }

    // =========================================================================
    // State Access
    // =========================================================================

    [[nodiscard]] const CurveModel& model() const noexcept { return model_; }
    [[nodiscard]] const SelectionSet& selection() const noexcept { return selection_; }
    [[nodiscard]] const CurveOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool humanReadableLabels() const noexcept { return humanReadableLabels_; }
    [[nodiscard]] bool isDragging() const noexcept { return drag_.pointIndex.has_value(); }
    [[nodiscard]] const DragState& dragState() const noexcept { return drag_; }

private:
    void notifyChanged() {
        if (changeCallback_) changeCallback_(*this);
    }

    CanvasTransform transform_{};
    double pointRadius_ = kDefaultPointRadius;
    double adjustStep_ = kOutputAdjustStep;

    CurveModel model_;
    SelectionSet selection_;
    CurveOptions options_{};
    bool humanReadableLabels_ = true;
    DragState drag_{};

    ChangeCallback changeCallback_;
};

} // namespace Core
} // namespace Glide
