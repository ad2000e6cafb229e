// =============================================================================
// Event Log - Displays editor events (device discovery, applies, errors)
// =============================================================================
// All access happens on the UI thread.
// =============================================================================

#pragma once

#include "vstgui/lib/cview.h"
#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/cfont.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace Glide::Editor {

// Maximum number of log entries kept
constexpr size_t kMaxLogEntries = 20;

enum class EventSeverity : uint8_t {
    Info,
    Error
};

struct LogEntry {
    EventSeverity severity;
    std::string message;
};

/// Text shown for an entry: errors carry an "error: " prefix.
[[nodiscard]] std::string formatLogLine(const LogEntry& entry);

// =============================================================================
// EventLogView - Newest entry on top
// =============================================================================
class EventLogView : public VSTGUI::CView {
public:
    static constexpr double kHeaderHeight = 18.0;
    static constexpr double kLineHeight = 14.0;
    static constexpr double kPadding = 5.0;

    explicit EventLogView(const VSTGUI::CRect& size);
    ~EventLogView() override;

    void draw(VSTGUI::CDrawContext* context) override;

    void logEvent(EventSeverity severity, const std::string& message);
    void clear();

    [[nodiscard]] const std::deque<LogEntry>& getEntries() const { return entries_; }

    /// Number of entries that fit below the header.
    [[nodiscard]] size_t visibleLineCount() const;

    CLASS_METHODS_NOCOPY(EventLogView, CView)

private:
    void drawHeader(VSTGUI::CDrawContext* context, const VSTGUI::CRect& bounds);

    std::deque<LogEntry> entries_;
    VSTGUI::SharedPointer<VSTGUI::CFontDesc> headerFont_;
    VSTGUI::SharedPointer<VSTGUI::CFontDesc> lineFont_;

    static constexpr VSTGUI::CColor kBackgroundColor{250, 250, 250, 255};
    static constexpr VSTGUI::CColor kRuleColor{200, 200, 200, 255};
    static constexpr VSTGUI::CColor kTextColor{0, 0, 0, 255};
    static constexpr VSTGUI::CColor kErrorColor{200, 0, 0, 255};
};

// =============================================================================
// Global logger instance
// =============================================================================
// The registered view unregisters itself when destroyed.
void setGlobalLogger(EventLogView* logger);
EventLogView* getGlobalLogger();

// Log from anywhere. Errors are mirrored to std::cerr, so they are reported
// even while no log view is registered.
void logInfo(const std::string& message);
void logError(const std::string& message);

} // namespace Glide::Editor
