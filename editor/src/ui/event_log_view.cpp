#include "event_log_view.h"
#include <algorithm>
#include <iostream>

namespace Glide::Editor {

namespace {

EventLogView* g_logger = nullptr;

} // namespace

void setGlobalLogger(EventLogView* logger) {
    g_logger = logger;
}

EventLogView* getGlobalLogger() {
    return g_logger;
}

void logInfo(const std::string& message) {
    if (g_logger) {
        g_logger->logEvent(EventSeverity::Info, message);
    }
}

void logError(const std::string& message) {
    std::cerr << "glide_editor: " << message << std::endl;
    if (g_logger) {
        g_logger->logEvent(EventSeverity::Error, message);
    }
}

std::string formatLogLine(const LogEntry& entry) {
    if (entry.severity == EventSeverity::Error) {
        return "error: " + entry.message;
    }
    return entry.message;
}

// =============================================================================
// EventLogView
// =============================================================================

EventLogView::EventLogView(const VSTGUI::CRect& size)
    : CView(size)
    , headerFont_(VSTGUI::makeOwned<VSTGUI::CFontDesc>("Arial", 10, VSTGUI::kBoldFace))
    , lineFont_(VSTGUI::makeOwned<VSTGUI::CFontDesc>("Arial", 10))
{
}

EventLogView::~EventLogView() {
    if (g_logger == this) {
        g_logger = nullptr;
    }
}

size_t EventLogView::visibleLineCount() const {
    double available = getViewSize().getHeight() - kHeaderHeight - kPadding;
    if (available < kLineHeight) return 0;
    return static_cast<size_t>(available / kLineHeight);
}

void EventLogView::drawHeader(VSTGUI::CDrawContext* context, const VSTGUI::CRect& bounds) {
    VSTGUI::CRect header(bounds.left + kPadding, bounds.top,
                         bounds.right - kPadding, bounds.top + kHeaderHeight);
    context->setFont(headerFont_);
    context->setFontColor(kTextColor);
    context->drawString("Events", header, VSTGUI::kLeftText);

    context->setFrameColor(kRuleColor);
    context->setLineWidth(1.0);
    context->drawLine(VSTGUI::CPoint(bounds.left, header.bottom),
                      VSTGUI::CPoint(bounds.right, header.bottom));
}

void EventLogView::draw(VSTGUI::CDrawContext* context) {
    const auto bounds = getViewSize();

    context->setFillColor(kBackgroundColor);
    context->setFrameColor(kRuleColor);
    context->setLineWidth(1.0);
    context->drawRect(bounds, VSTGUI::kDrawFilledAndStroked);

    drawHeader(context, bounds);

    context->setFont(lineFont_);
    const size_t count = std::min(visibleLineCount(), entries_.size());
    for (size_t i = 0; i < count; ++i) {
        const auto& entry = entries_[i];
        double top = bounds.top + kHeaderHeight + 2.0 + static_cast<double>(i) * kLineHeight;
        VSTGUI::CRect line(bounds.left + kPadding, top, bounds.right - kPadding, top + kLineHeight);
        context->setFontColor(entry.severity == EventSeverity::Error ? kErrorColor : kTextColor);
        context->drawString(formatLogLine(entry).c_str(), line, VSTGUI::kLeftText);
    }

    setDirty(false);
}

void EventLogView::logEvent(EventSeverity severity, const std::string& message) {
    entries_.push_front({severity, message});
    if (entries_.size() > kMaxLogEntries) {
        entries_.resize(kMaxLogEntries);
    }
    invalid();
}

void EventLogView::clear() {
    entries_.clear();
    invalid();
}

} // namespace Glide::Editor
