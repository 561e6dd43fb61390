#ifndef PROTOLAYOUT_RENDER_SETTINGS_H
#define PROTOLAYOUT_RENDER_SETTINGS_H

#include "protolayout/render/render_context.h"

#include <cstdint>
#include <functional>
#include <map>

namespace protolayout {

enum class SettingsField : std::uint8_t {
    DisplayUnit = 0,
    DisplayDpi = 1,
    PrintDpi = 2,
    RenderContext = 3,
};

struct SettingsChange {
    SettingsField field;
    RenderContext context;  // context after the change
};

// Application-wide display and print settings.
//
// Passed explicitly to whoever needs it. Mutations publish a SettingsChange
// to subscribers, only when the stored value actually changes.
class Settings {
public:
    using Listener = std::function<void(const SettingsChange&)>;
    using SubscriptionId = std::uint32_t;

    Settings();

    Unit displayUnit() const noexcept { return context_.unit(); }
    double displayDpi() const noexcept { return context_.dpi(); }
    double printDpi() const noexcept { return printDpi_; }
    const RenderContext& renderContext() const noexcept { return context_; }

    void setDisplayUnit(Unit unit);
    void setDisplayDpi(double dpi);
    void setPrintDpi(double dpi);
    void setRenderContext(const RenderContext& context);
    void setTabMode(TabMode tabMode);

    // Export context at print DPI. Does not touch the stored context.
    RenderContext exportContext(RenderRoute route) const;

    SubscriptionId subscribe(Listener listener);
    bool unsubscribe(SubscriptionId id);
    std::size_t subscriberCount() const noexcept { return listeners_.size(); }

private:
    void publish(SettingsField field);

    RenderContext context_;
    double printDpi_ = kPrintDpi;
    SubscriptionId nextId_ = 1;
    std::map<SubscriptionId, Listener> listeners_;
};

} // namespace protolayout

#endif // PROTOLAYOUT_RENDER_SETTINGS_H
