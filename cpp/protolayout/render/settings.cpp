#include "protolayout/render/settings.h"

#include "protolayout/core/errors.h"
#include "protolayout/core/logging.h"

#include <cmath>
#include <utility>
#include <vector>

namespace protolayout {

Settings::Settings()
    : context_(RenderContext::gui(TabMode::Component, kDisplayDpi, Unit::Px)) {}

void Settings::setDisplayUnit(Unit unit) {
    if (context_.unit() == unit) return;
    context_ = context_.withUnit(unit);
    publish(SettingsField::DisplayUnit);
}

void Settings::setDisplayDpi(double dpi) {
    if (context_.dpi() == dpi) return;
    context_ = context_.withDpi(dpi);
    publish(SettingsField::DisplayDpi);
}

void Settings::setPrintDpi(double dpi) {
    if (!std::isfinite(dpi) || dpi <= 0.0) throw ParseError("print dpi must be positive");
    if (printDpi_ == dpi) return;
    printDpi_ = dpi;
    publish(SettingsField::PrintDpi);
}

void Settings::setRenderContext(const RenderContext& context) {
    if (context_ == context) return;
    context_ = context;
    publish(SettingsField::RenderContext);
}

void Settings::setTabMode(TabMode tabMode) {
    if (context_.tabMode() == tabMode) return;
    setRenderContext(RenderContext::gui(tabMode, context_.dpi(), context_.unit()));
}

RenderContext Settings::exportContext(RenderRoute route) const {
    return RenderContext::exportContext(route, printDpi_, context_.unit());
}

Settings::SubscriptionId Settings::subscribe(Listener listener) {
    const SubscriptionId id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool Settings::unsubscribe(SubscriptionId id) {
    return listeners_.erase(id) > 0;
}

void Settings::publish(SettingsField field) {
    PROTOLAYOUT_LOG_DEBUG("settings changed (field %u)", static_cast<unsigned>(field));
    const SettingsChange change{field, context_};
    // Listeners may unsubscribe while being notified.
    std::vector<Listener> snapshot;
    snapshot.reserve(listeners_.size());
    for (const auto& kv : listeners_) snapshot.push_back(kv.second);
    for (const auto& listener : snapshot) {
        if (listener) listener(change);
    }
}

} // namespace protolayout
