#include "config.h"
#include <QSettings>

namespace mmv {

namespace {

struct ConfigField {
    const char*        key;
    int LayoutConfig::* ptr;
    int                minValue;
};

const ConfigField kConfigFields[] = {
    {"layout/outerGap",        &LayoutConfig::outerGap,        1},
    {"layout/outerMin",        &LayoutConfig::outerMin,        1},
    {"layout/outerMax",        &LayoutConfig::outerMax,        1},
    {"layout/innerGap",        &LayoutConfig::innerGap,        1},
    {"layout/innerMin",        &LayoutConfig::innerMin,        1},
    {"layout/innerPadTop",     &LayoutConfig::innerPadTop,     0},
    {"layout/innerPadBottom",  &LayoutConfig::innerPadBottom,  0},
    {"layout/innerPadLeft",    &LayoutConfig::innerPadLeft,    0},
    {"layout/innerPadRight",   &LayoutConfig::innerPadRight,   0},
    {"layout/innerLaneWidth",  &LayoutConfig::innerLaneWidth,  0},
    {"layout/markerColumn",    &LayoutConfig::markerColumn,    0},
    {"layout/minVisible",      &LayoutConfig::minVisible,      0},
    {"layout/relayoutPasses",  &LayoutConfig::relayoutPasses,  1},
    {"layout/allocatorPasses", &LayoutConfig::allocatorPasses, 1},
    {"layout/settleTicks",     &LayoutConfig::settleTicks,     1},
};

} // anonymous namespace

LayoutConfig loadLayoutConfig(const QSettings& s) {
    LayoutConfig cfg;
    for (const auto& f : kConfigFields) {
        bool ok = false;
        int v = s.value(QLatin1String(f.key), cfg.*f.ptr).toInt(&ok);
        if (ok && v >= f.minValue)
            cfg.*f.ptr = v;
    }
    // A max below the min would leave the allocator nothing to grow into
    cfg.outerMax = qMax(cfg.outerMax, cfg.outerMin);
    return cfg;
}

void saveLayoutConfig(QSettings& s, const LayoutConfig& cfg) {
    for (const auto& f : kConfigFields)
        s.setValue(QLatin1String(f.key), cfg.*f.ptr);
}

} // namespace mmv
