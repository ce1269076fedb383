#include "theme.h"
#include <type_traits>

namespace mmv {

// ── Shared field metadata (serialization) ──

const ThemeFieldMeta kThemeFields[] = {
    {"background",     &Theme::background},
    {"stackFill",      &Theme::stackFill},
    {"innerStackFill", &Theme::innerStackFill},
    {"border",         &Theme::border},
    {"separator",      &Theme::separator},
    {"text",           &Theme::text},
    {"gapText",        &Theme::gapText},
    {"gapFill",        &Theme::gapFill},
    {"depth0",         &Theme::depth0},
    {"depth1",         &Theme::depth1},
    {"depth2",         &Theme::depth2},
    {"depth3",         &Theme::depth3},
    {"depth4",         &Theme::depth4},
    {"markerLine",     &Theme::markerLine},
    {"markerText",     &Theme::markerText},
};
const int kThemeFieldCount = static_cast<int>(std::extent_v<decltype(kThemeFields)>);

QColor Theme::depthColor(int depth) const {
    switch (qBound(0, depth, 4)) {
    case 0:  return depth0;
    case 1:  return depth1;
    case 2:  return depth2;
    case 3:  return depth3;
    default: return depth4;
    }
}

QJsonObject Theme::toJson() const {
    QJsonObject o;
    o["name"] = name;
    for (int i = 0; i < kThemeFieldCount; i++) {
        const QColor& c = this->*kThemeFields[i].ptr;
        o[kThemeFields[i].key] = c.alpha() < 255 ? c.name(QColor::HexArgb) : c.name();
    }
    return o;
}

// Missing keys fall back to the light palette
Theme Theme::fromJson(const QJsonObject& o) {
    Theme t = memmapLight();
    t.name = o["name"].toString("Untitled");
    for (int i = 0; i < kThemeFieldCount; i++) {
        if (!o.contains(kThemeFields[i].key)) continue;
        QColor c(o[kThemeFields[i].key].toString());
        if (c.isValid())
            t.*kThemeFields[i].ptr = c;
    }
    return t;
}

Theme Theme::memmapLight() {
    Theme t;
    t.name           = QStringLiteral("MemMap Light");
    t.background     = QColor("#ffffff");
    t.stackFill      = QColor("#f7f7f7");
    t.innerStackFill = QColor("#fdfdfd");
    t.border         = QColor("#bdbdbd");
    t.separator      = QColor(0, 0, 0, 56);
    t.text           = QColor("#1b1b1b");
    t.gapText        = QColor("#222222");
    t.gapFill        = QColor("#efefef");
    t.depth0         = QColor("#c9b78e");
    t.depth1         = QColor("#c2d3c5");
    t.depth2         = QColor("#c9cfe8");
    t.depth3         = QColor("#e6c8df");
    t.depth4         = QColor("#d6c7b8");
    t.markerLine     = QColor("#9a9a9a");
    t.markerText     = QColor("#1b1b1b");
    return t;
}

Theme Theme::memmapDark() {
    Theme t;
    t.name           = QStringLiteral("MemMap Dark");
    t.background     = QColor("#1e1e1e");
    t.stackFill      = QColor("#252526");
    t.innerStackFill = QColor("#2d2d30");
    t.border         = QColor("#3f3f46");
    t.separator      = QColor(0, 0, 0, 110);
    t.text           = QColor("#d4d4d4");
    t.gapText        = QColor("#a0a0a0");
    t.gapFill        = QColor("#333337");
    t.depth0         = QColor("#6b5d3f");
    t.depth1         = QColor("#4a6350");
    t.depth2         = QColor("#4b5478");
    t.depth3         = QColor("#6e4a66");
    t.depth4         = QColor("#5e5246");
    t.markerLine     = QColor("#858585");
    t.markerText     = QColor("#e0e0e0");
    return t;
}

} // namespace mmv
