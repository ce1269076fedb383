#pragma once
#include <QColor>
#include <QString>
#include <QJsonObject>

namespace mmv {

struct Theme {
    QString name;

    // ── Surface ──
    QColor background;      // window, marker columns
    QColor stackFill;       // top stack behind the blocks
    QColor innerStackFill;  // nested stack behind the blocks
    QColor border;          // stack outlines
    QColor separator;       // line between adjacent blocks

    // ── Text ──
    QColor text;            // block names, size tags
    QColor gapText;         // gap names

    // ── Blocks ──
    QColor gapFill;
    QColor depth0;
    QColor depth1;
    QColor depth2;
    QColor depth3;
    QColor depth4;          // used for every deeper level too

    // ── Markers ──
    QColor markerLine;      // tick + pill outline
    QColor markerText;

    QColor depthColor(int depth) const;

    QJsonObject toJson() const;
    static Theme fromJson(const QJsonObject& obj);

    static Theme memmapLight();
    static Theme memmapDark();
};

// Serialization table: JSON key -> member
struct ThemeFieldMeta {
    const char*     key;
    QColor Theme::* ptr;
};

extern const ThemeFieldMeta kThemeFields[];
extern const int kThemeFieldCount;

} // namespace mmv
