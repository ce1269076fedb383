#include "core.h"

namespace mmv::fmt {

static QString hexVal(uint64_t v) {
    return QStringLiteral("0x") + QString::number(v, 16);
}

// ── Marker address: "0x1000_0000" ──
// At least 8 digits; wider values are padded to whole 4-digit clusters.

QString address(uint64_t v) {
    QString digits = QString::number(v, 16).toUpper();
    int width = qMax(8, ((int)digits.size() + 3) / 4 * 4);
    digits = digits.rightJustified(width, '0');

    QString out = QStringLiteral("0x");
    out.reserve(2 + width + width / 4);
    for (int i = 0; i < digits.size(); i++) {
        if (i > 0 && i % 4 == 0) out += QLatin1Char('_');
        out += digits[i];
    }
    return out;
}

// ── Size tag: binary units, "512 B" / "1.50 KB" ──

QString size(uint64_t bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int kLast = 4;

    double v = (double)bytes;
    int i = 0;
    while (v >= 1024.0 && i < kLast) {
        v /= 1024.0;
        i++;
    }
    QString num = (i == 0) ? QString::number(v, 'f', 0) : QString::number(v, 'f', 2);
    return num + QLatin1Char(' ') + QLatin1String(kUnits[i]);
}

QString hexRange(uint64_t start, uint64_t end) {
    return QStringLiteral("[%1..%2]").arg(hexVal(start), hexVal(end));
}

// Path token used in flat ids: "Flash@0x8000000"
QString idToken(const QString& name, uint64_t start) {
    return name + QLatin1Char('@') + hexVal(start);
}

} // namespace mmv::fmt
