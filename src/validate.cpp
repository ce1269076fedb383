#include "core.h"
#include <QSet>

namespace mmv {

namespace {

void validateNode(const RangeNode& n, const QString& path, QStringList& errs) {
    const QString here = path + QLatin1Char('/') + n.name;
    const auto& kids = n.children;

    QSet<QString> tokens;
    for (const RangeNode& c : kids) {
        if (c.end() < c.start) {
            errs.append(QStringLiteral("%1: child '%2' at 0x%3 size 0x%4 wraps past the end of the address space")
                            .arg(here, c.name, QString::number(c.start, 16),
                                 QString::number(c.size, 16)));
        } else if (c.start < n.start || c.end() > n.end()) {
            errs.append(QStringLiteral("%1: child '%2' %3 outside parent %4")
                            .arg(here, c.name,
                                 fmt::hexRange(c.start, c.end()),
                                 fmt::hexRange(n.start, n.end())));
        }
        // Zero-size twins would share a flat id, adjacent or not
        const QString token = fmt::idToken(c.name, c.start);
        if (tokens.contains(token)) {
            errs.append(QStringLiteral("%1: duplicate child '%2' at 0x%3")
                            .arg(here, c.name, QString::number(c.start, 16)));
        }
        tokens.insert(token);
        validateNode(c, here, errs);
    }

    // Children are sorted by start, so any overlap shows up between some pair of neighbours
    for (size_t i = 0; i + 1 < kids.size(); i++) {
        const RangeNode& a = kids[i];
        const RangeNode& b = kids[i + 1];
        if (a.end() > b.start) {
            errs.append(QStringLiteral("%1: overlap between '%2' %3 and '%4' %5")
                            .arg(here, a.name, fmt::hexRange(a.start, a.end()),
                                 b.name, fmt::hexRange(b.start, b.end())));
        }
    }
}

} // anonymous namespace

QStringList validate(const RangeNode& root) {
    QStringList errs;
    if (root.end() < root.start) {
        errs.append(QStringLiteral("root/%1: range at 0x%2 size 0x%3 wraps past the end of the address space")
                        .arg(root.name, QString::number(root.start, 16),
                             QString::number(root.size, 16)));
    }
    validateNode(root, QStringLiteral("root"), errs);
    return errs;
}

} // namespace mmv
