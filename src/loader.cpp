#include "loader.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>
#include <cmath>

namespace mmv {

NumberParseResult parseNumber(const QJsonValue& v) {
    if (v.isDouble()) {
        double d = v.toDouble();
        // 2^64 is the first double past uint64_t
        if (d < 0 || d != std::floor(d) || d >= 18446744073709551616.0)
            return {false, 0, QStringLiteral("not a non-negative integer: %1").arg(d)};
        return {true, (uint64_t)d, {}};
    }
    if (v.isString()) {
        QString s = v.toString().trimmed().toLower();
        bool ok = false;
        uint64_t value = 0;
        if (s.startsWith(QLatin1String("0x")))
            value = s.mid(2).toULongLong(&ok, 16);
        else
            value = s.toULongLong(&ok, 10);
        if (!ok)
            return {false, 0, QStringLiteral("invalid number '%1'").arg(v.toString())};
        return {true, value, {}};
    }
    return {false, 0, QStringLiteral("unsupported number type")};
}

bool nodeFromJson(const QJsonObject& o, const QString& path,
                  RangeNode* out, QString* error) {
    auto fail = [&](const QString& msg) {
        if (error) *error = path + QStringLiteral(": ") + msg;
        return false;
    };

    RangeNode n;
    const QJsonValue nameVal = o.value(QStringLiteral("name"));
    if (nameVal.isUndefined() || nameVal.isNull())
        n.name = QStringLiteral("Unnamed");
    else if (nameVal.isString())
        n.name = nameVal.toString();
    else
        return fail(QStringLiteral("'name' must be a string"));

    auto readNumber = [&](const char* key, uint64_t* dst) {
        const QJsonValue v = o.value(QLatin1String(key));
        if (v.isUndefined())
            return fail(QStringLiteral("missing '%1'").arg(QLatin1String(key)));
        NumberParseResult r = parseNumber(v);
        if (!r.ok)
            return fail(QStringLiteral("'%1' %2").arg(QLatin1String(key), r.error));
        *dst = r.value;
        return true;
    };
    if (!readNumber("start", &n.start) || !readNumber("size", &n.size))
        return false;
    if (n.start + n.size < n.start)
        return fail(QStringLiteral("range wraps past the end of the address space"));

    const QJsonValue kids = o.value(QStringLiteral("children"));
    if (!kids.isUndefined() && !kids.isNull()) {
        if (!kids.isArray())
            return fail(QStringLiteral("'children' must be an array"));
        const QJsonArray arr = kids.toArray();
        n.children.reserve(arr.size());
        for (int i = 0; i < arr.size(); i++) {
            const QString childPath = path + QStringLiteral(".children[%1]").arg(i);
            if (!arr[i].isObject()) {
                if (error) *error = childPath + QStringLiteral(": not an object");
                return false;
            }
            RangeNode child;
            if (!nodeFromJson(arr[i].toObject(), childPath, &child, error))
                return false;
            n.children.push_back(std::move(child));
        }
        n.sortChildren();
    }

    *out = std::move(n);
    return true;
}

LoadResult loadRangeJson(const QByteArray& json) {
    LoadResult r;
    QJsonParseError perr;
    QJsonDocument doc = QJsonDocument::fromJson(json, &perr);
    if (perr.error != QJsonParseError::NoError) {
        r.error = QStringLiteral("JSON parse error at offset %1: %2")
                      .arg(perr.offset).arg(perr.errorString());
        return r;
    }
    if (!doc.isObject()) {
        r.error = QStringLiteral("root: expected a JSON object");
        return r;
    }
    r.ok = nodeFromJson(doc.object(), QStringLiteral("root"), &r.root, &r.error);
    return r;
}

LoadResult loadRangeFile(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        qWarning() << "Loader: Cannot open" << path << "-" << f.errorString();
        LoadResult r;
        r.error = QStringLiteral("cannot open '%1': %2").arg(path, f.errorString());
        return r;
    }
    LoadResult r = loadRangeJson(f.readAll());
    if (!r.ok)
        qWarning() << "Loader: Failed to load" << path << "-" << r.error;
    else
        qDebug() << "Loader: Loaded" << path << "root:" << r.root.name;
    return r;
}

} // namespace mmv
