#pragma once
#include "core.h"
#include <QByteArray>
#include <QJsonValue>

namespace mmv {

struct NumberParseResult {
    bool     ok = false;
    uint64_t value = 0;
    QString  error;
};

struct LoadResult {
    bool      ok = false;
    RangeNode root;
    QString   error;
};

// Integers, or strings in decimal / "0x" hex
NumberParseResult parseNumber(const QJsonValue& v);

// Builds one node (and its subtree) from {name, start, size, children}.
// `path` names the object in error messages, e.g. "root.children[2]".
bool nodeFromJson(const QJsonObject& o, const QString& path,
                  RangeNode* out, QString* error);

LoadResult loadRangeJson(const QByteArray& json);
LoadResult loadRangeFile(const QString& path);

} // namespace mmv
