#pragma once
#include "core.h"

class QSettings;

namespace mmv {

// Layout constants persisted under "layout/..." keys; absent keys keep defaults
LayoutConfig loadLayoutConfig(const QSettings& s);
void saveLayoutConfig(QSettings& s, const LayoutConfig& cfg);

} // namespace mmv
