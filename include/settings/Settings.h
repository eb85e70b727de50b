#pragma once

#include <QSettings>
#include "version.h"

namespace BoxEdit {

inline constexpr const char* kOrganizationName = "BoxEdit";
inline constexpr const char* kApplicationName = BOXEDIT_APP_NAME;

inline bool isDebugSettingsNamespace()
{
    return QString::fromLatin1(BOXEDIT_APP_BUNDLE_ID).endsWith(QStringLiteral(".debug"));
}

inline QSettings getSettings()
{
    if (isDebugSettingsNamespace()) {
        return QSettings(kOrganizationName, QString::fromLatin1(kApplicationName) + QStringLiteral("-Debug"));
    }
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace BoxEdit
