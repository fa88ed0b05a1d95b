#pragma once

#include <QSettings>
#include <QString>
#include "version.h"

namespace ArchiNotes {

inline constexpr const char* kOrganizationName = ARCHINOTES_ORGANIZATION_NAME;
inline constexpr const char* kApplicationName = ARCHINOTES_APP_NAME;

// Group prefix for per-profile annotation preferences
inline constexpr const char* kSettingsGroupAnnotation = "annotation";

inline QString annotationSettingsKey(const QString& profileName, const char* key)
{
    return QStringLiteral("%1/%2/%3")
        .arg(QString::fromLatin1(kSettingsGroupAnnotation), profileName, QString::fromLatin1(key));
}

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace ArchiNotes
