#include "settings/AnnotationSettingsManager.h"
#include "settings/Settings.h"
#include "Constants.h"
#include <QSettings>

namespace {

qreal loadBounded(const QString& key, qreal defaultValue, qreal minValue, qreal maxValue)
{
    auto settings = ArchiNotes::getSettings();
    bool ok = false;
    const qreal value = settings.value(key, defaultValue).toDouble(&ok);
    if (!ok || value < minValue || value > maxValue) {
        return defaultValue;
    }
    return value;
}

} // namespace

AnnotationSettingsManager& AnnotationSettingsManager::instance()
{
    static AnnotationSettingsManager instance;
    return instance;
}

QColor AnnotationSettingsManager::loadColor(const AnnotationProfile& defaults) const
{
    auto settings = ArchiNotes::getSettings();
    const QColor color = settings.value(
        ArchiNotes::annotationSettingsKey(defaults.name, kSettingsKeyColor),
        defaults.defaultColor).value<QColor>();
    return color.isValid() ? color : defaults.defaultColor;
}

void AnnotationSettingsManager::saveColor(const QString& profileName, const QColor& color)
{
    auto settings = ArchiNotes::getSettings();
    settings.setValue(ArchiNotes::annotationSettingsKey(profileName, kSettingsKeyColor), color);
}

qreal AnnotationSettingsManager::loadMarkerWidth(const AnnotationProfile& defaults) const
{
    return loadBounded(ArchiNotes::annotationSettingsKey(defaults.name, kSettingsKeyMarkerWidth),
                       defaults.markerWidth,
                       ArchiNotes::Ink::kMinStrokeWidth, ArchiNotes::Ink::kMaxStrokeWidth);
}

void AnnotationSettingsManager::saveMarkerWidth(const QString& profileName, qreal width)
{
    auto settings = ArchiNotes::getSettings();
    settings.setValue(ArchiNotes::annotationSettingsKey(profileName, kSettingsKeyMarkerWidth), width);
}

qreal AnnotationSettingsManager::loadHighlighterWidth(const AnnotationProfile& defaults) const
{
    return loadBounded(ArchiNotes::annotationSettingsKey(defaults.name, kSettingsKeyHighlighterWidth),
                       defaults.highlighterWidth,
                       ArchiNotes::Ink::kMinStrokeWidth, ArchiNotes::Ink::kMaxStrokeWidth);
}

void AnnotationSettingsManager::saveHighlighterWidth(const QString& profileName, qreal width)
{
    auto settings = ArchiNotes::getSettings();
    settings.setValue(ArchiNotes::annotationSettingsKey(profileName, kSettingsKeyHighlighterWidth), width);
}

qreal AnnotationSettingsManager::loadEraserRadius(const AnnotationProfile& defaults) const
{
    return loadBounded(ArchiNotes::annotationSettingsKey(defaults.name, kSettingsKeyEraserRadius),
                       defaults.eraserRadius,
                       ArchiNotes::Ink::kMinEraserRadius, ArchiNotes::Ink::kMaxEraserRadius);
}

void AnnotationSettingsManager::saveEraserRadius(const QString& profileName, qreal radius)
{
    auto settings = ArchiNotes::getSettings();
    settings.setValue(ArchiNotes::annotationSettingsKey(profileName, kSettingsKeyEraserRadius), radius);
}

AnnotationProfile AnnotationSettingsManager::loadProfile(const AnnotationProfile& defaults) const
{
    AnnotationProfile profile = defaults;
    profile.defaultColor = loadColor(defaults);
    profile.markerWidth = loadMarkerWidth(defaults);
    profile.highlighterWidth = loadHighlighterWidth(defaults);
    profile.eraserRadius = loadEraserRadius(defaults);
    return profile;
}

void AnnotationSettingsManager::resetProfile(const QString& profileName)
{
    auto settings = ArchiNotes::getSettings();
    settings.remove(QStringLiteral("%1/%2")
                        .arg(QString::fromLatin1(ArchiNotes::kSettingsGroupAnnotation), profileName));
}
