#ifndef ANNOTATIONSETTINGSMANAGER_H
#define ANNOTATIONSETTINGSMANAGER_H

#include <QColor>
#include <QString>

#include "annotation/AnnotationProfile.h"

/**
 * @brief Singleton class for managing annotation settings.
 *
 * Preferences are stored per profile ("markup", "whiteboard") so the two
 * surfaces keep independent colors, widths and eraser radii. Missing or
 * out-of-range values fall back to the profile preset.
 */
class AnnotationSettingsManager
{
public:
    static AnnotationSettingsManager& instance();

    // Color settings
    QColor loadColor(const AnnotationProfile& defaults) const;
    void saveColor(const QString& profileName, const QColor& color);

    // Width settings
    qreal loadMarkerWidth(const AnnotationProfile& defaults) const;
    void saveMarkerWidth(const QString& profileName, qreal width);

    qreal loadHighlighterWidth(const AnnotationProfile& defaults) const;
    void saveHighlighterWidth(const QString& profileName, qreal width);

    // Eraser settings
    qreal loadEraserRadius(const AnnotationProfile& defaults) const;
    void saveEraserRadius(const QString& profileName, qreal radius);

    /**
     * @brief Preset with any stored preferences applied on top.
     */
    AnnotationProfile loadProfile(const AnnotationProfile& defaults) const;

    /**
     * @brief Remove every stored preference of one profile.
     */
    void resetProfile(const QString& profileName);

private:
    AnnotationSettingsManager() = default;
    AnnotationSettingsManager(const AnnotationSettingsManager&) = delete;
    AnnotationSettingsManager& operator=(const AnnotationSettingsManager&) = delete;

    static constexpr const char* kSettingsKeyColor = "color";
    static constexpr const char* kSettingsKeyMarkerWidth = "markerWidth";
    static constexpr const char* kSettingsKeyHighlighterWidth = "highlighterWidth";
    static constexpr const char* kSettingsKeyEraserRadius = "eraserRadius";
};

#endif // ANNOTATIONSETTINGSMANAGER_H
