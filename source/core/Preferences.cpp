// ============================================================================
// Preferences - Implementation
// ============================================================================

#include "Preferences.h"

#include <QtGlobal>

void Preferences::normalize()
{
    if (theme != QLatin1String("light") && theme != QLatin1String("dark")
        && theme != QLatin1String("system")) {
        theme = QStringLiteral("system");
    }
    thumbnailSize = qBound(MIN_THUMBNAIL_SIZE, thumbnailSize, MAX_THUMBNAIL_SIZE);
    defaultPageWidth = qBound(MIN_PAGE_DIMENSION, defaultPageWidth, MAX_PAGE_DIMENSION);
    defaultPageHeight = qBound(MIN_PAGE_DIMENSION, defaultPageHeight, MAX_PAGE_DIMENSION);
    autosaveIntervalSec = qBound(0, autosaveIntervalSec, MAX_AUTOSAVE_INTERVAL_SEC);
}

Preferences Preferences::load(QSettings& settings)
{
    Preferences prefs;
    bool ok = false;

    prefs.theme = settings.value(KEY_THEME, prefs.theme).toString();

    int thumb = settings.value(KEY_THUMBNAIL_SIZE, prefs.thumbnailSize).toInt(&ok);
    if (ok) prefs.thumbnailSize = thumb;

    qreal width = settings.value(KEY_PAGE_WIDTH, prefs.defaultPageWidth).toDouble(&ok);
    if (ok) prefs.defaultPageWidth = width;

    qreal height = settings.value(KEY_PAGE_HEIGHT, prefs.defaultPageHeight).toDouble(&ok);
    if (ok) prefs.defaultPageHeight = height;

    int interval = settings.value(KEY_AUTOSAVE_INTERVAL, prefs.autosaveIntervalSec).toInt(&ok);
    if (ok) prefs.autosaveIntervalSec = interval;

    prefs.normalize();
    return prefs;
}

void Preferences::save(QSettings& settings) const
{
    settings.setValue(KEY_THEME, theme);
    settings.setValue(KEY_THUMBNAIL_SIZE, thumbnailSize);
    settings.setValue(KEY_PAGE_WIDTH, defaultPageWidth);
    settings.setValue(KEY_PAGE_HEIGHT, defaultPageHeight);
    settings.setValue(KEY_AUTOSAVE_INTERVAL, autosaveIntervalSec);
}
