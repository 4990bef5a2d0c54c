#pragma once

// ============================================================================
// Preferences - User-adjustable application settings
// ============================================================================
// Constructed once in main(), loaded from QSettings and passed by reference
// to whoever needs it. There is no global instance.
// ============================================================================

#include <QSettings>
#include <QSizeF>
#include <QString>

struct Preferences {
    // ===== Keys =====
    static constexpr const char* KEY_THEME = "theme";
    static constexpr const char* KEY_THUMBNAIL_SIZE = "thumbnailSize";
    static constexpr const char* KEY_PAGE_WIDTH = "defaultPageWidth";
    static constexpr const char* KEY_PAGE_HEIGHT = "defaultPageHeight";
    static constexpr const char* KEY_AUTOSAVE_INTERVAL = "autosaveIntervalSec";

    // ===== Limits =====
    static constexpr int MIN_THUMBNAIL_SIZE = 60;
    static constexpr int MAX_THUMBNAIL_SIZE = 400;
    static constexpr qreal MIN_PAGE_DIMENSION = 36.0;   ///< Half an inch
    static constexpr qreal MAX_PAGE_DIMENSION = 14400.0;
    static constexpr int MAX_AUTOSAVE_INTERVAL_SEC = 24 * 60 * 60;

    QString theme = QStringLiteral("system");  ///< "light", "dark" or "system"
    int thumbnailSize = 120;                   ///< Thumbnail width in pixels
    qreal defaultPageWidth = 595.0;            ///< Points, A4
    qreal defaultPageHeight = 842.0;
    int autosaveIntervalSec = 120;             ///< 0 disables autosave

    QSizeF defaultPageSize() const { return QSizeF(defaultPageWidth, defaultPageHeight); }

    /**
     * @brief Clamp every field into its valid range.
     *
     * Unknown theme names fall back to "system".
     */
    void normalize();

    /**
     * @brief Read preferences; missing or invalid values keep their defaults.
     */
    static Preferences load(QSettings& settings);

    void save(QSettings& settings) const;
};
