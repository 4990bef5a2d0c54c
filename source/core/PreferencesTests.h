#pragma once

// ============================================================================
// PreferencesTests - Unit tests for Preferences load/save
// ============================================================================

#include "Preferences.h"
#include <QDebug>
#include <QTemporaryDir>
#include <climits>

namespace PreferencesTests {

inline bool testDefaults()
{
    qDebug() << "=== Test: Preferences Defaults ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    QSettings settings(dir.filePath(QStringLiteral("empty.ini")), QSettings::IniFormat);
    Preferences prefs = Preferences::load(settings);

    if (prefs.theme != QLatin1String("system") || prefs.thumbnailSize != 120
        || prefs.defaultPageSize() != QSizeF(595, 842) || prefs.autosaveIntervalSec != 120) {
        qDebug() << "FAIL: empty settings should give the defaults";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Missing keys keep their defaults";
    }
    return success;
}

inline bool testRoundTrip()
{
    qDebug() << "=== Test: Preferences Save/Load ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    const QString path = dir.filePath(QStringLiteral("prefs.ini"));

    Preferences saved;
    saved.theme = QStringLiteral("dark");
    saved.thumbnailSize = 200;
    saved.defaultPageWidth = 612;
    saved.defaultPageHeight = 792;
    saved.autosaveIntervalSec = 0;
    {
        QSettings settings(path, QSettings::IniFormat);
        saved.save(settings);
        settings.sync();
    }

    QSettings settings(path, QSettings::IniFormat);
    Preferences loaded = Preferences::load(settings);
    if (loaded.theme != QLatin1String("dark") || loaded.thumbnailSize != 200
        || loaded.defaultPageSize() != QSizeF(612, 792) || loaded.autosaveIntervalSec != 0) {
        qDebug() << "FAIL: values did not survive save/load";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Preferences persist through QSettings";
    }
    return success;
}

inline bool testClamping()
{
    qDebug() << "=== Test: Preferences Clamping ===";
    bool success = true;

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: could not create temp dir";
        return false;
    }
    QSettings settings(dir.filePath(QStringLiteral("bad.ini")), QSettings::IniFormat);
    settings.setValue(Preferences::KEY_THEME, QStringLiteral("neon"));
    settings.setValue(Preferences::KEY_THUMBNAIL_SIZE, 5000);
    settings.setValue(Preferences::KEY_PAGE_WIDTH, 1);
    settings.setValue(Preferences::KEY_PAGE_HEIGHT, QStringLiteral("tall"));
    settings.setValue(Preferences::KEY_AUTOSAVE_INTERVAL, -30);

    Preferences prefs = Preferences::load(settings);
    if (prefs.theme != QLatin1String("system")) {
        qDebug() << "FAIL: unknown theme should fall back to system";
        success = false;
    }
    if (prefs.thumbnailSize != Preferences::MAX_THUMBNAIL_SIZE) {
        qDebug() << "FAIL: thumbnail size not clamped:" << prefs.thumbnailSize;
        success = false;
    }
    if (prefs.defaultPageWidth != Preferences::MIN_PAGE_DIMENSION) {
        qDebug() << "FAIL: page width not clamped:" << prefs.defaultPageWidth;
        success = false;
    }
    if (prefs.defaultPageHeight != 842.0) {
        qDebug() << "FAIL: unparsable height should keep the default:" << prefs.defaultPageHeight;
        success = false;
    }
    if (prefs.autosaveIntervalSec != 0) {
        qDebug() << "FAIL: negative interval should clamp to 0";
        success = false;
    }

    // Milliseconds of the largest interval must still fit a QTimer interval
    settings.setValue(Preferences::KEY_AUTOSAVE_INTERVAL, 3000000);
    Preferences huge = Preferences::load(settings);
    if (huge.autosaveIntervalSec != Preferences::MAX_AUTOSAVE_INTERVAL_SEC
        || static_cast<qint64>(huge.autosaveIntervalSec) * 1000 > INT_MAX) {
        qDebug() << "FAIL: huge interval not clamped:" << huge.autosaveIntervalSec;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: Invalid values are clamped or ignored";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Preferences Unit Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testDefaults();
    allPass &= testRoundTrip();
    allPass &= testClamping();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace PreferencesTests
