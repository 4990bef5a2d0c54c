#ifndef PREFERENCESDIALOG_H
#define PREFERENCESDIALOG_H

#include "../../core/Preferences.h"

#include <QDialog>

class QComboBox;
class QDoubleSpinBox;
class QSpinBox;

/**
 * @brief Dialog for editing Preferences.
 *
 * Works on a copy: the caller reads preferences() after exec() returns
 * QDialog::Accepted and decides what to apply and persist.
 *
 * Sections:
 * - Appearance: theme, thumbnail width
 * - New pages: default page size (presets or custom)
 * - Autosave: interval in seconds (0 = off)
 */
class PreferencesDialog : public QDialog {
    Q_OBJECT

public:
    explicit PreferencesDialog(const Preferences& preferences, QWidget* parent = nullptr);

    /**
     * @brief The edited preferences, normalized.
     */
    Preferences preferences() const;

private slots:
    void onPageSizePresetChanged(int index);
    void onPageDimensionEdited();
    void restoreDefaults();

private:
    void setupUI();
    void loadValues(const Preferences& preferences);

    /**
     * @brief Select the preset matching the current dimensions, or "Custom".
     */
    void syncPresetCombo();

    QComboBox* m_themeCombo = nullptr;
    QSpinBox* m_thumbnailSpin = nullptr;
    QComboBox* m_pageSizeCombo = nullptr;
    QDoubleSpinBox* m_pageWidthSpin = nullptr;
    QDoubleSpinBox* m_pageHeightSpin = nullptr;
    QSpinBox* m_autosaveSpin = nullptr;

    bool m_syncing = false;
};

#endif // PREFERENCESDIALOG_H
