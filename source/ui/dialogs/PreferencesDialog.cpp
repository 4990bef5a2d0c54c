#include "PreferencesDialog.h"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QPushButton>
#include <QSpinBox>
#include <QVBoxLayout>

namespace {

struct PageSizePreset {
    const char* name;
    qreal width;
    qreal height;
};

// Points
const PageSizePreset PAGE_SIZE_PRESETS[] = {
    { QT_TRANSLATE_NOOP("PreferencesDialog", "A4 (595 × 842)"), 595.0, 842.0 },
    { QT_TRANSLATE_NOOP("PreferencesDialog", "A5 (420 × 595)"), 420.0, 595.0 },
    { QT_TRANSLATE_NOOP("PreferencesDialog", "US Letter (612 × 792)"), 612.0, 792.0 },
    { QT_TRANSLATE_NOOP("PreferencesDialog", "US Legal (612 × 1008)"), 612.0, 1008.0 },
};

constexpr int PRESET_COUNT = sizeof(PAGE_SIZE_PRESETS) / sizeof(PAGE_SIZE_PRESETS[0]);

}

// ============================================================================
// Construction
// ============================================================================

PreferencesDialog::PreferencesDialog(const Preferences& preferences, QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Preferences"));
    setModal(true);
    setMinimumWidth(380);

    setupUI();
    loadValues(preferences);
}

// ============================================================================
// UI Setup
// ============================================================================

void PreferencesDialog::setupUI()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(12);
    mainLayout->setContentsMargins(16, 16, 16, 16);

    // ===== Appearance =====
    QGroupBox* appearanceGroup = new QGroupBox(tr("Appearance"));
    QFormLayout* appearanceForm = new QFormLayout(appearanceGroup);

    m_themeCombo = new QComboBox();
    m_themeCombo->addItem(tr("Follow system"), QStringLiteral("system"));
    m_themeCombo->addItem(tr("Light"), QStringLiteral("light"));
    m_themeCombo->addItem(tr("Dark"), QStringLiteral("dark"));
    appearanceForm->addRow(tr("Theme:"), m_themeCombo);

    m_thumbnailSpin = new QSpinBox();
    m_thumbnailSpin->setRange(Preferences::MIN_THUMBNAIL_SIZE, Preferences::MAX_THUMBNAIL_SIZE);
    m_thumbnailSpin->setSuffix(tr(" px"));
    appearanceForm->addRow(tr("Thumbnail width:"), m_thumbnailSpin);

    mainLayout->addWidget(appearanceGroup);

    // ===== New Pages =====
    QGroupBox* pageGroup = new QGroupBox(tr("New Pages"));
    QFormLayout* pageForm = new QFormLayout(pageGroup);

    m_pageSizeCombo = new QComboBox();
    for (int i = 0; i < PRESET_COUNT; ++i) {
        m_pageSizeCombo->addItem(tr(PAGE_SIZE_PRESETS[i].name));
    }
    m_pageSizeCombo->addItem(tr("Custom"));
    pageForm->addRow(tr("Page size:"), m_pageSizeCombo);
    connect(m_pageSizeCombo, &QComboBox::currentIndexChanged,
            this, &PreferencesDialog::onPageSizePresetChanged);

    m_pageWidthSpin = new QDoubleSpinBox();
    m_pageHeightSpin = new QDoubleSpinBox();
    for (QDoubleSpinBox* spin : { m_pageWidthSpin, m_pageHeightSpin }) {
        spin->setRange(Preferences::MIN_PAGE_DIMENSION, Preferences::MAX_PAGE_DIMENSION);
        spin->setDecimals(1);
        spin->setSuffix(tr(" pt"));
        connect(spin, &QDoubleSpinBox::valueChanged, this, &PreferencesDialog::onPageDimensionEdited);
    }
    pageForm->addRow(tr("Width:"), m_pageWidthSpin);
    pageForm->addRow(tr("Height:"), m_pageHeightSpin);

    mainLayout->addWidget(pageGroup);

    // ===== Autosave =====
    QGroupBox* autosaveGroup = new QGroupBox(tr("Autosave"));
    QFormLayout* autosaveForm = new QFormLayout(autosaveGroup);

    m_autosaveSpin = new QSpinBox();
    m_autosaveSpin->setRange(0, Preferences::MAX_AUTOSAVE_INTERVAL_SEC);
    m_autosaveSpin->setSuffix(tr(" s"));
    m_autosaveSpin->setSpecialValueText(tr("Off"));
    autosaveForm->addRow(tr("Interval:"), m_autosaveSpin);

    mainLayout->addWidget(autosaveGroup);
    mainLayout->addStretch();

    // ===== Buttons =====
    QDialogButtonBox* buttons = new QDialogButtonBox(
        QDialogButtonBox::Ok | QDialogButtonBox::Cancel | QDialogButtonBox::RestoreDefaults);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(buttons->button(QDialogButtonBox::RestoreDefaults), &QPushButton::clicked,
            this, &PreferencesDialog::restoreDefaults);
    mainLayout->addWidget(buttons);
}

void PreferencesDialog::loadValues(const Preferences& preferences)
{
    const int themeIndex = m_themeCombo->findData(preferences.theme);
    m_themeCombo->setCurrentIndex(themeIndex >= 0 ? themeIndex : 0);
    m_thumbnailSpin->setValue(preferences.thumbnailSize);

    m_syncing = true;
    m_pageWidthSpin->setValue(preferences.defaultPageWidth);
    m_pageHeightSpin->setValue(preferences.defaultPageHeight);
    m_syncing = false;
    syncPresetCombo();

    m_autosaveSpin->setValue(preferences.autosaveIntervalSec);
}

// ============================================================================
// Page Size
// ============================================================================

void PreferencesDialog::onPageSizePresetChanged(int index)
{
    if (m_syncing || index < 0 || index >= PRESET_COUNT) {
        return;  // "Custom" keeps the current values
    }
    m_syncing = true;
    m_pageWidthSpin->setValue(PAGE_SIZE_PRESETS[index].width);
    m_pageHeightSpin->setValue(PAGE_SIZE_PRESETS[index].height);
    m_syncing = false;
}

void PreferencesDialog::onPageDimensionEdited()
{
    if (!m_syncing) {
        syncPresetCombo();
    }
}

void PreferencesDialog::syncPresetCombo()
{
    int match = PRESET_COUNT;
    for (int i = 0; i < PRESET_COUNT; ++i) {
        if (qFuzzyCompare(m_pageWidthSpin->value(), PAGE_SIZE_PRESETS[i].width) &&
            qFuzzyCompare(m_pageHeightSpin->value(), PAGE_SIZE_PRESETS[i].height)) {
            match = i;
            break;
        }
    }
    m_syncing = true;
    m_pageSizeCombo->setCurrentIndex(match);
    m_syncing = false;
}

void PreferencesDialog::restoreDefaults()
{
    loadValues(Preferences());
}

// ============================================================================
// Result
// ============================================================================

Preferences PreferencesDialog::preferences() const
{
    Preferences result;
    result.theme = m_themeCombo->currentData().toString();
    result.thumbnailSize = m_thumbnailSpin->value();
    result.defaultPageWidth = m_pageWidthSpin->value();
    result.defaultPageHeight = m_pageHeightSpin->value();
    result.autosaveIntervalSec = m_autosaveSpin->value();
    result.normalize();
    return result;
}
