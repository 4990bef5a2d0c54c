// ============================================================================
// PropertyPanel Implementation
// ============================================================================

#include "PropertyPanel.h"
#include "../../core/EditorSession.h"
#include "../../objects/TextElement.h"

#include <QCheckBox>
#include <QColorDialog>
#include <QDoubleSpinBox>
#include <QFontComboBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QSlider>
#include <QVBoxLayout>

// ============================================================================
// Constructor
// ============================================================================

PropertyPanel::PropertyPanel(QWidget* parent)
    : QWidget(parent)
{
    setupUI();
    refresh();
}

// ============================================================================
// Setup
// ============================================================================

void PropertyPanel::setupUI()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(4, 4, 4, 4);
    mainLayout->setSpacing(6);

    auto makeSpin = [this](double min, double max) {
        QDoubleSpinBox* spin = new QDoubleSpinBox(this);
        spin->setRange(min, max);
        spin->setDecimals(1);
        spin->setKeyboardTracking(false);
        connect(spin, &QDoubleSpinBox::valueChanged, this, &PropertyPanel::onGeometryEdited);
        return spin;
    };

    // Element
    m_elementGroup = new QGroupBox(tr("Element"), this);
    QFormLayout* elementForm = new QFormLayout(m_elementGroup);
    m_typeLabel = new QLabel(m_elementGroup);
    elementForm->addRow(tr("Type:"), m_typeLabel);

    m_xSpin = makeSpin(-100000.0, 100000.0);
    m_ySpin = makeSpin(-100000.0, 100000.0);
    m_widthSpin = makeSpin(PageElement::MIN_DIMENSION, 100000.0);
    m_heightSpin = makeSpin(PageElement::MIN_DIMENSION, 100000.0);
    elementForm->addRow(tr("X:"), m_xSpin);
    elementForm->addRow(tr("Y:"), m_ySpin);
    elementForm->addRow(tr("Width:"), m_widthSpin);
    elementForm->addRow(tr("Height:"), m_heightSpin);

    QHBoxLayout* opacityLayout = new QHBoxLayout();
    m_opacitySlider = new QSlider(Qt::Horizontal, m_elementGroup);
    m_opacitySlider->setRange(0, 100);
    m_opacityValue = new QLabel(m_elementGroup);
    m_opacityValue->setMinimumWidth(36);
    opacityLayout->addWidget(m_opacitySlider, 1);
    opacityLayout->addWidget(m_opacityValue);
    elementForm->addRow(tr("Opacity:"), opacityLayout);
    connect(m_opacitySlider, &QSlider::valueChanged, this, &PropertyPanel::onOpacityEdited);

    m_visibleCheck = new QCheckBox(tr("Visible"), m_elementGroup);
    m_lockedCheck = new QCheckBox(tr("Locked"), m_elementGroup);
    elementForm->addRow(m_visibleCheck);
    elementForm->addRow(m_lockedCheck);
    connect(m_visibleCheck, &QCheckBox::toggled, this, &PropertyPanel::onVisibleToggled);
    connect(m_lockedCheck, &QCheckBox::toggled, this, &PropertyPanel::onLockedToggled);

    mainLayout->addWidget(m_elementGroup);

    // Text
    m_textGroup = new QGroupBox(tr("Text"), this);
    QFormLayout* textForm = new QFormLayout(m_textGroup);
    m_textEdit = new QPlainTextEdit(m_textGroup);
    m_textEdit->setMaximumHeight(90);
    textForm->addRow(m_textEdit);
    connect(m_textEdit, &QPlainTextEdit::textChanged, this, &PropertyPanel::onTextEdited);

    m_fontCombo = new QFontComboBox(m_textGroup);
    textForm->addRow(tr("Font:"), m_fontCombo);
    connect(m_fontCombo, &QFontComboBox::currentFontChanged, this, &PropertyPanel::onTextStyleEdited);

    m_fontSizeSpin = new QDoubleSpinBox(m_textGroup);
    m_fontSizeSpin->setRange(TextElement::MIN_FONT_SIZE, 500.0);
    m_fontSizeSpin->setDecimals(1);
    m_fontSizeSpin->setKeyboardTracking(false);
    textForm->addRow(tr("Size:"), m_fontSizeSpin);
    connect(m_fontSizeSpin, &QDoubleSpinBox::valueChanged, this, &PropertyPanel::onTextStyleEdited);

    m_colorButton = new QPushButton(m_textGroup);
    m_colorButton->setFixedHeight(24);
    textForm->addRow(tr("Color:"), m_colorButton);
    connect(m_colorButton, &QPushButton::clicked, this, &PropertyPanel::onChooseColor);

    mainLayout->addWidget(m_textGroup);

    // Page
    m_pageGroup = new QGroupBox(tr("Page"), this);
    QFormLayout* pageForm = new QFormLayout(m_pageGroup);
    m_labelEdit = new QLineEdit(m_pageGroup);
    m_labelEdit->setPlaceholderText(tr("Label"));
    pageForm->addRow(tr("Label:"), m_labelEdit);
    connect(m_labelEdit, &QLineEdit::editingFinished, this, &PropertyPanel::onPageLabelEdited);

    m_noteEdit = new QPlainTextEdit(m_pageGroup);
    m_noteEdit->setMaximumHeight(120);
    m_noteEdit->setPlaceholderText(tr("Notes are kept with the session and never exported"));
    pageForm->addRow(tr("Note:"), m_noteEdit);
    connect(m_noteEdit, &QPlainTextEdit::textChanged, this, &PropertyPanel::onPageNoteEdited);

    mainLayout->addWidget(m_pageGroup);
    mainLayout->addStretch();
}

// ============================================================================
// Session / Selection
// ============================================================================

void PropertyPanel::setSession(EditorSession* session)
{
    if (m_session == session) {
        return;
    }
    if (m_session) {
        disconnect(m_session, nullptr, this, nullptr);
    }
    m_session = session;
    m_pageUid.clear();
    m_elementId.clear();

    if (m_session) {
        connect(m_session, &EditorSession::elementChanged, this,
                [this](const QString& pageUid, const QString& elementId) {
                    if (pageUid == m_pageUid && elementId == m_elementId) {
                        refresh();
                    }
                });
        connect(m_session, &EditorSession::pageContentChanged, this, [this](const QString& pageUid) {
            if (pageUid == m_pageUid) {
                refresh();
            }
        });
        connect(m_session, &EditorSession::pagesChanged, this, &PropertyPanel::refresh);
        connect(m_session, &EditorSession::documentReplaced, this, [this]() {
            setSelection(QString(), QString());
        });
    }
    refresh();
}

void PropertyPanel::setSelection(const QString& pageUid, const QString& elementId)
{
    m_pageUid = pageUid;
    m_elementId = elementId;
    refresh();
}

// ============================================================================
// Refresh
// ============================================================================

void PropertyPanel::refresh()
{
    m_updating = true;

    Page* page = (m_session && m_session->document())
                     ? m_session->document()->findPageById(m_pageUid) : nullptr;
    PageElement* element = page ? page->findElement(m_elementId) : nullptr;
    const TextElement* text = (element && element->kind() == PageElement::Kind::Text)
                                  ? static_cast<const TextElement*>(element) : nullptr;

    m_pageGroup->setEnabled(page != nullptr);
    if (page) {
        if (m_labelEdit->text() != page->label) {
            m_labelEdit->setText(page->label);
        }
        if (m_noteEdit->toPlainText() != page->note) {
            m_noteEdit->setPlainText(page->note);
        }
    } else {
        m_labelEdit->clear();
        m_noteEdit->clear();
    }

    m_elementGroup->setVisible(element != nullptr);
    if (element) {
        m_typeLabel->setText(element->kind() == PageElement::Kind::Image ? tr("Image") : tr("Text"));
        m_xSpin->setValue(element->rect.x());
        m_ySpin->setValue(element->rect.y());
        m_widthSpin->setValue(element->rect.width());
        m_heightSpin->setValue(element->rect.height());
        const int percent = qRound(element->opacity * 100.0);
        m_opacitySlider->setValue(percent);
        m_opacityValue->setText(QString::number(percent) + QLatin1Char('%'));
        m_visibleCheck->setChecked(element->visible);
        m_lockedCheck->setChecked(element->locked);
    }

    m_textGroup->setVisible(text != nullptr);
    if (text) {
        if (m_textEdit->toPlainText() != text->text) {
            m_textEdit->setPlainText(text->text);
        }
        m_fontCombo->setCurrentFont(QFont(text->fontFamily));
        m_fontSizeSpin->setValue(text->fontSize);
        m_textColor = text->color;
        updateColorButton(text->color);
    }

    m_updating = false;
}

void PropertyPanel::updateColorButton(const QString& color)
{
    const QColor rgb = TextElement::parseHexColor(color);
    m_colorButton->setText(rgb.name());
    m_colorButton->setStyleSheet(QString("background-color: %1; color: %2;")
                                     .arg(rgb.name(), rgb.lightness() < 128 ? "white" : "black"));
}

// ============================================================================
// Edit Slots
// ============================================================================

void PropertyPanel::onGeometryEdited()
{
    if (m_updating || !m_session || m_elementId.isEmpty()) {
        return;
    }
    m_session->setElementGeometry(m_pageUid, m_elementId,
                                  QRectF(m_xSpin->value(), m_ySpin->value(),
                                         m_widthSpin->value(), m_heightSpin->value()));
}

void PropertyPanel::onOpacityEdited(int percent)
{
    m_opacityValue->setText(QString::number(percent) + QLatin1Char('%'));
    if (m_updating || !m_session || m_elementId.isEmpty()) {
        return;
    }
    m_session->setElementOpacity(m_pageUid, m_elementId, percent / 100.0);
}

void PropertyPanel::onVisibleToggled(bool visible)
{
    if (!m_updating && m_session && !m_elementId.isEmpty()) {
        m_session->setElementVisible(m_pageUid, m_elementId, visible);
    }
}

void PropertyPanel::onLockedToggled(bool locked)
{
    if (!m_updating && m_session && !m_elementId.isEmpty()) {
        m_session->setElementLocked(m_pageUid, m_elementId, locked);
    }
}

void PropertyPanel::onTextEdited()
{
    if (!m_updating && m_session && !m_elementId.isEmpty()) {
        m_session->setTextContent(m_pageUid, m_elementId, m_textEdit->toPlainText());
    }
}

void PropertyPanel::onTextStyleEdited()
{
    if (m_updating || !m_session || m_elementId.isEmpty()) {
        return;
    }
    m_session->setTextStyle(m_pageUid, m_elementId, m_fontCombo->currentFont().family(),
                            m_fontSizeSpin->value(), m_textColor);
}

void PropertyPanel::onChooseColor()
{
    if (!m_session || m_elementId.isEmpty()) {
        return;
    }
    const QColor chosen = QColorDialog::getColor(TextElement::parseHexColor(m_textColor),
                                                 this, tr("Text Color"));
    if (!chosen.isValid()) {
        return;
    }
    m_textColor = chosen.name();
    updateColorButton(m_textColor);
    onTextStyleEdited();
}

void PropertyPanel::onPageLabelEdited()
{
    if (!m_updating && m_session && !m_pageUid.isEmpty()) {
        m_session->setPageLabel(m_pageUid, m_labelEdit->text());
    }
}

void PropertyPanel::onPageNoteEdited()
{
    if (!m_updating && m_session && !m_pageUid.isEmpty()) {
        m_session->setPageNote(m_pageUid, m_noteEdit->toPlainText());
    }
}
