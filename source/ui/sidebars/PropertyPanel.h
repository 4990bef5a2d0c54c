#ifndef PROPERTYPANEL_H
#define PROPERTYPANEL_H

// ============================================================================
// PropertyPanel - Editor for the selected element and the current page
// ============================================================================
// Shows geometry, opacity, visibility and lock state of the selected element,
// plus content, font and color for text elements. The page section edits the
// current page's label and note.
//
// Edits are applied through EditorSession as soon as a field changes.
// ============================================================================

#include <QWidget>
#include <QPointer>

class QCheckBox;
class QDoubleSpinBox;
class QFontComboBox;
class QGroupBox;
class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QSlider;
class EditorSession;

class PropertyPanel : public QWidget {
    Q_OBJECT

public:
    explicit PropertyPanel(QWidget* parent = nullptr);

    void setSession(EditorSession* session);

    /**
     * @brief Show an element (empty id = page fields only).
     */
    void setSelection(const QString& pageUid, const QString& elementId);

private slots:
    void onGeometryEdited();
    void onOpacityEdited(int percent);
    void onVisibleToggled(bool visible);
    void onLockedToggled(bool locked);
    void onTextEdited();
    void onTextStyleEdited();
    void onChooseColor();
    void onPageLabelEdited();
    void onPageNoteEdited();

private:
    void setupUI();

    /**
     * @brief Reload every field from the model.
     */
    void refresh();
    void updateColorButton(const QString& color);

    QPointer<EditorSession> m_session;
    QString m_pageUid;
    QString m_elementId;
    bool m_updating = false;    ///< Suppresses edit slots while refreshing

    // ===== Element =====
    QGroupBox* m_elementGroup = nullptr;
    QLabel* m_typeLabel = nullptr;
    QDoubleSpinBox* m_xSpin = nullptr;
    QDoubleSpinBox* m_ySpin = nullptr;
    QDoubleSpinBox* m_widthSpin = nullptr;
    QDoubleSpinBox* m_heightSpin = nullptr;
    QSlider* m_opacitySlider = nullptr;
    QLabel* m_opacityValue = nullptr;
    QCheckBox* m_visibleCheck = nullptr;
    QCheckBox* m_lockedCheck = nullptr;

    // ===== Text =====
    QGroupBox* m_textGroup = nullptr;
    QPlainTextEdit* m_textEdit = nullptr;
    QFontComboBox* m_fontCombo = nullptr;
    QDoubleSpinBox* m_fontSizeSpin = nullptr;
    QPushButton* m_colorButton = nullptr;
    QString m_textColor;

    // ===== Page =====
    QGroupBox* m_pageGroup = nullptr;
    QLineEdit* m_labelEdit = nullptr;
    QPlainTextEdit* m_noteEdit = nullptr;
};

#endif // PROPERTYPANEL_H
