#pragma once

// ============================================================================
// StampDialog - Choose a watermark stamp
// ============================================================================

#include <QColor>
#include <QDialog>

class QCheckBox;
class QComboBox;

class StampDialog : public QDialog
{
    Q_OBJECT

public:
    explicit StampDialog(QWidget* parent = nullptr);

    QString stampText() const;
    QColor stampColor() const;
    bool allPages() const;

    /// Stamp texts offered in the list (the field also accepts custom text).
    static QStringList presetTexts();

private:
    QComboBox* m_textCombo = nullptr;
    QComboBox* m_colorCombo = nullptr;
    QCheckBox* m_allPagesCheck = nullptr;
};
