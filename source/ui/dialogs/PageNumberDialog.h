#pragma once

// ============================================================================
// PageNumberDialog - Options for adding page numbers
// ============================================================================

#include "../../core/EditorSession.h"

#include <QDialog>

class QComboBox;
class QDoubleSpinBox;
class QSpinBox;

class PageNumberDialog : public QDialog
{
    Q_OBJECT

public:
    explicit PageNumberDialog(QWidget* parent = nullptr);

    PageNumberOptions options() const;

private:
    QComboBox* m_positionCombo = nullptr;
    QComboBox* m_formatCombo = nullptr;
    QDoubleSpinBox* m_fontSizeSpin = nullptr;
    QSpinBox* m_startSpin = nullptr;
};
