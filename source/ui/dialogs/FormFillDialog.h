#pragma once

// ============================================================================
// FormFillDialog - Edit the AcroForm fields of the active document
// ============================================================================
// One row per field: a line edit for text fields, a check box for check
// boxes, a combo box for dropdowns and radio groups. Read-only fields and
// push buttons are shown disabled.
// ============================================================================

#include "../../pdf/PdfEngine.h"

#include <QDialog>
#include <QMap>
#include <QVector>

class QWidget;

/**
 * @brief Dialog listing form fields with editors for their values.
 *
 * Usage:
 * @code
 * FormFillDialog dialog(editor->formFields(), this);
 * if (dialog.exec() == QDialog::Accepted) {
 *     editor->fillForm(dialog.changedValues());
 * }
 * @endcode
 */
class FormFillDialog : public QDialog
{
    Q_OBJECT

public:
    explicit FormFillDialog(const QVector<PdfFormField>& fields, QWidget* parent = nullptr);

    /**
     * @brief Values that differ from the ones the dialog was opened with.
     * @return Field name -> new value ("true"/"false" for check boxes).
     */
    QMap<QString, QString> changedValues() const;

private:
    void setupUI();
    QString valueOf(int row) const;

    QVector<PdfFormField> m_fields;
    QVector<QWidget*> m_editors;    ///< Parallel to m_fields
};
