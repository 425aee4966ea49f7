#include "FormFillDialog.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QScrollArea>
#include <QVBoxLayout>

FormFillDialog::FormFillDialog(const QVector<PdfFormField>& fields, QWidget* parent)
    : QDialog(parent)
    , m_fields(fields)
{
    setWindowTitle(tr("Fill Form"));
    setModal(true);
    setMinimumSize(420, 320);

    setupUI();
}

void FormFillDialog::setupUI()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(12);
    mainLayout->setContentsMargins(16, 16, 16, 16);

    if (m_fields.isEmpty()) {
        mainLayout->addWidget(new QLabel(tr("This document has no form fields.")));
    }

    QWidget* container = new QWidget();
    QFormLayout* form = new QFormLayout(container);

    for (const PdfFormField& field : m_fields) {
        QWidget* editor = nullptr;

        switch (field.type) {
            case PdfFormField::CheckBox: {
                QCheckBox* box = new QCheckBox();
                box->setChecked(field.value == QLatin1String("true"));
                editor = box;
                break;
            }
            case PdfFormField::RadioButton:
            case PdfFormField::ComboBox:
            case PdfFormField::ListBox: {
                QComboBox* combo = new QComboBox();
                combo->addItems(field.options);
                const int current = field.options.indexOf(field.value);
                combo->setCurrentIndex(current);
                editor = combo;
                break;
            }
            default: {
                QLineEdit* line = new QLineEdit(field.value);
                editor = line;
                break;
            }
        }

        editor->setEnabled(!field.readOnly && field.type != PdfFormField::PushButton
                           && field.type != PdfFormField::Signature);
        form->addRow(field.name + QLatin1Char(':'), editor);
        m_editors.append(editor);
    }

    QScrollArea* scroll = new QScrollArea();
    scroll->setWidgetResizable(true);
    scroll->setWidget(container);
    mainLayout->addWidget(scroll, 1);

    QDialogButtonBox* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

QString FormFillDialog::valueOf(int row) const
{
    QWidget* editor = m_editors.at(row);
    if (auto* box = qobject_cast<QCheckBox*>(editor)) {
        return box->isChecked() ? QStringLiteral("true") : QStringLiteral("false");
    }
    if (auto* combo = qobject_cast<QComboBox*>(editor)) {
        return combo->currentText();
    }
    if (auto* line = qobject_cast<QLineEdit*>(editor)) {
        return line->text();
    }
    return m_fields.at(row).value;
}

QMap<QString, QString> FormFillDialog::changedValues() const
{
    QMap<QString, QString> values;
    for (int i = 0; i < m_fields.size(); ++i) {
        if (!m_editors.at(i)->isEnabled()) {
            continue;
        }
        const QString value = valueOf(i);
        if (value != m_fields.at(i).value) {
            values.insert(m_fields.at(i).name, value);
        }
    }
    return values;
}
