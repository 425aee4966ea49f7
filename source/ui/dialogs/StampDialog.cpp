#include "StampDialog.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QVBoxLayout>

StampDialog::StampDialog(QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Add Stamp"));
    setModal(true);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    QFormLayout* form = new QFormLayout();

    m_textCombo = new QComboBox();
    m_textCombo->setEditable(true);
    m_textCombo->addItems(presetTexts());
    form->addRow(tr("Text:"), m_textCombo);

    m_colorCombo = new QComboBox();
    m_colorCombo->addItem(tr("Red"), QColor::fromRgbF(0.8f, 0.0f, 0.0f));
    m_colorCombo->addItem(tr("Blue"), QColor::fromRgbF(0.0f, 0.0f, 0.7f));
    m_colorCombo->addItem(tr("Gray"), QColor::fromRgbF(0.5f, 0.5f, 0.5f));
    form->addRow(tr("Color:"), m_colorCombo);

    m_allPagesCheck = new QCheckBox(tr("Apply to all pages"));
    form->addRow(QString(), m_allPagesCheck);

    mainLayout->addLayout(form);

    QDialogButtonBox* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

QStringList StampDialog::presetTexts()
{
    return {
        QStringLiteral("DRAFT"),
        QStringLiteral("CONFIDENTIAL"),
        QStringLiteral("PAST DUE"),
        QStringLiteral("APPROVED"),
        QStringLiteral("REJECTED")
    };
}

QString StampDialog::stampText() const
{
    return m_textCombo->currentText().trimmed();
}

QColor StampDialog::stampColor() const
{
    return m_colorCombo->currentData().value<QColor>();
}

bool StampDialog::allPages() const
{
    return m_allPagesCheck->isChecked();
}
