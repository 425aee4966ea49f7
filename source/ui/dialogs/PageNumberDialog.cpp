#include "PageNumberDialog.h"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QSpinBox>
#include <QVBoxLayout>

PageNumberDialog::PageNumberDialog(QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Add Page Numbers"));
    setModal(true);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    QFormLayout* form = new QFormLayout();

    m_positionCombo = new QComboBox();
    m_positionCombo->addItem(tr("Bottom left"), PageNumberOptions::BottomLeft);
    m_positionCombo->addItem(tr("Bottom center"), PageNumberOptions::BottomCenter);
    m_positionCombo->addItem(tr("Bottom right"), PageNumberOptions::BottomRight);
    m_positionCombo->addItem(tr("Top left"), PageNumberOptions::TopLeft);
    m_positionCombo->addItem(tr("Top center"), PageNumberOptions::TopCenter);
    m_positionCombo->addItem(tr("Top right"), PageNumberOptions::TopRight);
    m_positionCombo->setCurrentIndex(1);
    form->addRow(tr("Position:"), m_positionCombo);

    m_formatCombo = new QComboBox();
    m_formatCombo->addItem(QStringLiteral("1, 2, 3"), PageNumberOptions::Plain);
    m_formatCombo->addItem(QStringLiteral("- 1 -"), PageNumberOptions::Dashed);
    m_formatCombo->addItem(tr("Page 1 of N"), PageNumberOptions::PageOfTotal);
    form->addRow(tr("Format:"), m_formatCombo);

    m_fontSizeSpin = new QDoubleSpinBox();
    m_fontSizeSpin->setRange(6.0, 48.0);
    m_fontSizeSpin->setValue(10.0);
    form->addRow(tr("Font size:"), m_fontSizeSpin);

    m_startSpin = new QSpinBox();
    m_startSpin->setRange(0, 99999);
    m_startSpin->setValue(1);
    form->addRow(tr("Start at:"), m_startSpin);

    mainLayout->addLayout(form);

    QDialogButtonBox* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

PageNumberOptions PageNumberDialog::options() const
{
    PageNumberOptions options;
    options.position = static_cast<PageNumberOptions::Position>(m_positionCombo->currentData().toInt());
    options.format = static_cast<PageNumberOptions::Format>(m_formatCombo->currentData().toInt());
    options.fontSize = m_fontSizeSpin->value();
    options.startAt = m_startSpin->value();
    return options;
}
