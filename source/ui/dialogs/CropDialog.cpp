#include "CropDialog.h"

#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QVBoxLayout>

namespace {

QDoubleSpinBox* makeSpin(qreal value)
{
    QDoubleSpinBox* spin = new QDoubleSpinBox();
    spin->setRange(0.0, 14400.0);
    spin->setDecimals(1);
    spin->setSuffix(QStringLiteral(" pt"));
    spin->setValue(value);
    return spin;
}

} // namespace

CropDialog::CropDialog(const QSizeF& pageSize, QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Crop Pages"));
    setModal(true);

    const QSizeF size = pageSize.isValid() ? pageSize : QSizeF(612, 792);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    QFormLayout* form = new QFormLayout();
    m_left = makeSpin(0.0);
    m_bottom = makeSpin(0.0);
    m_right = makeSpin(size.width());
    m_top = makeSpin(size.height());
    form->addRow(tr("Left:"), m_left);
    form->addRow(tr("Bottom:"), m_bottom);
    form->addRow(tr("Right:"), m_right);
    form->addRow(tr("Top:"), m_top);
    mainLayout->addLayout(form);

    QDialogButtonBox* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}

QRectF CropDialog::cropBox() const
{
    return QRectF(m_left->value(), m_bottom->value(),
                  m_right->value() - m_left->value(), m_top->value() - m_bottom->value());
}
