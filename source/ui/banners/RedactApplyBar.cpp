#include "RedactApplyBar.h"

#include <QHBoxLayout>
#include <QPainter>

RedactApplyBar::RedactApplyBar(QWidget* parent)
    : QWidget(parent)
{
    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(12, 4, 12, 4);
    layout->setSpacing(10);

    m_countLabel = new QLabel(this);
    m_countLabel->setObjectName(QStringLiteral("redactCount"));
    m_countLabel->setStyleSheet("color: #7a1c1c; font-weight: 500;");

    m_clearButton = new QPushButton(tr("Clear"), this);
    m_clearButton->setObjectName(QStringLiteral("redactClear"));
    connect(m_clearButton, &QPushButton::clicked, this, &RedactApplyBar::clearClicked);

    m_applyButton = new QPushButton(tr("Apply Redactions"), this);
    m_applyButton->setObjectName(QStringLiteral("redactApply"));
    m_applyButton->setCursor(Qt::PointingHandCursor);
    m_applyButton->setStyleSheet(R"(
        QPushButton {
            background: #c5221f;
            color: white;
            border: none;
            border-radius: 4px;
            padding: 4px 12px;
            font-weight: bold;
            font-size: 11px;
        }
    )");
    connect(m_applyButton, &QPushButton::clicked, this, &RedactApplyBar::applyClicked);

    layout->addWidget(m_countLabel);
    layout->addStretch();
    layout->addWidget(m_clearButton);
    layout->addWidget(m_applyButton);

    setFixedHeight(BAR_HEIGHT);
    hide();
}

void RedactApplyBar::setRedactionCount(int count)
{
    m_count = qMax(0, count);
    m_countLabel->setText(tr("%n area(s) marked for redaction", nullptr, m_count));
    setVisible(m_count > 0);
}

void RedactApplyBar::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    QPainter painter(this);
    painter.fillRect(rect(), QColor(0xFCE8E6));

    painter.setPen(QPen(QColor(0xC5, 0x22, 0x1F), 1));
    painter.drawLine(0, 0, width(), 0);
}
