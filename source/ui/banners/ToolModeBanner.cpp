#include "ToolModeBanner.h"

#include <QComboBox>
#include <QHBoxLayout>
#include <QPainter>

ToolModeBanner::ToolModeBanner(QWidget* parent)
    : QWidget(parent)
    , m_animation(new QPropertyAnimation(this, "slideOffset", this))
{
    setupUi();

    // Start hidden (above the page column)
    m_slideOffset = -BANNER_HEIGHT;
    setFixedHeight(BANNER_HEIGHT);
    hide();

    m_animation->setDuration(ANIMATION_DURATION);
    m_animation->setEasingCurve(QEasingCurve::OutCubic);
}

void ToolModeBanner::setupUi()
{
    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(12, 6, 12, 6);
    layout->setSpacing(10);

    m_messageLabel = new QLabel(this);
    m_messageLabel->setStyleSheet("color: #0b3d91; font-weight: 500;");
    m_messageLabel->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Preferred);

    m_colorCombo = new QComboBox(this);
    m_colorCombo->setObjectName(QStringLiteral("redactColor"));
    m_colorCombo->addItem(tr("Black"), QColor(Qt::black));
    m_colorCombo->addItem(tr("White"), QColor(Qt::white));
    connect(m_colorCombo, qOverload<int>(&QComboBox::currentIndexChanged), this, [this](int) {
        emit redactColorChanged(redactColor());
    });

    m_searchButton = new QPushButton(tr("Search && Redact..."), this);
    m_searchButton->setObjectName(QStringLiteral("redactSearch"));
    connect(m_searchButton, &QPushButton::clicked, this, &ToolModeBanner::searchClicked);

    m_applyButton = new QPushButton(tr("Apply"), this);
    m_applyButton->setObjectName(QStringLiteral("bannerApply"));
    m_applyButton->setCursor(Qt::PointingHandCursor);
    m_applyButton->setStyleSheet(R"(
        QPushButton {
            background: #1a73e8;
            color: white;
            border: none;
            border-radius: 4px;
            padding: 4px 12px;
            font-weight: bold;
            font-size: 11px;
        }
    )");
    connect(m_applyButton, &QPushButton::clicked, this, &ToolModeBanner::applyClicked);

    m_exitButton = new QPushButton(tr("Exit"), this);
    m_exitButton->setObjectName(QStringLiteral("bannerExit"));
    m_exitButton->setToolTip(tr("Exit the mode (Esc)"));
    connect(m_exitButton, &QPushButton::clicked, this, &ToolModeBanner::exitClicked);

    layout->addWidget(m_messageLabel);
    layout->addStretch();
    layout->addWidget(m_colorCombo);
    layout->addWidget(m_searchButton);
    layout->addWidget(m_applyButton);
    layout->addWidget(m_exitButton);
}

void ToolModeBanner::setMode(ToolMode mode, const QString& text)
{
    m_mode = mode;
    m_messageLabel->setText(text);

    const bool redact = mode == ToolMode::Redact;
    m_colorCombo->setVisible(redact);
    m_searchButton->setVisible(redact);

    // Placing a field commits immediately; redactions have their own bar
    m_applyButton->setVisible(mode != ToolMode::AddField && !redact);
    m_applyButton->setText(mode == ToolMode::TextEdit ? tr("Apply Text") : tr("Apply Annotations"));

    if (text.isEmpty()) {
        hideAnimated();
    } else {
        showAnimated();
    }
}

QColor ToolModeBanner::redactColor() const
{
    return m_colorCombo->currentData().value<QColor>();
}

void ToolModeBanner::showAnimated()
{
    // Drop a pending hide-on-finish
    disconnect(m_animation, &QPropertyAnimation::finished, nullptr, nullptr);

    show();
    m_animation->stop();
    m_animation->setStartValue(m_slideOffset);
    m_animation->setEndValue(0);
    m_animation->start();
}

void ToolModeBanner::hideAnimated()
{
    disconnect(m_animation, &QPropertyAnimation::finished, nullptr, nullptr);

    m_animation->stop();
    m_animation->setStartValue(m_slideOffset);
    m_animation->setEndValue(-BANNER_HEIGHT);

    connect(m_animation, &QPropertyAnimation::finished, this, [this]() {
        if (m_slideOffset <= -BANNER_HEIGHT) {
            hide();
        }
    }, Qt::SingleShotConnection);

    m_animation->start();
}

void ToolModeBanner::setSlideOffset(int offset)
{
    m_slideOffset = offset;
    setContentsMargins(0, qMin(0, offset), 0, 0);
    update();
}

void ToolModeBanner::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    QPainter painter(this);
    painter.fillRect(rect(), QColor(0xE8F0FE));

    painter.setPen(QPen(QColor(0x1A, 0x73, 0xE8), 1));
    painter.drawLine(0, height() - 1, width(), height() - 1);
}
