#include "ui/GlobalToast.h"
#include "platform/WindowLevel.h"

#include <QCursor>
#include <QFontMetrics>
#include <QGuiApplication>
#include <QPainter>
#include <QPainterPath>
#include <QScreen>
#include <QTimer>

GlobalToast& GlobalToast::instance()
{
    static GlobalToast instance;
    return instance;
}

GlobalToast::GlobalToast()
    : QWidget(nullptr, Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint
                       | Qt::WindowTransparentForInput)
    , m_hideTimer(new QTimer(this))
{
    setAttribute(Qt::WA_TranslucentBackground);
    setAttribute(Qt::WA_ShowWithoutActivating);
    setFocusPolicy(Qt::NoFocus);

    m_hideTimer->setSingleShot(true);
    connect(m_hideTimer, &QTimer::timeout, this, &QWidget::hide);
}

void GlobalToast::showToast(Type type, const QString& title, const QString& message, int durationMs)
{
    m_type = type;
    m_title = title;
    m_message = message;

    updateLayout();
    positionOnScreen();

    QWidget::show();
    raise();

    // Set platform-specific floating window level after showing
    setWindowFloatingWithoutFocus(this);
    update();

    m_hideTimer->start(durationMs);
}

void GlobalToast::updateLayout()
{
    QFont titleFont = font();
    titleFont.setBold(true);
    const QFontMetrics titleMetrics(titleFont);
    const QFontMetrics messageMetrics(font());

    const int textWidth = kWidth - 2 * kPadding;
    int height = kPadding * 2 + titleMetrics.boundingRect(QRect(0, 0, textWidth, 1000),
                                                          Qt::TextWordWrap, m_title).height();
    if (!m_message.isEmpty()) {
        height += 4 + messageMetrics.boundingRect(QRect(0, 0, textWidth, 1000),
                                                  Qt::TextWordWrap, m_message).height();
    }
    setFixedSize(kWidth, height);
}

void GlobalToast::positionOnScreen()
{
    QScreen* screen = QGuiApplication::screenAt(QCursor::pos());
    if (!screen) {
        screen = QGuiApplication::primaryScreen();
    }
    if (!screen) {
        return;
    }

    const QRect area = screen->availableGeometry();
    move(area.right() - width() - kScreenMargin, area.top() + kScreenMargin);
}

QColor GlobalToast::accentColor() const
{
    switch (m_type) {
    case Success:
        return QColor(34, 139, 34, 230);
    case Error:
        return QColor(200, 60, 60, 230);
    case Info:
        break;
    }
    return QColor(59, 130, 246, 230);
}

void GlobalToast::paintEvent(QPaintEvent*)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    QPainterPath background;
    background.addRoundedRect(QRectF(rect()), 8, 8);
    painter.fillPath(background, accentColor());

    const QRect textRect = rect().adjusted(kPadding, kPadding, -kPadding, -kPadding);

    QFont titleFont = font();
    titleFont.setBold(true);
    painter.setFont(titleFont);
    painter.setPen(Qt::white);
    QRect titleBounds;
    painter.drawText(textRect, Qt::TextWordWrap | Qt::AlignLeft | Qt::AlignTop, m_title, &titleBounds);

    if (!m_message.isEmpty()) {
        painter.setFont(font());
        painter.setPen(QColor(255, 255, 255, 200));
        const QRect messageRect = textRect.adjusted(0, titleBounds.height() + 4, 0, 0);
        painter.drawText(messageRect, Qt::TextWordWrap | Qt::AlignLeft | Qt::AlignTop, m_message);
    }
}
