#ifndef GLOBALTOAST_H
#define GLOBALTOAST_H

#include <QString>
#include <QWidget>

class QTimer;

/**
 * @brief Floating notification that never takes focus.
 *
 * Shown in the top-right corner of the screen under the cursor, above
 * the overlay surface. Used for mode changes and non-fatal errors such
 * as failed hotkey registration.
 */
class GlobalToast : public QWidget
{
    Q_OBJECT

public:
    enum Type {
        Success,
        Error,
        Info
    };

    static GlobalToast& instance();

    /**
     * @brief Show a toast, replacing the current one.
     * @param durationMs How long to show the toast (default 3000ms)
     */
    void showToast(Type type, const QString& title, const QString& message, int durationMs = 3000);

    QString title() const { return m_title; }
    QString message() const { return m_message; }
    Type type() const { return m_type; }

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    GlobalToast();
    ~GlobalToast() override = default;

    GlobalToast(const GlobalToast&) = delete;
    GlobalToast& operator=(const GlobalToast&) = delete;

    void updateLayout();
    void positionOnScreen();
    QColor accentColor() const;

    Type m_type = Info;
    QString m_title;
    QString m_message;
    QTimer* m_hideTimer;

    static constexpr int kWidth = 320;
    static constexpr int kPadding = 14;
    static constexpr int kScreenMargin = 20;
};

#endif // GLOBALTOAST_H
