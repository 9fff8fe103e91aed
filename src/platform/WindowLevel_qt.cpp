// Copyright (c) 2025 Victor Fu. All rights reserved.
// Use of this source code is governed by an MIT-style license that can be
// found in the LICENSE file.

#include "WindowLevel.h"

#include <QWindow>

void setWindowClickThrough(QWidget *widget, bool enabled)
{
    if (!widget) {
        return;
    }
    // Changing the flag on the native window keeps it mapped; going through
    // QWidget::setWindowFlag would hide the overlay.
    if (QWindow *window = widget->windowHandle()) {
        window->setFlag(Qt::WindowTransparentForInput, enabled);
    } else {
        widget->setWindowFlag(Qt::WindowTransparentForInput, enabled);
    }
}

void setWindowFloatingWithoutFocus(QWidget *widget)
{
    if (!widget) {
        return;
    }
    if (QWindow *window = widget->windowHandle()) {
        window->setFlag(Qt::WindowDoesNotAcceptFocus, true);
        window->setFlag(Qt::WindowStaysOnTopHint, true);
    }
}

void activateOverlayWindow(QWidget *widget)
{
    if (!widget) {
        return;
    }
    widget->raise();
    widget->activateWindow();
    widget->setFocus(Qt::ActiveWindowFocusReason);
}
