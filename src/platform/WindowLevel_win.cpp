// Copyright (c) 2025 Victor Fu. All rights reserved.
// Use of this source code is governed by an MIT-style license that can be
// found in the LICENSE file.

#include "WindowLevel.h"

#include <QWindow>
#include <Windows.h>

namespace {

HWND overlayHandle(QWidget *widget)
{
    return widget ? reinterpret_cast<HWND>(widget->winId()) : nullptr;
}

// Applies set/clear masks to GWL_EXSTYLE; returns false when nothing changed.
bool updateExtendedStyle(HWND hwnd, LONG_PTR addBits, LONG_PTR removeBits)
{
    const LONG_PTR current = GetWindowLongPtr(hwnd, GWL_EXSTYLE);
    const LONG_PTR next = (current | addBits) & ~removeBits;
    if (next == current) {
        return false;
    }
    SetWindowLongPtr(hwnd, GWL_EXSTYLE, next);
    return true;
}

} // namespace

void setWindowClickThrough(QWidget *widget, bool enabled)
{
    HWND hwnd = overlayHandle(widget);
    if (!hwnd) {
        return;
    }
    if (QWindow *window = widget->windowHandle()) {
        window->setFlag(Qt::WindowTransparentForInput, enabled);
    }

    // WS_EX_LAYERED stays on after the first pass so the per-pixel alpha
    // surface is not recreated on every mode switch.
    const bool changed = enabled
        ? updateExtendedStyle(hwnd, WS_EX_TRANSPARENT | WS_EX_LAYERED, 0)
        : updateExtendedStyle(hwnd, 0, WS_EX_TRANSPARENT);
    if (changed) {
        SetWindowPos(hwnd, nullptr, 0, 0, 0, 0,
                     SWP_NOMOVE | SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE | SWP_FRAMECHANGED);
    }
}

void setWindowFloatingWithoutFocus(QWidget *widget)
{
    HWND hwnd = overlayHandle(widget);
    if (!hwnd) {
        return;
    }
    updateExtendedStyle(hwnd, WS_EX_NOACTIVATE | WS_EX_TOPMOST | WS_EX_TOOLWINDOW, WS_EX_APPWINDOW);
    SetWindowPos(hwnd, HWND_TOPMOST, 0, 0, 0, 0, SWP_NOMOVE | SWP_NOSIZE | SWP_NOACTIVATE);
}

void activateOverlayWindow(QWidget *widget)
{
    HWND hwnd = overlayHandle(widget);
    if (!hwnd) {
        return;
    }
    // Windows refuses SetForegroundWindow from a background process unless the
    // calling thread is attached to the current foreground thread's input.
    HWND foreground = GetForegroundWindow();
    const DWORD ownThread = GetCurrentThreadId();
    const DWORD foregroundThread = foreground ? GetWindowThreadProcessId(foreground, nullptr) : ownThread;
    const bool attach = foregroundThread != ownThread;
    if (attach) {
        AttachThreadInput(foregroundThread, ownThread, TRUE);
    }
    SetForegroundWindow(hwnd);
    if (attach) {
        AttachThreadInput(foregroundThread, ownThread, FALSE);
    }
    widget->activateWindow();
    widget->setFocus(Qt::ActiveWindowFocusReason);
}
