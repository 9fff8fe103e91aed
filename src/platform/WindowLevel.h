// Copyright (c) 2025 Victor Fu. All rights reserved.
// Use of this source code is governed by an MIT-style license that can be
// found in the LICENSE file.

#ifndef WINDOWLEVEL_H
#define WINDOWLEVEL_H

#include <QWidget>

// Toggles whether pointer input reaches the overlay or the desktop beneath it.
// The window stays mapped and keeps painting in both states.
void setWindowClickThrough(QWidget *widget, bool enabled);

// Keeps a helper window (toolbar, toast) above the overlay without taking focus.
void setWindowFloatingWithoutFocus(QWidget *widget);

// Pulls keyboard focus into the overlay once it starts capturing input, so
// Esc and the undo shortcuts arrive without an extra click.
void activateOverlayWindow(QWidget *widget);

#endif // WINDOWLEVEL_H
