// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef PORTSPINBOX_H
#define PORTSPINBOX_H

#include <QSpinBox>

// Spin box for a TCP port that reports Return like QLineEdit does
class PortSpinBox : public QSpinBox
{
    Q_OBJECT
public:
    explicit PortSpinBox(QWidget *parent = nullptr);

signals:
    void returnPressed();
};

#endif // PORTSPINBOX_H
