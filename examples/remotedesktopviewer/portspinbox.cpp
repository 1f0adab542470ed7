// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "portspinbox.h"
#include "qrdprotocol.h"
#include <QtWidgets/QLineEdit>

PortSpinBox::PortSpinBox(QWidget *parent)
    : QSpinBox(parent)
{
    setRange(1, 65535);
    setValue(QRdProtocol::DefaultPort);
    setGroupSeparatorShown(false);
    connect(lineEdit(), &QLineEdit::returnPressed, this, &PortSpinBox::returnPressed);
}
