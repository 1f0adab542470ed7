// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qtremotedesktopglobal.h"

QT_BEGIN_NAMESPACE

// Define the logging category
Q_LOGGING_CATEGORY(lcRemoteDesktop, "qt.remotedesktop")

QT_END_NAMESPACE
