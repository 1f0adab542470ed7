// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef VIEWERWIDGET_H
#define VIEWERWIDGET_H

#include <QtWidgets/QWidget>
#include "qrdclient.h"

class QKeyEvent;
class QMouseEvent;
class QPaintEvent;
class QWheelEvent;

class ViewerWidget : public QWidget
{
    Q_OBJECT
    Q_PROPERTY(QRdClient *client READ client WRITE setClient NOTIFY clientChanged)

public:
    explicit ViewerWidget(QWidget *parent = nullptr);
    ~ViewerWidget() override;

    QRdClient *client() const;
    void setClient(QRdClient *client);

signals:
    void clientChanged(QRdClient *client);

protected:
    void keyPressEvent(QKeyEvent *e) override;
    void keyReleaseEvent(QKeyEvent *e) override;
    void mousePressEvent(QMouseEvent *e) override;
    void mouseDoubleClickEvent(QMouseEvent *e) override;
    void mouseMoveEvent(QMouseEvent *e) override;
    void mouseReleaseEvent(QMouseEvent *e) override;
    void wheelEvent(QWheelEvent *e) override;
    void paintEvent(QPaintEvent *e) override;
    bool focusNextPrevChild(bool next) override;

private:
    class Private;
    QScopedPointer<Private> d;
};

#endif // VIEWERWIDGET_H
