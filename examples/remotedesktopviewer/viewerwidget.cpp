// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "viewerwidget.h"

#include <QtGui/QPainter>
#include <QtGui/QPaintEvent>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QWheelEvent>

class ViewerWidget::Private
{
public:
    Private(ViewerWidget *parent);

    void paint(const QRect &rect);
    void resizeTo(const QSize &size);

private:
    ViewerWidget *q;

public:
    QRdClient *client = nullptr;
};

ViewerWidget::Private::Private(ViewerWidget *parent)
    : q(parent)
{
    q->setMouseTracking(true);
    q->setFocusPolicy(Qt::StrongFocus);
}

void ViewerWidget::Private::paint(const QRect &rect)
{
    QPainter p(q);
    if (!client || client->state() != QRdClient::Authenticated) {
        p.setOpacity(0.5);
        p.fillRect(rect, Qt::lightGray);
        return;
    }

    p.drawImage(rect, client->image(), rect);
}

void ViewerWidget::Private::resizeTo(const QSize &size)
{
    q->setMinimumSize(size);
    q->setMaximumSize(size);
    q->resize(size);
    q->update();
}

ViewerWidget::ViewerWidget(QWidget *parent)
    : QWidget(parent)
    , d(new Private(this))
{
}

ViewerWidget::~ViewerWidget() = default;

QRdClient *ViewerWidget::client() const
{
    return d->client;
}

void ViewerWidget::setClient(QRdClient *client)
{
    if (d->client == client)
        return;

    if (d->client)
        disconnect(d->client, nullptr, this, nullptr);

    d->client = client;

    if (client) {
        connect(client, &QRdClient::frameSizeChanged, this, [this](const QSize &size) {
            d->resizeTo(size);
        });

        connect(client, &QRdClient::imageChanged, this, [this](const QRect &rect) {
            update(rect);
        });

        connect(client, &QRdClient::stateChanged, this, [this](QRdClient::State) {
            update();
        });
    }

    emit clientChanged(client);
}

void ViewerWidget::keyPressEvent(QKeyEvent *e)
{
    if (d->client)
        d->client->handleKeyEvent(e);
}

void ViewerWidget::keyReleaseEvent(QKeyEvent *e)
{
    if (d->client)
        d->client->handleKeyEvent(e);
}

void ViewerWidget::mousePressEvent(QMouseEvent *e)
{
    if (d->client)
        d->client->handlePointerEvent(e);
}

void ViewerWidget::mouseDoubleClickEvent(QMouseEvent *e)
{
    if (d->client)
        d->client->handlePointerEvent(e);
}

void ViewerWidget::mouseMoveEvent(QMouseEvent *e)
{
    if (d->client)
        d->client->handlePointerEvent(e);
}

void ViewerWidget::mouseReleaseEvent(QMouseEvent *e)
{
    if (d->client)
        d->client->handlePointerEvent(e);
}

void ViewerWidget::wheelEvent(QWheelEvent *e)
{
    if (d->client)
        d->client->handleWheelEvent(e);
}

void ViewerWidget::paintEvent(QPaintEvent *e)
{
    d->paint(e->rect());
}

// Tab goes to the remote desktop, not to the next widget
bool ViewerWidget::focusNextPrevChild(bool next)
{
    Q_UNUSED(next);
    return false;
}
