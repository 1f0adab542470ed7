// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "mainwindow.h"
#include "ui_mainwindow.h"
#include "qrdclient.h"
#include "viewerwidget.h"

#include <QtCore/QSettings>
#include <QtCore/QTimer>
#include <QtGui/QClipboard>
#include <QtGui/QGuiApplication>
#include <QtWidgets/QPushButton>

class MainWindow::Private : public Ui::MainWindow
{
public:
    Private(::MainWindow *parent);
    ~Private();

    void connectToServer();
    void showConnectPage(const QString &message);

private:
    ::MainWindow *q;
    QSettings settings;
    QTimer timer;
    QRdClient client;
    QString lastReceivedClipboard;
};

MainWindow::Private::Private(::MainWindow *parent)
    : q(parent)
    , client(parent)
{
    setupUi(q);

    QObject::connect(server, &QLineEdit::returnPressed, q, [this]() {
        watch->animateClick();
    });
    QObject::connect(port, &PortSpinBox::returnPressed, q, [this]() {
        watch->animateClick();
    });
    QObject::connect(password, &QLineEdit::returnPressed, q, [this]() {
        watch->animateClick();
    });

    stackedWidget->setCurrentIndex(0);
    viewer->setClient(&client);

    settings.beginGroup("Window");
    q->restoreGeometry(settings.value("small_geometry").toByteArray());
    server->setText(settings.value("server", server->text()).toString());
    port->setValue(settings.value("port", port->value()).toInt());
    username->setText(settings.value("username").toString());
    settings.endGroup();

    // Reconnect while the viewer page is shown, unless the server refused us
    timer.setInterval(5000);
    QObject::connect(&client, &QRdClient::authenticated, &timer, &QTimer::stop);
    QObject::connect(&client, &QRdClient::disconnected, q, [this]() {
        if (stackedWidget->currentIndex() == 1 && client.state() != QRdClient::Rejected)
            timer.start();
    });
    QObject::connect(&timer, &QTimer::timeout, q, [this]() {
        connectToServer();
    });

    QObject::connect(&client, &QRdClient::authenticationFailed, q, [this](const QString &message) {
        timer.stop();
        showConnectPage(message);
    });

    // Clipboard follows the remote side and the remote side follows ours
    QObject::connect(&client, &QRdClient::authenticated, q, [this]() {
        client.requestClipboard();
    });
    QObject::connect(&client, &QRdClient::clipboardReceived, q, [this](const QString &text) {
        lastReceivedClipboard = text;
        QGuiApplication::clipboard()->setText(text);
    });
    QObject::connect(QGuiApplication::clipboard(), &QClipboard::dataChanged, q, [this]() {
        const QString text = QGuiApplication::clipboard()->text();
        if (text != lastReceivedClipboard)
            client.sendClipboard(text);
    });

    QObject::connect(watch, &QPushButton::clicked, q, [this]() {
        settings.beginGroup("Window");
        settings.setValue("small_geometry", q->saveGeometry());
        settings.setValue("server", server->text());
        settings.setValue("port", port->value());
        settings.setValue("username", username->text());
        stackedWidget->setCurrentIndex(1);
        viewer->setFocus();
        q->restoreGeometry(settings.value("large_geometry").toByteArray());
        q->setWindowTitle(QString("%1:%2").arg(server->text()).arg(port->value()));
        settings.endGroup();
        connectToServer();
    });
}

MainWindow::Private::~Private()
{
    timer.stop();
    client.disconnectFromHost();

    settings.beginGroup("Window");
    switch (stackedWidget->currentIndex()) {
    case 0:
        settings.setValue("small_geometry", q->saveGeometry());
        break;
    case 1:
        settings.setValue("large_geometry", q->saveGeometry());
        break;
    }
    settings.endGroup();
}

void MainWindow::Private::connectToServer()
{
    if (!client.connectToHost(server->text(), port->value(), username->text(), password->text())) {
        status->setText(client.errorString());
        timer.start();
    }
}

void MainWindow::Private::showConnectPage(const QString &message)
{
    settings.beginGroup("Window");
    settings.setValue("large_geometry", q->saveGeometry());
    stackedWidget->setCurrentIndex(0);
    q->restoreGeometry(settings.value("small_geometry").toByteArray());
    settings.endGroup();
    status->setText(message);
    password->setFocus();
}

MainWindow::MainWindow(QWidget *parent)
    : QWidget(parent)
    , d(new Private(this))
{}

MainWindow::~MainWindow() = default;
