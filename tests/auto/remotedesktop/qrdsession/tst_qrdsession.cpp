// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QWheelEvent>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>

#include "qrdcapabilities.h"
#include "qrdclient.h"
#include "qrdconnection.h"
#include "qrdscreencapturer.h"
#include "qrdserver.h"

class FakeDisplay : public QRdDisplaySource
{
public:
    FakeDisplay()
        : image(32, 24, QImage::Format_RGB32)
    {
        image.fill(qRgb(200, 40, 40));
    }

    QImage grab(const QRect &, QString *) override
    {
        return image;
    }

    QImage image;
};

// Server side injection runs on the server's thread, the test thread here
class FakeInjector : public QRdInputInjector
{
public:
    bool injectMouseEvent(const QRdProtocol::MouseEvent &event, QString *errorString) override
    {
        if (failNext) {
            failNext = false;
            *errorString = u"injection refused"_s;
            return false;
        }
        mouse.append(event);
        return true;
    }

    bool injectKeyboardEvent(const QRdProtocol::KeyboardEvent &event, QString *) override
    {
        keys.append(event);
        return true;
    }

    QList<QRdProtocol::MouseEvent> mouse;
    QList<QRdProtocol::KeyboardEvent> keys;
    bool failNext = false;
};

class FakeClipboard : public QRdClipboard
{
public:
    QString text() const override
    {
        return contents;
    }

    bool setText(const QString &text, QString *) override
    {
        contents = text;
        return true;
    }

    QString contents;
};

class tst_qrdsession : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void authenticationSucceeds();
    void authenticationRejected();
    void connectFailure();
    void screenDataDelivered();
    void duplicateMovesSuppressed();
    void moveAfterClickElsewhere();
    void malformedEventIgnored();
    void injectionFailureIsContained();
    void unauthenticatedInputDropped();
    void keyboardAndText();
    void eventAdapters();
    void clipboardBothWays();
    void disconnectFromHost();
    void latestClientReceivesScreen();
    void framesSkippedForStalledClient();

private:
    bool connectClient(QRdClient *client);

    FakeDisplay *display = nullptr;
    FakeInjector *injector = nullptr;
    FakeClipboard *clipboard = nullptr;
    QRdServer *server = nullptr;
};

void tst_qrdsession::init()
{
    display = new FakeDisplay;
    injector = new FakeInjector;
    clipboard = new FakeClipboard;
    server = new QRdServer(display, injector, clipboard);
    QVERIFY(server->listen(QHostAddress::LocalHost, 0));
    QVERIFY(server->isListening());
}

void tst_qrdsession::cleanup()
{
    delete server;
    server = nullptr;
    delete clipboard;
    delete injector;
    delete display;
}

bool tst_qrdsession::connectClient(QRdClient *client)
{
    if (!client->connectToHost(u"127.0.0.1"_s, server->serverPort(), u"user"_s, u"secret"_s))
        return false;
    return QTest::qWaitFor([client]() {
        return client->state() == QRdClient::Authenticated;
    }, 5000);
}

void tst_qrdsession::authenticationSucceeds()
{
    QString seenUser;
    QString seenPassword;
    server->setAuthenticator([&](const QString &username, const QString &password, QString *message) {
        seenUser = username;
        seenPassword = password;
        *message = u"Welcome"_s;
        return true;
    });
    QSignalSpy serverSpy(server, &QRdServer::clientAuthenticated);

    QRdClient client;
    QSignalSpy stateSpy(&client, &QRdClient::stateChanged);
    QSignalSpy authenticatedSpy(&client, &QRdClient::authenticated);
    QVERIFY(connectClient(&client));

    QCOMPARE(authenticatedSpy.size(), 1);
    QCOMPARE(stateSpy.size(), 3);
    QCOMPARE(stateSpy.at(0).at(0).value<QRdClient::State>(), QRdClient::Connecting);
    QCOMPARE(stateSpy.at(1).at(0).value<QRdClient::State>(), QRdClient::Authenticating);
    QCOMPARE(stateSpy.at(2).at(0).value<QRdClient::State>(), QRdClient::Authenticated);
    QCOMPARE(seenUser, u"user"_s);
    QCOMPARE(seenPassword, u"secret"_s);
    QTRY_COMPARE(serverSpy.size(), 1);
    QCOMPARE(server->activePeer(), serverSpy.at(0).at(0).value<QRdPeer *>());
}

void tst_qrdsession::authenticationRejected()
{
    server->setAuthenticator([](const QString &, const QString &, QString *message) {
        *message = u"bad credentials"_s;
        return false;
    });
    server->setAuthFailureGracePeriod(100);
    QCOMPARE(server->authFailureGracePeriod(), 100);
    QSignalSpy rejectedSpy(server, &QRdServer::authenticationRejected);
    QSignalSpy serverDisconnectedSpy(server, &QRdServer::clientDisconnected);

    QRdClient client;
    QSignalSpy failedSpy(&client, &QRdClient::authenticationFailed);
    QSignalSpy disconnectedSpy(&client, &QRdClient::disconnected);
    QVERIFY(client.connectToHost(u"127.0.0.1"_s, server->serverPort(), u"user"_s, u"wrong"_s));

    QTRY_COMPARE(client.state(), QRdClient::Rejected);
    QCOMPARE(failedSpy.size(), 1);
    QCOMPARE(failedSpy.at(0).at(0).toString(), u"bad credentials"_s);
    QCOMPARE(client.errorString(), u"bad credentials"_s);
    QTRY_COMPARE(disconnectedSpy.size(), 1);
    // Rejected is final for this attempt
    QCOMPARE(client.state(), QRdClient::Rejected);

    QVERIFY(!client.sendMouseMove(QPoint(1, 1)));
    QVERIFY(!client.sendKey(u"a"_s, QRdProtocol::KeyAction::Press));

    QCOMPARE(rejectedSpy.size(), 1);
    QCOMPARE(rejectedSpy.at(0).at(1).toString(), u"bad credentials"_s);
    QTRY_COMPARE(serverDisconnectedSpy.size(), 1);
    QVERIFY(!server->activePeer());
    QVERIFY(injector->mouse.isEmpty());
    QVERIFY(injector->keys.isEmpty());
}

void tst_qrdsession::connectFailure()
{
    QTcpServer probe;
    QVERIFY(probe.listen(QHostAddress::LocalHost, 0));
    const quint16 port = probe.serverPort();
    probe.close();

    QRdClient client;
    QVERIFY(!client.connectToHost(u"127.0.0.1"_s, port));
    QCOMPARE(client.state(), QRdClient::Unconnected);
    QVERIFY(!client.errorString().isEmpty());
    QVERIFY(!client.sendMouseMove(QPoint(1, 1)));
}

void tst_qrdsession::screenDataDelivered()
{
    QRdClient client;
    QSignalSpy sizeSpy(&client, &QRdClient::frameSizeChanged);
    QSignalSpy imageSpy(&client, &QRdClient::imageChanged);
    QVERIFY(connectClient(&client));

    QTRY_VERIFY(imageSpy.size() >= 1);
    QCOMPARE(sizeSpy.size(), 1);
    QCOMPARE(sizeSpy.at(0).at(0).toSize(), QSize(32, 24));
    QCOMPARE(client.frameSize(), QSize(32, 24));
    const QImage image = client.image();
    QCOMPARE(image.size(), QSize(32, 24));
    const QColor center = image.pixelColor(16, 12);
    QVERIFY(qAbs(center.red() - 200) < 20);
    QVERIFY(qAbs(center.green() - 40) < 20);

    // A changed display produces another frame of the same size
    const int frames = imageSpy.size();
    display->image.fill(qRgb(20, 40, 220));
    QTRY_VERIFY(imageSpy.size() > frames);
    QTRY_VERIFY(client.image().pixelColor(16, 12).blue() > 180);
    QCOMPARE(sizeSpy.size(), 1);
}

void tst_qrdsession::duplicateMovesSuppressed()
{
    QRdClient client;
    QVERIFY(connectClient(&client));

    QVERIFY(client.sendMouseMove(QPoint(10, 10)));
    QVERIFY(!client.sendMouseMove(QPoint(10, 10)));
    QVERIFY(client.sendMouseMove(QPoint(11, 10)));
    // Clicks are never suppressed
    QVERIFY(client.sendMouseClick(QPoint(11, 10), Qt::LeftButton));
    QVERIFY(client.sendMouseClick(QPoint(11, 10), Qt::LeftButton));
    QVERIFY(!client.sendMouseMove(QPoint(11, 10)));

    QTRY_COMPARE(injector->mouse.size(), 4);
    QCOMPARE(injector->mouse.at(0).action, QRdProtocol::MouseAction::Move);
    QCOMPARE(injector->mouse.at(0).pos, QPoint(10, 10));
    QCOMPARE(injector->mouse.at(1).pos, QPoint(11, 10));
    QCOMPARE(injector->mouse.at(2).action, QRdProtocol::MouseAction::Click);
    QCOMPARE(injector->mouse.at(3).action, QRdProtocol::MouseAction::Click);
}

void tst_qrdsession::moveAfterClickElsewhere()
{
    QRdClient client;
    QVERIFY(connectClient(&client));

    QVERIFY(client.sendMouseMove(QPoint(10, 20)));
    QVERIFY(client.sendMouseClick(QPoint(30, 40), Qt::LeftButton));
    QVERIFY(client.sendMouseMove(QPoint(10, 20)));
    QVERIFY(client.sendMouseDrag(QPoint(50, 60), Qt::LeftButton));
    QVERIFY(client.sendMouseMove(QPoint(10, 20)));
    QVERIFY(client.sendMouseButton(QPoint(10, 20), Qt::RightButton, QRdProtocol::ButtonAction::Down));
    QVERIFY(!client.sendMouseMove(QPoint(10, 20)));

    QTRY_COMPARE(injector->mouse.size(), 6);
    QCOMPARE(injector->mouse.at(1).pos, QPoint(30, 40));
    QCOMPARE(injector->mouse.at(2).action, QRdProtocol::MouseAction::Move);
    QCOMPARE(injector->mouse.at(2).pos, QPoint(10, 20));
    QCOMPARE(injector->mouse.at(3).action, QRdProtocol::MouseAction::Drag);
    QCOMPARE(injector->mouse.at(4).action, QRdProtocol::MouseAction::Move);
    QCOMPARE(injector->mouse.at(4).pos, QPoint(10, 20));
    QCOMPARE(injector->mouse.at(5).subAction, QRdProtocol::ButtonAction::Down);
}

void tst_qrdsession::malformedEventIgnored()
{
    QRdClient client;
    QVERIFY(connectClient(&client));

    QVERIFY(client.connection()->send(QRdProtocol::MessageKind::MouseEvent, QJsonObject { { "action", "fly" } }));
    QVERIFY(client.connection()->send(QRdProtocol::MessageKind::KeyboardEvent, QJsonObject { { "key", "a" } }));
    QVERIFY(client.sendMouseMove(QPoint(5, 5)));
    QVERIFY(client.sendKey(u"b"_s, QRdProtocol::KeyAction::Press));

    QTRY_COMPARE(injector->mouse.size(), 1);
    QCOMPARE(injector->mouse.at(0).pos, QPoint(5, 5));
    QTRY_COMPARE(injector->keys.size(), 1);
    QCOMPARE(injector->keys.at(0).key, u"b"_s);
    QCOMPARE(client.state(), QRdClient::Authenticated);
}

void tst_qrdsession::injectionFailureIsContained()
{
    QRdClient client;
    QVERIFY(connectClient(&client));

    injector->failNext = true;
    QVERIFY(client.sendMouseMove(QPoint(1, 2)));
    QVERIFY(client.sendMouseMove(QPoint(3, 4)));

    QTRY_COMPARE(injector->mouse.size(), 1);
    QCOMPARE(injector->mouse.at(0).pos, QPoint(3, 4));
    QVERIFY(client.connection()->isRunning());
}

void tst_qrdsession::unauthenticatedInputDropped()
{
    QRdConnection raw(QRdConnection::ClientRole);
    QVERIFY(raw.connectToHost(u"127.0.0.1"_s, server->serverPort()));

    QRdProtocol::MouseEvent move;
    move.pos = QPoint(7, 7);
    QVERIFY(raw.send(QRdProtocol::MessageKind::MouseEvent, move.toJson()));
    QVERIFY(raw.send(QRdProtocol::MessageKind::ClipboardData, QJsonObject { { "data", "sneaky" } }));

    QRdProtocol::AuthRequest request;
    request.username = u"late"_s;
    QVERIFY(raw.send(QRdProtocol::MessageKind::AuthRequest, request.toJson()));
    move.pos = QPoint(8, 8);
    QVERIFY(raw.send(QRdProtocol::MessageKind::MouseEvent, move.toJson()));

    QTRY_COMPARE(injector->mouse.size(), 1);
    QCOMPARE(injector->mouse.at(0).pos, QPoint(8, 8));
    QVERIFY(clipboard->contents.isEmpty());
}

void tst_qrdsession::keyboardAndText()
{
    QRdClient client;
    QVERIFY(connectClient(&client));

    QVERIFY(client.sendKey(u"ctrl"_s, QRdProtocol::KeyAction::Down));
    QVERIFY(client.sendKey(u"ctrl"_s, QRdProtocol::KeyAction::Up));
    QVERIFY(client.sendText(u"hello world"_s));
    QVERIFY(!client.sendText(QString()));

    QTRY_COMPARE(injector->keys.size(), 3);
    QCOMPARE(injector->keys.at(0).action, QRdProtocol::KeyAction::Down);
    QCOMPARE(injector->keys.at(1).action, QRdProtocol::KeyAction::Up);
    QCOMPARE(injector->keys.at(2).key, u"hello world"_s);
    QCOMPARE(injector->keys.at(2).action, QRdProtocol::KeyAction::Write);
}

void tst_qrdsession::eventAdapters()
{
    QRdClient client;
    QVERIFY(connectClient(&client));

    QKeyEvent f5(QEvent::KeyPress, Qt::Key_F5, Qt::NoModifier);
    client.handleKeyEvent(&f5);
    QKeyEvent letter(QEvent::KeyRelease, Qt::Key_A, Qt::ShiftModifier, u"A"_s);
    client.handleKeyEvent(&letter);

    QMouseEvent press(QEvent::MouseButtonPress, QPointF(3, 4), QPointF(3, 4),
                      Qt::RightButton, Qt::RightButton, Qt::NoModifier);
    client.handlePointerEvent(&press);
    QMouseEvent release(QEvent::MouseButtonRelease, QPointF(3, 4), QPointF(3, 4),
                        Qt::RightButton, Qt::NoButton, Qt::NoModifier);
    client.handlePointerEvent(&release);

    QWheelEvent wheel(QPointF(3, 4), QPointF(3, 4), QPoint(), QPoint(0, -240),
                      Qt::NoButton, Qt::NoModifier, Qt::NoScrollPhase, false);
    client.handleWheelEvent(&wheel);

    QTRY_COMPARE(injector->keys.size(), 2);
    QCOMPARE(injector->keys.at(0).key, u"f5"_s);
    QCOMPARE(injector->keys.at(0).action, QRdProtocol::KeyAction::Down);
    QCOMPARE(injector->keys.at(1).key, u"a"_s);
    QCOMPARE(injector->keys.at(1).action, QRdProtocol::KeyAction::Up);

    QTRY_COMPARE(injector->mouse.size(), 3);
    QCOMPARE(injector->mouse.at(0).button, Qt::RightButton);
    QCOMPARE(injector->mouse.at(0).subAction, QRdProtocol::ButtonAction::Down);
    QCOMPARE(injector->mouse.at(0).pos, QPoint(3, 4));
    QCOMPARE(injector->mouse.at(1).subAction, QRdProtocol::ButtonAction::Up);
    QCOMPARE(injector->mouse.at(2).action, QRdProtocol::MouseAction::Scroll);
    QCOMPARE(injector->mouse.at(2).amount, -2);
}

void tst_qrdsession::clipboardBothWays()
{
    clipboard->contents = u"from server"_s;

    QRdClient client;
    QSignalSpy clipboardSpy(&client, &QRdClient::clipboardReceived);
    QVERIFY(connectClient(&client));

    QVERIFY(client.requestClipboard());
    QTRY_COMPARE(clipboardSpy.size(), 1);
    QCOMPARE(clipboardSpy.at(0).at(0).toString(), u"from server"_s);

    QVERIFY(client.sendClipboard(u"from client"_s));
    QTRY_COMPARE(clipboard->contents, u"from client"_s);
}

void tst_qrdsession::disconnectFromHost()
{
    QSignalSpy serverSpy(server, &QRdServer::clientDisconnected);

    QRdClient client;
    QSignalSpy disconnectedSpy(&client, &QRdClient::disconnected);
    QVERIFY(connectClient(&client));
    QTRY_VERIFY(server->activePeer());

    client.disconnectFromHost();
    QCOMPARE(client.state(), QRdClient::Unconnected);
    QCOMPARE(disconnectedSpy.size(), 1);
    QVERIFY(!client.sendMouseMove(QPoint(1, 1)));

    QTRY_COMPARE(serverSpy.size(), 1);
    QVERIFY(!server->activePeer());

    // The same client can log in again
    QVERIFY(connectClient(&client));
}

void tst_qrdsession::latestClientReceivesScreen()
{
    QRdClient first;
    QVERIFY(connectClient(&first));
    QTRY_VERIFY(!first.image().isNull());

    QRdClient second;
    QSignalSpy secondSpy(&second, &QRdClient::imageChanged);
    QVERIFY(connectClient(&second));
    QTRY_COMPARE(server->connection()->peers().size(), qsizetype(2));

    // Only the most recently authenticated client gets new frames
    QSignalSpy firstSpy(&first, &QRdClient::imageChanged);
    display->image.fill(qRgb(0, 200, 0));
    QTRY_VERIFY(secondSpy.size() >= 1);
    QTRY_VERIFY(second.image().pixelColor(16, 12).green() > 150);
    QCOMPARE(firstSpy.size(), 0);

    // Input from either authenticated client is still injected
    QVERIFY(first.sendMouseMove(QPoint(1, 1)));
    QVERIFY(second.sendMouseMove(QPoint(2, 2)));
    QTRY_COMPARE(injector->mouse.size(), 2);
}

void tst_qrdsession::framesSkippedForStalledClient()
{
    // Noise keeps every frame large
    QImage noise(640, 480, QImage::Format_RGB32);
    auto *random = QRandomGenerator::global();
    for (int y = 0; y < noise.height(); y++) {
        for (int x = 0; x < noise.width(); x++)
            noise.setPixel(x, y, 0xff000000 | random->bounded(0x1000000u));
    }
    display->image = noise;
    server->capturer()->setChangeDetectionEnabled(false);
    server->capturer()->setFps(60);
    constexpr qint64 Limit = 1024 * 1024;
    server->setMaximumScreenBacklog(Limit);

    // Logs in, then never reads
    QTcpSocket socket;
    socket.setReadBufferSize(4096);
    socket.connectToHost(QHostAddress::LocalHost, server->serverPort());
    QVERIFY(socket.waitForConnected(5000));
    QRdProtocol::AuthRequest request;
    request.username = u"user"_s;
    request.password = u"secret"_s;
    socket.write(QRdProtocol::encode(QRdProtocol::MessageKind::AuthRequest, request.toJson()));
    QTRY_VERIFY(server->activePeer() != nullptr);
    QRdPeer *peer = server->activePeer();

    QTRY_VERIFY_WITH_TIMEOUT(peer->bytesToWrite() > Limit, 20000);

    // The queue stops growing once it passes the limit
    QTest::qWait(1000);
    QVERIFY(peer->bytesToWrite() > Limit);
    QVERIFY(peer->bytesToWrite() < 4 * Limit);
    QCOMPARE(server->activePeer(), peer);
}

QTEST_MAIN(tst_qrdsession)
#include "tst_qrdsession.moc"
