// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QFile>
#include <QtGui/QCursor>
#include <QtGui/QGuiApplication>
#include <QtNetwork/QSslCertificate>
#include <QtNetwork/QSslKey>

#include "qrdcapabilities.h"
#include "qrdscreencapturer.h"
#include "qrdserver.h"

#include <cstdio>

// Moves the local cursor. Button, wheel and key injection need platform APIs
// that Qt does not expose, so those events are reported as unsupported.
class CursorInjector : public QRdInputInjector
{
public:
    bool injectMouseEvent(const QRdProtocol::MouseEvent &event, QString *errorString) override
    {
        if (event.action == QRdProtocol::MouseAction::Scroll) {
            *errorString = u"scrolling is not supported on this platform"_s;
            return false;
        }
        QCursor::setPos(event.pos);
        if (event.action != QRdProtocol::MouseAction::Move) {
            *errorString = u"mouse buttons are not supported on this platform"_s;
            return false;
        }
        return true;
    }

    bool injectKeyboardEvent(const QRdProtocol::KeyboardEvent &event, QString *errorString) override
    {
        *errorString = u"key \"%1\" not injected, keyboard is not supported on this platform"_s.arg(event.key);
        return false;
    }
};

static bool loadSslConfiguration(const QString &certificatePath, const QString &keyPath,
                                 QSslConfiguration *configuration, QString *errorString)
{
    const auto certificates = QSslCertificate::fromPath(certificatePath);
    if (certificates.isEmpty()) {
        *errorString = u"no certificate found in %1"_s.arg(certificatePath);
        return false;
    }

    QFile file(keyPath);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorString = u"cannot open %1: %2"_s.arg(keyPath, file.errorString());
        return false;
    }
    const QSslKey key(&file, QSsl::Rsa);
    if (key.isNull()) {
        *errorString = u"%1 does not hold an RSA private key"_s.arg(keyPath);
        return false;
    }

    *configuration = QSslConfiguration::defaultConfiguration();
    configuration->setLocalCertificateChain(certificates);
    configuration->setPrivateKey(key);
    return true;
}

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Signal Slot Inc."));
    app.setOrganizationDomain("signal-slot.co.jp");
    app.setApplicationName("QtRemoteDesktop Server");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(u"Shares this display with remote desktop viewers."_s);
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption portOption({ u"p"_s, u"port"_s }, u"TCP port to listen on."_s, u"port"_s,
                                  QString::number(QRdProtocol::DefaultPort));
    QCommandLineOption fpsOption(u"fps"_s, u"Frames per second, 1 to 60."_s, u"fps"_s,
                                 QString::number(QRdScreenCapturer::DefaultFps));
    QCommandLineOption qualityOption(u"quality"_s, u"JPEG quality, 1 to 100."_s, u"quality"_s,
                                     QString::number(QRdScreenCapturer::DefaultQuality));
    QCommandLineOption certOption(u"cert"_s, u"PEM certificate; enables TLS together with --key."_s, u"file"_s);
    QCommandLineOption keyOption(u"key"_s, u"PEM private key for --cert."_s, u"file"_s);
    QCommandLineOption userOption(u"user"_s, u"Only accept this user name."_s, u"name"_s);
    QCommandLineOption passwordOption(u"password"_s, u"Password required with --user."_s, u"password"_s);
    parser.addOptions({ portOption, fpsOption, qualityOption, certOption, keyOption, userOption, passwordOption });
    parser.process(app);

    bool ok = false;
    const uint port = parser.value(portOption).toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        fprintf(stderr, "Invalid port: %s\n", qPrintable(parser.value(portOption)));
        return 1;
    }

    QRdScreenSource display;
    CursorInjector injector;
    QRdSystemClipboard clipboard;
    QRdServer server(&display, &injector, &clipboard);
    server.capturer()->setFps(parser.value(fpsOption).toInt());
    server.capturer()->setQuality(parser.value(qualityOption).toInt());

    if (parser.isSet(certOption) || parser.isSet(keyOption)) {
        QSslConfiguration configuration;
        QString errorString;
        if (!loadSslConfiguration(parser.value(certOption), parser.value(keyOption), &configuration, &errorString)) {
            fprintf(stderr, "TLS setup failed: %s\n", qPrintable(errorString));
            return 1;
        }
        server.setTlsEnabled(true);
        server.setSslConfiguration(configuration);
    }

    if (parser.isSet(userOption)) {
        const QString user = parser.value(userOption);
        const QString password = parser.value(passwordOption);
        server.setAuthenticator([user, password](const QString &username, const QString &secret, QString *message) {
            if (username != user || secret != password) {
                *message = u"Invalid user name or password"_s;
                return false;
            }
            *message = u"Welcome, %1"_s.arg(username);
            return true;
        });
    }

    if (!server.listen(QHostAddress::Any, static_cast<quint16>(port))) {
        fprintf(stderr, "Cannot listen on port %u: %s\n", port, qPrintable(server.errorString()));
        return 1;
    }

    return app.exec();
}
