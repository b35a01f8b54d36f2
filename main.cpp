#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>

#include "SalaamBrowser.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("salaam-browser");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Lists services announced with the Salaam protocol");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption typeOption(QStringList() << "t" << "type",
                                  "Service type to browse for, * for all",
                                  "type", "*");
    QCommandLineOption delayOption(QStringList() << "d" << "delay",
                                   "Seconds of silence before a service is dropped",
                                   "seconds", QString::number(SalaamBrowser::DefaultDisappearanceDelay));
    QCommandLineOption portOption(QStringList() << "p" << "port",
                                  "UDP port to listen on",
                                  "port", QString::number(SalaamMessage::DefaultPort));
    QCommandLineOption localOption(QStringList() << "l" << "local",
                                   "Also report services announced from this machine");
    parser.addOption(typeOption);
    parser.addOption(delayOption);
    parser.addOption(portOption);
    parser.addOption(localOption);
    parser.process(app);

    bool ok = false;
    const int delay = parser.value(delayOption).toInt(&ok);
    if (!ok || delay < 1) {
        qCritical() << "Invalid --delay value:" << parser.value(delayOption);
        return 1;
    }
    const quint16 port = parser.value(portOption).toUShort(&ok);
    if (!ok) {
        qCritical() << "Invalid --port value:" << parser.value(portOption);
        return 1;
    }

    SalaamBrowser browser;
    browser.setDisappearanceDelay(delay);
    browser.setPort(port);
    browser.setReceiveFromLocalMachine(parser.isSet(localOption));

    auto describe = [](const SalaamClient &client, bool isFromLocal) {
        return QString("%1 (%2) %3:%4 [%5] \"%6\"%7")
            .arg(client.name, client.serviceType, client.hostName)
            .arg(client.port)
            .arg(client.address.toString(), client.message,
                 isFromLocal ? QStringLiteral(" local") : QString());
    };

    QObject::connect(&browser, &SalaamBrowser::clientAppeared, [&](const SalaamClient &client, bool isFromLocal) {
        qInfo().noquote() << "+" << describe(client, isFromLocal);
    });
    QObject::connect(&browser, &SalaamBrowser::clientMessageChanged, [&](const SalaamClient &client, bool isFromLocal) {
        qInfo().noquote() << "*" << describe(client, isFromLocal);
    });
    QObject::connect(&browser, &SalaamBrowser::clientDisappeared, [&](const SalaamClient &client, bool isFromLocal) {
        qInfo().noquote() << "-" << describe(client, isFromLocal);
    });
    QObject::connect(&browser, &SalaamBrowser::browserFailed, &app, []() {
        qCritical() << "Browser failed";
        QCoreApplication::exit(2);
    });

    if (!browser.start(parser.value(typeOption))) {
        qCritical() << "Could not start browsing for" << parser.value(typeOption);
        return 1;
    }

    return app.exec();
}
