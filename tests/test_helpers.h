#pragma once

#include <QByteArray>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QList>
#include <QString>
#include <QThread>
#include <functional>

#include "SalaamBrowser.h"

namespace test_helpers {

// Builds "<N>;<body>" where N is the size of body plus lengthDelta.
inline QString makePayload(const QString &hostName, const QString &serviceType,
                           const QString &name, quint16 port, const QString &message,
                           const QString &code = QString(), int lengthDelta = 0)
{
    QString body = hostName + ";" + serviceType + ";" + name + ";"
        + QString::number(port) + ";" + message + ";";
    if (!code.isEmpty())
        body += "<" + code + ">";
    return QString::number(body.size() + lengthDelta) + ";" + body;
}

inline QByteArray wrap(const QString &payload)
{
    return "Salaam:" + payload.toUtf8().toBase64();
}

inline QByteArray makeDatagram(const QString &hostName, const QString &serviceType,
                               const QString &name, quint16 port, const QString &message,
                               const QString &code = QString())
{
    return wrap(makePayload(hostName, serviceType, name, port, message, code));
}

// Pumps the event loop until condition holds or timeoutMs elapses.
inline bool waitUntil(const std::function<bool()> &condition, int timeoutMs = 3000)
{
    QElapsedTimer timer;
    timer.start();
    while (!condition()) {
        if (timer.elapsed() > timeoutMs)
            return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
        QThread::msleep(5);
    }
    return true;
}

inline void pumpEvents(int durationMs)
{
    waitUntil([] { return false; }, durationMs);
}

struct Notification {
    SalaamClient client;
    bool isFromLocal = false;
};

// Records every signal a browser emits.
struct EventRecorder
{
    QList<Notification> appeared;
    QList<Notification> changed;
    QList<Notification> disappeared;
    int started = 0;
    int stopped = 0;
    int startFailed = 0;
    int browserFailed = 0;

    explicit EventRecorder(SalaamBrowser *browser)
    {
        QObject::connect(browser, &SalaamBrowser::clientAppeared, [this](const SalaamClient &c, bool local) {
            appeared.append(Notification{ c, local });
        });
        QObject::connect(browser, &SalaamBrowser::clientMessageChanged, [this](const SalaamClient &c, bool local) {
            changed.append(Notification{ c, local });
        });
        QObject::connect(browser, &SalaamBrowser::clientDisappeared, [this](const SalaamClient &c, bool local) {
            disappeared.append(Notification{ c, local });
        });
        QObject::connect(browser, &SalaamBrowser::started, [this]() { ++started; });
        QObject::connect(browser, &SalaamBrowser::stopped, [this]() { ++stopped; });
        QObject::connect(browser, &SalaamBrowser::startFailed, [this]() { ++startFailed; });
        QObject::connect(browser, &SalaamBrowser::browserFailed, [this]() { ++browserFailed; });
    }

    int total() const { return appeared.size() + changed.size() + disappeared.size(); }
};

} // namespace test_helpers
