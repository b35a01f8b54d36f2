#pragma once

#include <QObject>
#include <QHostAddress>
#include <QElapsedTimer>
#include <QTimer>
#include <QAbstractSocket>

#include "SalaamClient.h"
#include "SalaamMessage.h"
#include "ClientRegistry.h"
#include "LocalMachine.h"

class QUdpSocket;

// Listens for Salaam announcements and tracks the services that are currently alive.
class SalaamBrowser : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool enabled READ isEnabled WRITE setEnabled NOTIFY enabledChanged)
    Q_PROPERTY(int disappearanceDelay READ disappearanceDelay WRITE setDisappearanceDelay)
    Q_PROPERTY(bool receiveFromLocalMachine READ receiveFromLocalMachine WRITE setReceiveFromLocalMachine)
public:
    static constexpr int DefaultDisappearanceDelay = 4;

    explicit SalaamBrowser(QObject *parent = nullptr);
    ~SalaamBrowser() override;

    // Returns false without touching any state if serviceType contains ';'.
    // Other failures emit startFailed() and also return false; serviceType()
    // keeps the type of the last successful start.
    bool start(const QString &serviceType);
    void stop();

    bool isEnabled() const;
    void setEnabled(bool enabled);

    QString serviceType() const;

    // Seconds without an announcement before a service is dropped.
    int disappearanceDelay() const;
    void setDisappearanceDelay(int seconds);
    // Milliseconds between expiration sweeps, a fifth of the delay.
    int sweepInterval() const;

    bool receiveFromLocalMachine() const;
    void setReceiveFromLocalMachine(bool receive);

    // Takes effect on the next start(). 0 binds an ephemeral port.
    quint16 port() const;
    void setPort(quint16 port);
    quint16 localPort() const;

    QList<SalaamClient> clients() const;

    // Entry point for one received datagram: decode, filter, apply to the registry.
    void processDatagram(const QByteArray &datagram, const QHostAddress &sender);

signals:
    void clientAppeared(const SalaamClient &client, bool isFromLocal);
    void clientMessageChanged(const SalaamClient &client, bool isFromLocal);
    void clientDisappeared(const SalaamClient &client, bool isFromLocal);

    void started();
    void stopped();
    void startFailed();
    void browserFailed();

    void enabledChanged(bool enabled);

private slots:
    void handleDatagram();
    void handleSocketError(QAbstractSocket::SocketError error);
    void removeExpiredClients();

private:
    bool matchesServiceType(const QString &serviceType) const;
    void reportFailure();
    void releaseSocket();

    QUdpSocket *m_socket = nullptr;
    QTimer m_sweepTimer;
    QElapsedTimer m_clock;
    ClientRegistry m_registry;
    LocalMachine m_localMachine;

    QString m_serviceType = QStringLiteral("*");
    quint16 m_port = SalaamMessage::DefaultPort;
    int m_delay = DefaultDisappearanceDelay;
    bool m_receiveFromLocalMachine = false;
    bool m_running = false;
    bool m_failed = false;
};
