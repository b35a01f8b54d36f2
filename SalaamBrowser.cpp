#include "SalaamBrowser.h"
#include <QUdpSocket>
#include <QDebug>
#include <limits>

SalaamBrowser::SalaamBrowser(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<SalaamClient>();

    m_clock.start();

    setDisappearanceDelay(DefaultDisappearanceDelay);
    connect(&m_sweepTimer, &QTimer::timeout, this, &SalaamBrowser::removeExpiredClients);
}

SalaamBrowser::~SalaamBrowser()
{
    m_running = false;
    m_sweepTimer.stop();
    releaseSocket();
}

bool SalaamBrowser::start(const QString &serviceType)
{
    if (serviceType.contains(QLatin1Char(';'))) {
        qWarning() << "[BROWSER] Semicolon is not allowed in service type:" << serviceType;
        return false;
    }

    if (m_running)
        stop();

    m_registry.clear();
    m_localMachine = LocalMachine::current();
    m_failed = false;

    m_socket = new QUdpSocket(this);
    if (!m_socket->bind(QHostAddress::AnyIPv4, m_port,
                        QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        qWarning() << "[BROWSER] Failed to bind UDP port" << m_port << ":" << m_socket->errorString();
        m_sweepTimer.stop();
        releaseSocket();
        emit startFailed();
        return false;
    }

    connect(m_socket, &QUdpSocket::readyRead, this, &SalaamBrowser::handleDatagram);
    connect(m_socket, &QUdpSocket::errorOccurred, this, &SalaamBrowser::handleSocketError);

    m_serviceType = serviceType;
    m_sweepTimer.start();
    m_running = true;

    qDebug() << "[BROWSER] Browsing for" << m_serviceType << "on port" << m_socket->localPort()
             << "as" << m_localMachine.hostName();
    emit started();
    emit enabledChanged(true);
    return true;
}

void SalaamBrowser::stop()
{
    const bool wasRunning = m_running;
    m_running = false;

    m_sweepTimer.stop();
    releaseSocket();

    qDebug() << "[BROWSER] Stopped";
    emit stopped();
    if (wasRunning)
        emit enabledChanged(false);
}

void SalaamBrowser::releaseSocket()
{
    if (!m_socket)
        return;

    // The socket may be the sender of the signal being handled right now
    m_socket->disconnect(this);
    m_socket->close();
    m_socket->deleteLater();
    m_socket = nullptr;
}

bool SalaamBrowser::isEnabled() const
{
    return m_running;
}

void SalaamBrowser::setEnabled(bool enabled)
{
    if (enabled == m_running)
        return;

    if (enabled)
        start(m_serviceType);
    else
        stop();
}

QString SalaamBrowser::serviceType() const
{
    return m_serviceType;
}

int SalaamBrowser::disappearanceDelay() const
{
    return m_delay;
}

void SalaamBrowser::setDisappearanceDelay(int seconds)
{
    if (seconds < 1) {
        qWarning() << "[BROWSER] Disappearance delay must be at least 1 second, got" << seconds;
        seconds = 1;
    }

    m_delay = seconds;
    // Sweep five times per window; restarts the timer if it is running
    const qint64 interval = qint64(m_delay) * 1000 / 5;
    m_sweepTimer.setInterval(int(qBound<qint64>(1, interval, std::numeric_limits<int>::max())));
}

int SalaamBrowser::sweepInterval() const
{
    return m_sweepTimer.interval();
}

bool SalaamBrowser::receiveFromLocalMachine() const
{
    return m_receiveFromLocalMachine;
}

void SalaamBrowser::setReceiveFromLocalMachine(bool receive)
{
    m_receiveFromLocalMachine = receive;
}

quint16 SalaamBrowser::port() const
{
    return m_port;
}

void SalaamBrowser::setPort(quint16 port)
{
    m_port = port;
}

quint16 SalaamBrowser::localPort() const
{
    return m_socket ? m_socket->localPort() : 0;
}

QList<SalaamClient> SalaamBrowser::clients() const
{
    return m_registry.clients();
}

void SalaamBrowser::handleDatagram()
{
    while (m_socket && !m_failed && m_socket->hasPendingDatagrams()) {
        QByteArray buffer;
        buffer.resize(int(qMax<qint64>(0, m_socket->pendingDatagramSize())));

        QHostAddress sender;
        quint16 senderPort;

        if (m_socket->readDatagram(buffer.data(), buffer.size(), &sender, &senderPort) < 0) {
            qWarning() << "[BROWSER] Failed to read datagram:" << m_socket->errorString();
            reportFailure();
            return;
        }

        processDatagram(buffer, sender);
    }
}

void SalaamBrowser::handleSocketError(QAbstractSocket::SocketError error)
{
    qWarning() << "[BROWSER] Socket error" << error << ":" << (m_socket ? m_socket->errorString() : QString());
    reportFailure();
}

void SalaamBrowser::reportFailure()
{
    if (!m_running || m_failed)
        return;

    m_failed = true;
    qCritical() << "[BROWSER] Receiving stopped, restart the browser to recover";
    emit browserFailed();
}

bool SalaamBrowser::matchesServiceType(const QString &serviceType) const
{
    return m_serviceType == QLatin1String("*")
        || serviceType.compare(m_serviceType, Qt::CaseInsensitive) == 0;
}

void SalaamBrowser::processDatagram(const QByteArray &datagram, const QHostAddress &sender)
{
    if (!m_running)
        return;

    SalaamAnnouncement announcement;
    if (!SalaamMessage::decode(datagram, sender, &announcement))
        return;

    const bool isFromLocal = m_localMachine.isLocalOrigin(announcement.hostName, announcement.address);
    if (isFromLocal && !m_receiveFromLocalMachine)
        return;

    if (!matchesServiceType(announcement.serviceType))
        return;

    SalaamClient client(announcement.address, announcement.hostName, announcement.serviceType,
                        announcement.name, announcement.port, announcement.message);

    switch (m_registry.apply(&client, announcement.protocolCode, m_clock.elapsed())) {
    case ClientRegistry::Transition::Appeared:
        qDebug() << "[BROWSER] Appeared:" << client.name << client.hostName << client.address.toString();
        emit clientAppeared(client, isFromLocal);
        break;
    case ClientRegistry::Transition::MessageChanged:
        qDebug() << "[BROWSER] Message changed:" << client.name << client.message;
        emit clientMessageChanged(client, isFromLocal);
        break;
    case ClientRegistry::Transition::Disappeared:
        qDebug() << "[BROWSER] End of service:" << client.name << client.hostName;
        emit clientDisappeared(client, isFromLocal);
        break;
    case ClientRegistry::Transition::None:
        break;
    }
}

void SalaamBrowser::removeExpiredClients()
{
    const QList<SalaamClient> expired = m_registry.takeStale(m_clock.elapsed(), qint64(m_delay) * 1000);

    for (const SalaamClient &client : expired) {
        qDebug() << "[BROWSER] Timed out:" << client.name << client.hostName;
        emit clientDisappeared(client, m_localMachine.isLocalOrigin(client.hostName, client.address));
    }
}
