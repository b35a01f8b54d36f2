#pragma once

#include <QString>
#include <QList>
#include <QHostAddress>

// Host name and addresses of this machine, captured once per browser start.
class LocalMachine
{
public:
    LocalMachine() = default;
    LocalMachine(const QString &hostName, const QList<QHostAddress> &addresses);

    static LocalMachine current();

    QString hostName() const { return m_hostName; }
    QList<QHostAddress> addresses() const { return m_addresses; }

    // Loopback or one of the enumerated interface addresses.
    bool isLocalAddress(const QHostAddress &address) const;

    // Announcement origin test: same host name (case-insensitive) and a local address.
    bool isLocalOrigin(const QString &hostName, const QHostAddress &address) const;

private:
    QString m_hostName;
    QList<QHostAddress> m_addresses;
};
