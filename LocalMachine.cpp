#include "LocalMachine.h"
#include <QHostInfo>
#include <QNetworkInterface>

LocalMachine::LocalMachine(const QString &hostName, const QList<QHostAddress> &addresses)
    : m_hostName(hostName), m_addresses(addresses)
{
}

LocalMachine LocalMachine::current()
{
    return LocalMachine(QHostInfo::localHostName(), QNetworkInterface::allAddresses());
}

bool LocalMachine::isLocalAddress(const QHostAddress &address) const
{
    if (address.isLoopback())
        return true;

    for (const QHostAddress &local : m_addresses) {
        if (local.isEqual(address, QHostAddress::ConvertV4MappedToIPv4))
            return true;
    }
    return false;
}

bool LocalMachine::isLocalOrigin(const QString &hostName, const QHostAddress &address) const
{
    return hostName.compare(m_hostName, Qt::CaseInsensitive) == 0 && isLocalAddress(address);
}
