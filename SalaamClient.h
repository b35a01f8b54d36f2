#pragma once

#include <QString>
#include <QHostAddress>
#include <QHash>
#include <QMetaType>
#include <QtGlobal>

// Identity of an announced service instance. The status message is not part of it.
struct SalaamClientKey
{
    QHostAddress address;
    QString hostName;
    QString serviceType;
    QString name;
    quint16 port = 0;

    bool operator==(const SalaamClientKey &other) const {
        return port == other.port
            && address.isEqual(other.address, QHostAddress::ConvertV4MappedToIPv4)
            && hostName == other.hostName
            && serviceType == other.serviceType
            && name == other.name;
    }
    bool operator!=(const SalaamClientKey &other) const { return !(*this == other); }
};

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
using SalaamHashValue = size_t;
#else
using SalaamHashValue = uint;
#endif

inline SalaamHashValue qHash(const SalaamClientKey &key, SalaamHashValue seed = 0)
{
    // v4-mapped and plain v4 must hash alike since they compare equal
    bool isV4 = false;
    const quint32 v4 = key.address.toIPv4Address(&isV4);
    const SalaamHashValue addressHash = isV4 ? ::qHash(v4, seed) : ::qHash(key.address.toString(), seed);

    return addressHash
        ^ ::qHash(key.hostName, seed)
        ^ (::qHash(key.serviceType, seed) << 1)
        ^ (::qHash(key.name, seed) << 2)
        ^ ::qHash(key.port, seed);
}

struct SalaamClient
{
    QHostAddress address;
    QString hostName;
    QString serviceType;
    QString name;
    quint16 port = 0;
    QString message;

    SalaamClient() = default;
    SalaamClient(const QHostAddress &a, const QString &h, const QString &t,
                 const QString &n, quint16 p, const QString &m)
        : address(a), hostName(h), serviceType(t), name(n), port(p), message(m) {}

    SalaamClientKey key() const {
        return SalaamClientKey{ address, hostName, serviceType, name, port };
    }
};

Q_DECLARE_METATYPE(SalaamClient)
