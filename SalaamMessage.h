#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QString>

// One decoded announcement, produced per datagram and not retained.
struct SalaamAnnouncement
{
    QString hostName;
    QString serviceType;
    QString name;
    quint16 port = 0;
    QString message;
    QHostAddress address;
    QString protocolCode; // empty when the datagram carries no control code
};

class SalaamMessage
{
public:
    static constexpr quint16 DefaultPort = 54183;

    // End-of-service control code: the publisher is going away.
    static const QString EndOfService;

    // Validates both wire layers of a datagram. Returns false for anything that is
    // not a well-formed announcement; the datagram is then meant to be dropped.
    static bool decode(const QByteArray &datagram, const QHostAddress &sender,
                       SalaamAnnouncement *announcement);

private:
    static bool decodeEnvelope(const QByteArray &datagram, QString *payload);
    static bool decodePayload(const QString &payload, SalaamAnnouncement *announcement);
};
