#include "SalaamMessage.h"
#include <QRegularExpression>
#include <QDebug>

const QString SalaamMessage::EndOfService = QStringLiteral("EOS");

namespace {

const QRegularExpression &envelopePattern()
{
    static const QRegularExpression re(QRegularExpression::anchoredPattern(
        QStringLiteral("Salaam:(?<base64>(?:[A-Za-z0-9+/]{4})*(?:[A-Za-z0-9+/]{2}==|[A-Za-z0-9+/]{3}=)?)")));
    return re;
}

const QRegularExpression &payloadPattern()
{
    static const QRegularExpression re(QRegularExpression::anchoredPattern(
        QStringLiteral("(?<length>[0-9]+);(?<hostName>.*?);(?<serviceType>.*?);(?<name>.*?);"
                       "(?<port>[0-9]+);(?<message>.*);(?:<(?<code>[A-Z][A-Z0-9]{2,3})>)?")));
    return re;
}

}

bool SalaamMessage::decode(const QByteArray &datagram, const QHostAddress &sender,
                           SalaamAnnouncement *announcement)
{
    QString payload;
    if (!decodeEnvelope(datagram, &payload))
        return false;

    SalaamAnnouncement result;
    if (!decodePayload(payload, &result))
        return false;

    result.address = sender;
    if (announcement)
        *announcement = result;
    return true;
}

bool SalaamMessage::decodeEnvelope(const QByteArray &datagram, QString *payload)
{
    const QRegularExpressionMatch match = envelopePattern().match(QString::fromUtf8(datagram));
    if (!match.hasMatch())
        return false;

    const QByteArray::FromBase64Result decoded = QByteArray::fromBase64Encoding(
        match.captured(QStringLiteral("base64")).toLatin1(),
        QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        qDebug() << "[DECODER] Invalid base64 in envelope";
        return false;
    }

    *payload = QString::fromUtf8(decoded.decoded);
    return true;
}

bool SalaamMessage::decodePayload(const QString &payload, SalaamAnnouncement *announcement)
{
    const QRegularExpressionMatch match = payloadPattern().match(payload);
    if (!match.hasMatch()) {
        qDebug() << "[DECODER] Payload does not match the announcement format";
        return false;
    }

    bool ok = false;
    const int length = match.captured(QStringLiteral("length")).toInt(&ok);
    if (!ok)
        return false;

    // Declared length counts what follows "<length>;"
    const qint64 expected = qint64(length) + QString::number(length).size() + 1;
    if (payload.size() != expected) {
        qDebug() << "[DECODER] Length mismatch: declared" << length << "actual" << payload.size();
        return false;
    }

    const quint16 port = match.captured(QStringLiteral("port")).toUShort(&ok);
    if (!ok)
        return false;

    announcement->hostName = match.captured(QStringLiteral("hostName"));
    announcement->serviceType = match.captured(QStringLiteral("serviceType"));
    announcement->name = match.captured(QStringLiteral("name"));
    announcement->port = port;
    announcement->message = match.captured(QStringLiteral("message"));
    announcement->protocolCode = match.captured(QStringLiteral("code"));
    return true;
}
