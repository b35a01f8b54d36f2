#include "ClientRegistry.h"
#include "SalaamMessage.h"
#include <QMutexLocker>
#include <QtGlobal>

bool ClientRegistry::find(const SalaamClientKey &key, Entry *entry) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.constFind(key);
    if (it == m_entries.constEnd())
        return false;
    if (entry)
        *entry = it.value();
    return true;
}

bool ClientRegistry::insert(const SalaamClient &client, qint64 now)
{
    QMutexLocker locker(&m_mutex);
    const SalaamClientKey key = client.key();
    if (m_entries.contains(key))
        return false;
    m_entries.insert(key, Entry{ client, now });
    return true;
}

bool ClientRegistry::touch(const SalaamClientKey &key, qint64 now)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    it->lastSeen = qMax(it->lastSeen, now);
    return true;
}

bool ClientRegistry::setMessage(const SalaamClientKey &key, const QString &message)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    it->client.message = message;
    return true;
}

bool ClientRegistry::remove(const SalaamClientKey &key, SalaamClient *removed)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return false;
    if (removed)
        *removed = it->client;
    m_entries.erase(it);
    return true;
}

ClientRegistry::Transition ClientRegistry::apply(SalaamClient *client,
                                                 const QString &protocolCode, qint64 now)
{
    QMutexLocker locker(&m_mutex);
    const SalaamClientKey key = client->key();
    auto it = m_entries.find(key);

    if (it == m_entries.end()) {
        // Control codes never create an entry
        if (!protocolCode.isEmpty())
            return Transition::None;
        m_entries.insert(key, Entry{ *client, now });
        return Transition::Appeared;
    }

    it->lastSeen = qMax(it->lastSeen, now);

    if (protocolCode.isEmpty()) {
        if (it->client.message == client->message)
            return Transition::None;
        it->client.message = client->message;
        *client = it->client;
        return Transition::MessageChanged;
    }

    if (protocolCode.compare(SalaamMessage::EndOfService, Qt::CaseInsensitive) == 0) {
        *client = it->client;
        m_entries.erase(it);
        return Transition::Disappeared;
    }

    // Unrecognized codes only count as a sign of life
    return Transition::None;
}

QList<SalaamClient> ClientRegistry::takeStale(qint64 now, qint64 window)
{
    QMutexLocker locker(&m_mutex);
    QList<SalaamClient> stale;

    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (now - it->lastSeen > window) {
            stale.append(it->client);
            it = m_entries.erase(it);
        } else {
            ++it;
        }
    }
    return stale;
}

QList<SalaamClient> ClientRegistry::clients() const
{
    QMutexLocker locker(&m_mutex);
    QList<SalaamClient> result;
    result.reserve(m_entries.size());
    for (const Entry &entry : m_entries)
        result.append(entry.client);
    return result;
}

int ClientRegistry::size() const
{
    QMutexLocker locker(&m_mutex);
    return int(m_entries.size());
}

void ClientRegistry::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
}
