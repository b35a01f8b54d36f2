#pragma once

#include <QHash>
#include <QList>
#include <QMutex>
#include "SalaamClient.h"

// Currently visible service instances with the time each was last announced.
// Timestamps are milliseconds on whatever monotonic clock the owner uses.
class ClientRegistry
{
public:
    enum class Transition {
        None,
        Appeared,
        MessageChanged,
        Disappeared
    };

    struct Entry {
        SalaamClient client;
        qint64 lastSeen = 0;
    };

    bool find(const SalaamClientKey &key, Entry *entry = nullptr) const;
    bool insert(const SalaamClient &client, qint64 now);
    bool touch(const SalaamClientKey &key, qint64 now);
    bool setMessage(const SalaamClientKey &key, const QString &message);
    bool remove(const SalaamClientKey &key, SalaamClient *removed = nullptr);

    // Applies one announcement of `client` under a single lock. `client` receives
    // the stored instance after the transition (or the removed one).
    Transition apply(SalaamClient *client, const QString &protocolCode, qint64 now);

    // Removes and returns every entry not refreshed for more than `window` ms.
    QList<SalaamClient> takeStale(qint64 now, qint64 window);

    QList<SalaamClient> clients() const;
    int size() const;
    void clear();

private:
    mutable QMutex m_mutex;
    QHash<SalaamClientKey, Entry> m_entries;
};
