#pragma once

// ============================================================================
// TileLruStore - One cache level: key -> tile with recency order
// ============================================================================
// Pure bookkeeping. Limits and eviction policy live in TileCache, which
// decides what to take out and why.
// ============================================================================

#include "TileTypes.h"

#include <QHash>
#include <QString>
#include <QStringList>
#include <list>

class TileLruStore {
public:
    struct Entry {
        TileIdentity identity;
        CachedTileData data;
    };

    bool contains(const QString& key) const { return m_index.contains(key); }
    int count() const { return m_index.size(); }
    qint64 bytes() const { return m_bytes; }
    bool isEmpty() const { return m_index.isEmpty(); }

    /**
     * @brief Entry without touching recency, or nullptr.
     */
    const Entry* peek(const QString& key) const
    {
        auto it = m_index.constFind(key);
        return it == m_index.constEnd() ? nullptr : &it->entry;
    }

    /**
     * @brief Entry moved to most-recent, or nullptr.
     */
    const Entry* touch(const QString& key)
    {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return nullptr;
        }
        m_order.splice(m_order.begin(), m_order, it->position);
        return &it->entry;
    }

    /**
     * @brief Insert or replace. The entry becomes most-recent.
     */
    void insert(const QString& key, const Entry& entry)
    {
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            m_bytes -= it->entry.data.byteSize();
            it->entry = entry;
            m_order.splice(m_order.begin(), m_order, it->position);
        } else {
            m_order.push_front(key);
            Slot slot;
            slot.entry = entry;
            slot.position = m_order.begin();
            m_index.insert(key, slot);
        }
        m_bytes += entry.data.byteSize();
    }

    /**
     * @brief Remove @p key, optionally returning the removed entry.
     */
    bool take(const QString& key, Entry* removed = nullptr)
    {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return false;
        }
        if (removed) {
            *removed = it->entry;
        }
        m_bytes -= it->entry.data.byteSize();
        m_order.erase(it->position);
        m_index.erase(it);
        return true;
    }

    /**
     * @brief Remove the least recently used entry.
     */
    bool takeLeastRecent(QString* key, Entry* removed)
    {
        if (m_order.empty()) {
            return false;
        }
        const QString oldest = m_order.back();
        if (key) {
            *key = oldest;
        }
        return take(oldest, removed);
    }

    /**
     * @brief Keys, most recent first.
     */
    QStringList keys() const
    {
        QStringList result;
        result.reserve(static_cast<int>(m_order.size()));
        for (const QString& key : m_order) {
            result.append(key);
        }
        return result;
    }

    void clear()
    {
        m_index.clear();
        m_order.clear();
        m_bytes = 0;
    }

private:
    using OrderList = std::list<QString>;

    struct Slot {
        Entry entry;
        OrderList::iterator position;   ///< Stable across QHash rehashes
    };

    OrderList m_order;              ///< Front = most recently used
    QHash<QString, Slot> m_index;
    qint64 m_bytes = 0;
};
