#pragma once

// ============================================================================
// DocumentSnapshot - Immutable, versioned document bytes
// ============================================================================
// A session's bytes are never patched in place. Every commit creates a new
// snapshot with a new version; async jobs that started from an older version
// compare versions on completion and drop their result if it is stale.
// QByteArray's implicit sharing keeps the copies cheap.
// ============================================================================

#include <QByteArray>
#include <QtGlobal>

class DocumentSnapshot {
public:
    DocumentSnapshot() = default;

    /**
     * @brief Wrap bytes in a new snapshot with the next process-wide version.
     */
    static DocumentSnapshot create(const QByteArray& bytes);

    const QByteArray& bytes() const { return m_bytes; }
    quint64 version() const { return m_version; }
    qint64 size() const { return m_bytes.size(); }
    bool isNull() const { return m_version == 0; }

private:
    DocumentSnapshot(const QByteArray& bytes, quint64 version);

    QByteArray m_bytes;
    quint64 m_version = 0;  ///< 0 = null snapshot, real versions start at 1
};
