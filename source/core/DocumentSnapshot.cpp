#include "DocumentSnapshot.h"

#include <atomic>

namespace {
std::atomic<quint64> s_nextVersion{1};
}

DocumentSnapshot::DocumentSnapshot(const QByteArray& bytes, quint64 version)
    : m_bytes(bytes)
    , m_version(version)
{
}

DocumentSnapshot DocumentSnapshot::create(const QByteArray& bytes)
{
    return DocumentSnapshot(bytes, s_nextVersion.fetch_add(1));
}
