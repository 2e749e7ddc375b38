#pragma once
#include <QAtomicInt>

// Cooperative cancellation flag shared between a caller and a running
// execution. Safe to set from any thread.
class CancelToken {
public:
    void cancel() { m_cancelled.storeRelease(1); }
    bool isCancelled() const { return m_cancelled.loadAcquire() != 0; }

private:
    QAtomicInt m_cancelled;
};
