#ifndef CANCELLATIONTOKEN_H
#define CANCELLATIONTOKEN_H

#include <QAtomicInt>

#include <memory>

/**
 * @brief Read side of a cooperative cancellation flag.
 *
 * Copies share one flag. A default-constructed token can never be
 * cancelled. Stage functions poll isCancelled() between steps.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    bool isCancelled() const { return m_flag && m_flag->loadAcquire() != 0; }
    bool canBeCancelled() const { return m_flag != nullptr; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<QAtomicInt> flag) : m_flag(std::move(flag)) {}

    std::shared_ptr<QAtomicInt> m_flag;
};

/**
 * @brief Owner side that issues tokens and flips the flag.
 */
class CancellationSource
{
public:
    CancellationSource() : m_flag(std::make_shared<QAtomicInt>(0)) {}

    CancellationToken token() const { return CancellationToken(m_flag); }
    void cancel() { m_flag->storeRelease(1); }
    bool isCancelled() const { return m_flag->loadAcquire() != 0; }

private:
    std::shared_ptr<QAtomicInt> m_flag;
};

#endif // CANCELLATIONTOKEN_H
