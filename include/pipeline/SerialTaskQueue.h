#ifndef SERIALTASKQUEUE_H
#define SERIALTASKQUEUE_H

#include <QObject>
#include <QQueue>
#include <QString>
#include <QVector>

#include <functional>
#include <memory>

/**
 * @brief FIFO executor for dependent asynchronous tasks on one surface.
 *
 * A task is started only after every task pushed before it on the same
 * chain has settled. A task settles by invoking the Done callback it is
 * handed, synchronously or later from the event loop. Failures are
 * reported to that task's own completion only; the chain keeps going.
 *
 * reset() detaches the current chain. Work already queued on it keeps
 * draining on its own while new pushes start a fresh chain.
 *
 * Not thread-safe: push, flush, reset and Done must all be called on the
 * thread that owns the queue.
 */
class SerialTaskQueue : public QObject
{
    Q_OBJECT

public:
    using Done = std::function<void(bool success, const QString& error)>;
    using Task = std::function<void(const Done& done)>;
    using Completion = std::function<void(bool success, const QString& error)>;
    using IdleCallback = std::function<void()>;

    explicit SerialTaskQueue(QObject* parent = nullptr);
    ~SerialTaskQueue() override;

    quint64 push(Task task, Completion onSettled = Completion());

    /**
     * @brief Call @p onIdle once everything pushed so far has settled.
     *
     * Invoked immediately when the current chain is already idle.
     */
    void flush(IdleCallback onIdle);

    void reset();

    int pendingCount() const;
    bool isBusy() const;

signals:
    void taskSettled(quint64 id, bool success, const QString& error);
    void drained();

private:
    struct Entry {
        quint64 id = 0;
        Task task;
        Completion onSettled;
    };

    struct Chain {
        QQueue<Entry> pending;
        QVector<IdleCallback> idleWaiters;
        bool running = false;
        bool draining = false;

        bool isIdle() const { return !running && pending.isEmpty(); }
    };

    static void drain(const std::shared_ptr<Chain>& chain, SerialTaskQueue* owner);
    void notifySettled(quint64 id, bool success, const QString& error);
    void notifyDrained(const std::shared_ptr<Chain>& chain);

    std::shared_ptr<Chain> m_chain;
    quint64 m_nextId = 1;
};

#endif // SERIALTASKQUEUE_H
