#include "pipeline/SerialTaskQueue.h"

#include <QDebug>
#include <QPointer>

#include <exception>

SerialTaskQueue::SerialTaskQueue(QObject* parent)
    : QObject(parent)
    , m_chain(std::make_shared<Chain>())
{
}

SerialTaskQueue::~SerialTaskQueue() = default;

quint64 SerialTaskQueue::push(Task task, Completion onSettled)
{
    Entry entry;
    entry.id = m_nextId++;
    entry.task = std::move(task);
    entry.onSettled = std::move(onSettled);

    const quint64 id = entry.id;
    m_chain->pending.enqueue(std::move(entry));
    drain(m_chain, this);
    return id;
}

void SerialTaskQueue::flush(IdleCallback onIdle)
{
    if (!onIdle) {
        return;
    }
    if (m_chain->isIdle()) {
        onIdle();
        return;
    }
    m_chain->idleWaiters.append(std::move(onIdle));
}

void SerialTaskQueue::reset()
{
    if (!m_chain->isIdle()) {
        qDebug() << "SerialTaskQueue: Detaching chain with" << m_chain->pending.size()
                 << "queued tasks";
    }
    m_chain = std::make_shared<Chain>();
}

int SerialTaskQueue::pendingCount() const
{
    return m_chain->pending.size() + (m_chain->running ? 1 : 0);
}

bool SerialTaskQueue::isBusy() const
{
    return !m_chain->isIdle();
}

void SerialTaskQueue::drain(const std::shared_ptr<Chain>& chain, SerialTaskQueue* owner)
{
    // A task that settles synchronously re-enters here from its Done
    // callback; the outer loop picks up the next entry instead.
    if (chain->draining) {
        return;
    }
    chain->draining = true;

    QPointer<SerialTaskQueue> guard(owner);
    while (!chain->running && !chain->pending.isEmpty()) {
        Entry entry = chain->pending.dequeue();
        chain->running = true;

        auto settled = std::make_shared<bool>(false);
        const quint64 id = entry.id;
        Completion onSettled = entry.onSettled;
        Done done = [chain, guard, id, onSettled, settled](bool success, const QString& error) {
            if (*settled) {
                qWarning() << "SerialTaskQueue: Task" << id << "settled more than once";
                return;
            }
            *settled = true;
            chain->running = false;
            if (onSettled) {
                onSettled(success, error);
            }
            if (guard) {
                guard->notifySettled(id, success, error);
            }
            drain(chain, guard.data());
        };

        try {
            entry.task(done);
        } catch (const std::exception& e) {
            qWarning() << "SerialTaskQueue: Task" << id << "threw:" << e.what();
            done(false, QString::fromUtf8(e.what()));
        }
    }

    chain->draining = false;

    if (chain->isIdle()) {
        const QVector<IdleCallback> waiters = std::move(chain->idleWaiters);
        chain->idleWaiters.clear();
        for (const IdleCallback& waiter : waiters) {
            waiter();
        }
        if (guard) {
            guard->notifyDrained(chain);
        }
    }
}

void SerialTaskQueue::notifySettled(quint64 id, bool success, const QString& error)
{
    if (!success) {
        qDebug() << "SerialTaskQueue: Task" << id << "failed:" << error;
    }
    emit taskSettled(id, success, error);
}

void SerialTaskQueue::notifyDrained(const std::shared_ptr<Chain>& chain)
{
    if (chain == m_chain) {
        emit drained();
    }
}
