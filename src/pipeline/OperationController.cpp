#include "pipeline/OperationController.h"

#include <QDebug>
#include <QMetaObject>
#include <QPointer>
#include <QtMath>

QString operationTypeName(OperationType type)
{
    switch (type) {
    case OperationType::LoadProject:
        return QStringLiteral("load-project");
    case OperationType::SaveProject:
        return QStringLiteral("save-project");
    case OperationType::ProcessCurrentPage:
        return QStringLiteral("process-current-page");
    case OperationType::ProcessAllPages:
        return QStringLiteral("process-all-pages");
    case OperationType::LoadTranslationModel:
        return QStringLiteral("load-translation-model");
    }
    return QString();
}

OperationController::OperationController(QObject* parent)
    : QObject(parent)
{
}

bool OperationController::start(OperationType type, bool cancellable, int total)
{
    if (m_operation) {
        qWarning() << "OperationController: Cannot start" << operationTypeName(type)
                   << "while" << operationTypeName(m_operation->type) << "is active";
        return false;
    }

    Operation op;
    op.type = type;
    op.cancellable = cancellable;
    op.cancelRequested = false;
    op.total = qMax(0, total);
    m_operation = op;

    m_source = CancellationSource();
    m_token = m_source.token();

    qDebug() << "OperationController: Started" << operationTypeName(type)
             << "cancellable:" << cancellable << "total:" << op.total;
    emit operationStarted(type);
    return true;
}

void OperationController::update(const OperationUpdate& changes)
{
    if (!m_operation) {
        return;
    }
    if (changes.step) {
        m_operation->step = *changes.step;
    }
    if (changes.current) {
        m_operation->current = *changes.current;
    }
    if (changes.total) {
        m_operation->total = *changes.total;
    }
    if (changes.stageIndex) {
        m_operation->stageIndex = *changes.stageIndex;
    }
    if (changes.stageCount) {
        m_operation->stageCount = *changes.stageCount;
    }
    emit operationUpdated();
}

void OperationController::finish()
{
    if (!m_operation) {
        return;
    }
    const OperationType type = m_operation->type;
    const bool cancelled = m_operation->cancelRequested;
    m_operation.reset();
    m_token = CancellationToken();

    qDebug() << "OperationController: Finished" << operationTypeName(type)
             << (cancelled ? "(cancelled)" : "");
    emit operationFinished(type, cancelled);
}

bool OperationController::cancel()
{
    if (!m_operation || !m_operation->cancellable) {
        return false;
    }
    if (m_operation->cancelRequested) {
        return true;
    }

    m_operation->cancelRequested = true;
    m_source.cancel();
    qDebug() << "OperationController: Cancel requested for" << operationTypeName(m_operation->type);
    emit cancelRequested();
    emit operationUpdated();
    notifyExternalCancel();
    return true;
}

void OperationController::notifyExternalCancel()
{
    if (!m_cancelNotifier) {
        return;
    }
    // Fire-and-forget: runs after the current event, result only logged.
    CancelNotifier notifier = m_cancelNotifier;
    QPointer<OperationController> guard(this);
    QMetaObject::invokeMethod(this, [guard, notifier]() {
        if (!guard) {
            return;
        }
        QString error;
        if (!notifier(&error)) {
            qDebug() << "OperationController: External cancel notification failed:" << error;
        }
    }, Qt::QueuedConnection);
}

int OperationController::computePercent(int page, int pages, int stage, int stages)
{
    const int units = pages * stages;
    if (units <= 0) {
        return 0;
    }
    const qreal done = static_cast<qreal>(page) * stages + stage;
    return qRound(qBound(0.0, done / units * 100.0, 100.0));
}

int OperationController::percent() const
{
    if (!m_operation || m_operation->total <= 0) {
        return 0;
    }
    if (m_operation->stageCount > 0) {
        return computePercent(m_operation->current, m_operation->total,
                              m_operation->stageIndex, m_operation->stageCount);
    }
    return computePercent(m_operation->current, m_operation->total, 0, 1);
}
