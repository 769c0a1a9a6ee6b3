#ifndef OPERATIONCONTROLLER_H
#define OPERATIONCONTROLLER_H

#include "pipeline/CancellationToken.h"

#include <QObject>
#include <QString>

#include <functional>
#include <optional>

enum class OperationType {
    LoadProject,
    SaveProject,
    ProcessCurrentPage,
    ProcessAllPages,
    LoadTranslationModel
};

QString operationTypeName(OperationType type);

/**
 * @brief The single long-running operation shown to the user.
 */
struct Operation {
    OperationType type = OperationType::ProcessCurrentPage;
    QString step;
    int current = 0;
    int total = 0;
    int stageIndex = 0;
    int stageCount = 0;
    bool cancellable = false;
    bool cancelRequested = false;
};

/**
 * @brief Partial update applied to the active operation; unset fields keep
 * their value.
 */
struct OperationUpdate {
    std::optional<QString> step;
    std::optional<int> current;
    std::optional<int> total;
    std::optional<int> stageIndex;
    std::optional<int> stageCount;
};

/**
 * @brief Idle/Running state machine for the active operation.
 *
 * cancel() only raises a flag and cancels the operation's token. Running
 * stages poll the token between steps and call finish() themselves.
 */
class OperationController : public QObject
{
    Q_OBJECT

public:
    // Best-effort external cancellation hook. Returning false reports a
    // failure, which is logged and otherwise ignored.
    using CancelNotifier = std::function<bool(QString* errorMessage)>;

    explicit OperationController(QObject* parent = nullptr);

    /**
     * @brief Start a new operation.
     * @return false when another operation is still active.
     */
    bool start(OperationType type, bool cancellable, int total = 0);
    void update(const OperationUpdate& changes);
    void finish();
    bool cancel();

    bool isActive() const { return m_operation.has_value(); }
    std::optional<Operation> operation() const { return m_operation; }
    bool isCancelRequested() const { return m_operation && m_operation->cancelRequested; }
    CancellationToken cancellationToken() const { return m_token; }

    int percent() const;
    static int computePercent(int page, int pages, int stage, int stages);

    void setCancelNotifier(CancelNotifier notifier) { m_cancelNotifier = std::move(notifier); }

signals:
    void operationStarted(OperationType type);
    void operationUpdated();
    void operationFinished(OperationType type, bool cancelled);
    void cancelRequested();

private:
    void notifyExternalCancel();

    std::optional<Operation> m_operation;
    CancellationSource m_source;
    CancellationToken m_token;
    CancelNotifier m_cancelNotifier;
};

#endif // OPERATIONCONTROLLER_H
