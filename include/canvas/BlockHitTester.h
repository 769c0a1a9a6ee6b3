#ifndef BLOCKHITTESTER_H
#define BLOCKHITTESTER_H

#include "document/DocumentTypes.h"

#include <QObject>
#include <QPointF>
#include <QVector>

#include <optional>

class DocumentStore;

/**
 * @brief Text block selection and context-menu state for the current page.
 *
 * Indices follow block removals: a removed selection clears, later
 * selections shift down. The remembered context-menu index never survives
 * a removal.
 */
class BlockHitTester : public QObject
{
    Q_OBJECT

public:
    enum class ContextMenuResult {
        Ignored,        // No document; let the event through untouched
        SuppressMenu,   // Swallow the native menu, selection cleared
        ShowMenu        // Block selected and remembered for delete
    };

    explicit BlockHitTester(DocumentStore* store, QObject* parent = nullptr);

    // First block in storage order whose rectangle (edges inclusive)
    // contains the point, or -1.
    static int hitTest(const QPointF& point, const QVector<TextBlock>& blocks);

    ContextMenuResult onContextMenu(const std::optional<QPointF>& documentPoint);
    bool deleteSelected();
    void clearContextMenu();

    int select(const QPointF& documentPoint);
    void setSelectedIndex(int index);
    void clearSelection() { setSelectedIndex(-1); }

    int selectedIndex() const { return m_selectedIndex; }
    int contextMenuIndex() const { return m_contextMenuIndex; }

signals:
    void selectionChanged(int index);

private slots:
    void onBlockRemoved(int documentIndex, int blockIndex);
    void onBlocksReplaced();

private:
    DocumentStore* m_store;
    int m_selectedIndex = -1;
    int m_contextMenuIndex = -1;
};

#endif // BLOCKHITTESTER_H
