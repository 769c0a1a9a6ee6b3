#include "canvas/BlockHitTester.h"

#include "document/DocumentStore.h"

#include <QDebug>

BlockHitTester::BlockHitTester(DocumentStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    if (m_store) {
        connect(m_store, &DocumentStore::blockRemoved, this, &BlockHitTester::onBlockRemoved);
        connect(m_store, &DocumentStore::blocksChanged, this, [this](int documentIndex) {
            if (documentIndex == m_store->currentIndex()) {
                onBlocksReplaced();
            }
        });
        connect(m_store, &DocumentStore::documentsReset, this, &BlockHitTester::onBlocksReplaced);
        connect(m_store, &DocumentStore::currentIndexChanged, this, &BlockHitTester::onBlocksReplaced);
    }
}

int BlockHitTester::hitTest(const QPointF& point, const QVector<TextBlock>& blocks)
{
    for (int i = 0; i < blocks.size(); ++i) {
        if (blocks.at(i).contains(point)) {
            return i;
        }
    }
    return -1;
}

BlockHitTester::ContextMenuResult BlockHitTester::onContextMenu(
    const std::optional<QPointF>& documentPoint)
{
    const Document* doc = m_store ? m_store->current() : nullptr;
    if (!doc) {
        return ContextMenuResult::Ignored;
    }

    if (!documentPoint) {
        m_contextMenuIndex = -1;
        clearSelection();
        return ContextMenuResult::SuppressMenu;
    }

    const int index = hitTest(*documentPoint, doc->textBlocks());
    if (index < 0) {
        m_contextMenuIndex = -1;
        clearSelection();
        return ContextMenuResult::SuppressMenu;
    }

    setSelectedIndex(index);
    m_contextMenuIndex = index;
    return ContextMenuResult::ShowMenu;
}

bool BlockHitTester::deleteSelected()
{
    if (m_contextMenuIndex < 0 || !m_store) {
        return false;
    }
    const int index = m_contextMenuIndex;
    m_contextMenuIndex = -1;
    if (!m_store->removeBlock(m_store->currentIndex(), index)) {
        qWarning() << "BlockHitTester: Remembered block" << index << "is gone";
        return false;
    }
    return true;
}

void BlockHitTester::clearContextMenu()
{
    m_contextMenuIndex = -1;
}

int BlockHitTester::select(const QPointF& documentPoint)
{
    const Document* doc = m_store ? m_store->current() : nullptr;
    setSelectedIndex(doc ? hitTest(documentPoint, doc->textBlocks()) : -1);
    return m_selectedIndex;
}

void BlockHitTester::setSelectedIndex(int index)
{
    if (m_selectedIndex == index) {
        return;
    }
    m_selectedIndex = index;
    emit selectionChanged(index);
}

void BlockHitTester::onBlockRemoved(int documentIndex, int blockIndex)
{
    if (!m_store || documentIndex != m_store->currentIndex()) {
        return;
    }
    m_contextMenuIndex = -1;

    if (m_selectedIndex == blockIndex) {
        setSelectedIndex(-1);
    } else if (m_selectedIndex > blockIndex) {
        setSelectedIndex(m_selectedIndex - 1);
    }
}

void BlockHitTester::onBlocksReplaced()
{
    m_contextMenuIndex = -1;
    setSelectedIndex(-1);
}
