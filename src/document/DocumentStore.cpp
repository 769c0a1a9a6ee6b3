#include "document/DocumentStore.h"

#include <QDebug>

DocumentStore::DocumentStore(QObject* parent)
    : QObject(parent)
{
}

void DocumentStore::setDocuments(const QVector<Document>& documents)
{
    m_documents = documents;
    m_currentIndex = m_documents.isEmpty() ? -1 : 0;
    qDebug() << "DocumentStore: Loaded" << m_documents.size() << "documents";
    emit documentsReset();
    emit currentIndexChanged(m_currentIndex);
}

void DocumentStore::addDocument(const Document& document)
{
    m_documents.append(document);
    if (m_currentIndex < 0) {
        m_currentIndex = 0;
        emit currentIndexChanged(m_currentIndex);
    }
    emit documentChanged(m_documents.size() - 1);
}

void DocumentStore::clear()
{
    setDocuments({});
}

void DocumentStore::setCurrentIndex(int index)
{
    if (index < 0 || index >= m_documents.size() || index == m_currentIndex) {
        return;
    }
    m_currentIndex = index;
    emit currentIndexChanged(m_currentIndex);
}

const Document* DocumentStore::current() const
{
    return document(m_currentIndex);
}

const Document* DocumentStore::document(int index) const
{
    if (index < 0 || index >= m_documents.size()) {
        return nullptr;
    }
    return &m_documents.at(index);
}

const Document* DocumentStore::documentById(const QString& id) const
{
    return document(indexOf(id));
}

int DocumentStore::indexOf(const QString& id) const
{
    for (int i = 0; i < m_documents.size(); ++i) {
        if (m_documents.at(i).id() == id) {
            return i;
        }
    }
    return -1;
}

Document* DocumentStore::mutableDocument(const QString& id, int* indexOut)
{
    const int index = indexOf(id);
    if (indexOut) {
        *indexOut = index;
    }
    if (index < 0) {
        qDebug() << "DocumentStore: Document" << id << "no longer exists";
        return nullptr;
    }
    return &m_documents[index];
}

bool DocumentStore::replaceDetection(const QString& id, const QVector<TextBlock>& blocks,
                                     const QImage& mask)
{
    int index = -1;
    Document* doc = mutableDocument(id, &index);
    if (!doc) {
        return false;
    }
    doc->setTextBlocks(blocks);
    doc->setSegmentationMask(mask);
    doc->setRendered(QImage());
    emit blocksChanged(index);
    emit documentChanged(index);
    return true;
}

bool DocumentStore::setBlockText(const QString& id, int blockIndex, const QString& text)
{
    int index = -1;
    Document* doc = mutableDocument(id, &index);
    if (!doc || blockIndex < 0 || blockIndex >= doc->textBlocks().size()) {
        return false;
    }
    doc->textBlocks()[blockIndex].text = text;
    emit documentChanged(index);
    return true;
}

bool DocumentStore::setBlockTranslation(const QString& id, int blockIndex,
                                        const QString& translation)
{
    int index = -1;
    Document* doc = mutableDocument(id, &index);
    if (!doc || blockIndex < 0 || blockIndex >= doc->textBlocks().size()) {
        return false;
    }
    TextBlock& block = doc->textBlocks()[blockIndex];
    block.translation = translation;
    block.rendered = QImage();
    emit documentChanged(index);
    return true;
}

bool DocumentStore::setSegmentationMask(const QString& id, const QImage& mask)
{
    int index = -1;
    Document* doc = mutableDocument(id, &index);
    if (!doc) {
        return false;
    }
    doc->setSegmentationMask(mask);
    emit documentChanged(index);
    return true;
}

bool DocumentStore::setInpainted(const QString& id, const QImage& image)
{
    int index = -1;
    Document* doc = mutableDocument(id, &index);
    if (!doc) {
        return false;
    }
    doc->setInpainted(image);
    emit documentChanged(index);
    return true;
}

bool DocumentStore::setRendered(const QString& id, const QImage& image)
{
    int index = -1;
    Document* doc = mutableDocument(id, &index);
    if (!doc) {
        return false;
    }
    doc->setRendered(image);
    emit documentChanged(index);
    return true;
}

bool DocumentStore::removeBlock(int documentIndex, int blockIndex)
{
    if (documentIndex < 0 || documentIndex >= m_documents.size()) {
        return false;
    }
    QVector<TextBlock>& blocks = m_documents[documentIndex].textBlocks();
    if (blockIndex < 0 || blockIndex >= blocks.size()) {
        return false;
    }
    blocks.removeAt(blockIndex);
    emit blockRemoved(documentIndex, blockIndex);
    emit documentChanged(documentIndex);
    return true;
}
