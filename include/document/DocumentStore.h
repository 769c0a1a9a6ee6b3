#ifndef DOCUMENTSTORE_H
#define DOCUMENTSTORE_H

#include "document/DocumentTypes.h"

#include <QObject>
#include <QVector>

/**
 * @brief Ordered page set with per-page derived artifacts.
 *
 * All mutation happens on the owning thread. Late asynchronous results
 * address pages by document id so they still land on the right page after
 * the current index moved.
 */
class DocumentStore : public QObject
{
    Q_OBJECT

public:
    explicit DocumentStore(QObject* parent = nullptr);

    void setDocuments(const QVector<Document>& documents);
    void addDocument(const Document& document);
    void clear();
    QVector<Document> documents() const { return m_documents; }

    int count() const { return m_documents.size(); }
    bool isEmpty() const { return m_documents.isEmpty(); }

    int currentIndex() const { return m_currentIndex; }
    void setCurrentIndex(int index);

    /// Current page, nullptr when the store is empty.
    const Document* current() const;
    const Document* document(int index) const;
    const Document* documentById(const QString& id) const;
    int indexOf(const QString& id) const;

    // Mutators addressed by document id. Each returns false when the
    // document no longer exists.
    bool replaceDetection(const QString& id, const QVector<TextBlock>& blocks, const QImage& mask);
    bool setBlockText(const QString& id, int blockIndex, const QString& text);
    bool setBlockTranslation(const QString& id, int blockIndex, const QString& translation);
    bool setSegmentationMask(const QString& id, const QImage& mask);
    bool setInpainted(const QString& id, const QImage& image);
    bool setRendered(const QString& id, const QImage& image);
    bool removeBlock(int documentIndex, int blockIndex);

signals:
    void documentsReset();
    void currentIndexChanged(int index);
    void documentChanged(int index);
    void blocksChanged(int index);
    void blockRemoved(int documentIndex, int blockIndex);

private:
    Document* mutableDocument(const QString& id, int* indexOut = nullptr);

    QVector<Document> m_documents;
    int m_currentIndex = -1;
};

#endif // DOCUMENTSTORE_H
