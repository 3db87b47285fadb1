#pragma once
#include <QString>
#include <QVector>

// One image found by a directory scan. Immutable once loaded; identified by
// its position in the inventory vector.
struct FileEntry {
    QString path;      // absolute
    QString fileName;  // base name with extension
    QString suffix;    // extension without the dot, original case
    QString stem() const;
};

class FileInventory {
public:
    // Lists convertible images under rootDir (direct children only unless
    // recursive), sorted by file name case-insensitively. On failure returns an
    // empty list and fills error.
    static QVector<FileEntry> scan(const QString& rootDir, bool recursive, QString* error = nullptr);

    // Replaces the current contents with a fresh scan. Returns false on error;
    // the inventory is then empty.
    bool load(const QString& rootDir, bool recursive, QString* error = nullptr);

    const QVector<FileEntry>& entries() const { return m_entries; }
    int size() const { return m_entries.size(); }
    bool isValidIndex(int index) const { return index >= 0 && index < m_entries.size(); }
    const FileEntry& at(int index) const { return m_entries.at(index); }
    QString rootDir() const { return m_rootDir; }

private:
    QVector<FileEntry> m_entries;
    QString m_rootDir;
};
