#include "file_inventory.h"
#include "file_type_helpers.h"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include <algorithm>

QString FileEntry::stem() const
{
    return QFileInfo(fileName).completeBaseName();
}

QVector<FileEntry> FileInventory::scan(const QString& rootDir, bool recursive, QString* error)
{
    QVector<FileEntry> out;
    const QFileInfo rootFi(rootDir);
    if (!rootFi.exists() || !rootFi.isDir()) {
        if (error) *error = QString("Directory not found: %1").arg(rootDir);
        return out;
    }
    if (!rootFi.isReadable()) {
        if (error) *error = QString("Directory not readable: %1").arg(rootDir);
        return out;
    }

    const QDirIterator::IteratorFlags flags = recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags;
    QDirIterator it(rootFi.absoluteFilePath(), QDir::Files | QDir::NoDotAndDotDot, flags);
    while (it.hasNext()) {
        it.next();
        const QFileInfo fi = it.fileInfo();
        if (!fi.isFile() || !isConvertibleImage(fi.suffix())) continue;
        FileEntry e;
        e.path = fi.absoluteFilePath();
        e.fileName = fi.fileName();
        e.suffix = fi.suffix();
        out.push_back(e);
    }

    // Row indices depend on this order; ties fall back to the full path so
    // repeated scans of an unchanged tree map indices identically.
    std::sort(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b) {
        const int c = QString::compare(a.fileName, b.fileName, Qt::CaseInsensitive);
        if (c != 0) return c < 0;
        return a.path < b.path;
    });
    if (error) error->clear();
    return out;
}

bool FileInventory::load(const QString& rootDir, bool recursive, QString* error)
{
    QString err;
    m_rootDir = QFileInfo(rootDir).absoluteFilePath();
    m_entries = scan(rootDir, recursive, &err);
    if (error) *error = err;
    return err.isEmpty();
}
