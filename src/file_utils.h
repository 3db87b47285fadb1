#pragma once

#include <QString>
#include <QFileInfo>
#include <QFile>
#include <QDateTime>

/**
 * FileUtils - Standardized file operations utilities
 *
 * Small helpers shared by the inventory, the path resolver and the worker.
 * Everything goes through QFileInfo/QFile so existence and size checks behave
 * the same way across modules.
 */
namespace FileUtils {

/**
 * Check if a regular file exists at the given path.
 *
 * @param filePath The file path to check
 * @return true if the file exists and is a regular file, false otherwise
 */
inline bool fileExists(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() && fi.isFile();
}

/**
 * Size in bytes of a file, or 0 when it does not exist.
 */
inline qint64 fileSize(const QString& filePath)
{
    QFileInfo fi(filePath);
    return fi.exists() ? fi.size() : 0;
}

/**
 * Remove a file if present. Missing files are not an error.
 *
 * @return true if the file is gone afterwards
 */
inline bool removeIfExists(const QString& filePath)
{
    if (!QFileInfo::exists(filePath)) return true;
    return QFile::remove(filePath);
}

/**
 * Copy permissions and access/modification times from one file to another.
 *
 * @param src File whose metadata is copied
 * @param dst File receiving the metadata
 * @return false if any part could not be applied
 */
inline bool copyFileMetadata(const QString& src, const QString& dst)
{
    const QFileInfo srcFi(src);
    if (!srcFi.exists()) return false;
    // Times first: a read-only mode copied from the source would block the open.
    QFile f(dst);
    if (!f.open(QIODevice::ReadWrite)) return false;
    bool ok = f.setFileTime(srcFi.lastModified(), QFileDevice::FileModificationTime);
    ok = f.setFileTime(srcFi.lastRead(), QFileDevice::FileAccessTime) && ok;
    f.close();
    ok = QFile::setPermissions(dst, QFile::permissions(src)) && ok;
    return ok;
}

} // namespace FileUtils
