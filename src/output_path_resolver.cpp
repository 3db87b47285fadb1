#include "output_path_resolver.h"
#include "file_type_helpers.h"

#include <QDir>
#include <QFileInfo>

OutputPathResolver::OutputPathResolver(const QString& scanRoot, const QString& outputDir, bool recursive)
    : m_scanRoot(QDir::cleanPath(QFileInfo(scanRoot).absoluteFilePath()))
    , m_outputDir(outputDir.isEmpty() ? QString() : QDir::cleanPath(QFileInfo(outputDir).absoluteFilePath()))
    , m_recursive(recursive)
{
}

QString OutputPathResolver::targetDirFor(const QString& inputPath) const
{
    const QFileInfo inFi(inputPath);
    const QString inDir = inFi.absolutePath();
    if (m_outputDir.isEmpty()) return inDir;
    if (!m_recursive) return m_outputDir;

    // Mirror the sub-directory below the scan root; inputs outside it land flat.
    const QString rel = QDir(m_scanRoot).relativeFilePath(inDir);
    if (rel == QLatin1String(".") || rel.startsWith(QLatin1String(".."))) return m_outputDir;
    return QDir::cleanPath(QDir(m_outputDir).filePath(rel));
}

bool OutputPathResolver::resolve(const QString& inputPath, QString& targetPath, QString& err)
{
    err.clear();
    const QString dir = targetDirFor(inputPath);
    if (!QDir().mkpath(dir)) {
        err = QString("Cannot create output directory: %1").arg(dir);
        return false;
    }

    const QString stem = QFileInfo(inputPath).completeBaseName();
    const QString ext = targetExtension();
    QString cand = QDir(dir).filePath(QString("%1.%2").arg(stem, ext));
    for (int i = 1; m_reserved.contains(cand) || QFileInfo::exists(cand); ++i)
        cand = QDir(dir).filePath(QString("%1-%2.%3").arg(stem).arg(i).arg(ext));

    m_reserved.insert(cand);
    targetPath = cand;
    return true;
}
