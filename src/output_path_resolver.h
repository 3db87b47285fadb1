#pragma once
#include <QSet>
#include <QString>

// Computes collision-free output paths for one batch build.
//
// The output directory is the input's own directory when outputDir is empty,
// otherwise outputDir. With a configured outputDir and recursive scanning the
// input's sub-directory relative to the scan root is mirrored below it.
// The resolver remembers every path it hands out, so two inputs resolved
// through the same instance never share a target.
class OutputPathResolver {
public:
    OutputPathResolver(const QString& scanRoot, const QString& outputDir, bool recursive);

    // Resolves <stem>.jxl, then <stem>-1.jxl, <stem>-2.jxl, ... skipping
    // names already reserved or present on disk. Creates the target directory.
    // Returns false (DirectoryCreationError) with err set when it cannot.
    bool resolve(const QString& inputPath, QString& targetPath, QString& err);

    // Directory that resolve() would place the output of inputPath in.
    QString targetDirFor(const QString& inputPath) const;

    const QSet<QString>& reservedPaths() const { return m_reserved; }

private:
    QString m_scanRoot;
    QString m_outputDir;
    bool m_recursive = false;
    QSet<QString> m_reserved;
};
