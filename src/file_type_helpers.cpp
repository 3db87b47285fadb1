#include "file_type_helpers.h"

namespace {

inline QString normalize(const QString& ext)
{
    return ext.toLower();
}

} // namespace

bool isConvertibleImage(const QString& ext)
{
    static const QSet<QString> exts = {
        "jpg","jpeg","png","gif","apng","tif","tiff"
    };
    return exts.contains(normalize(ext));
}

bool isJpegFile(const QString& ext)
{
    const QString lower = normalize(ext);
    return lower == "jpg" || lower == "jpeg";
}
