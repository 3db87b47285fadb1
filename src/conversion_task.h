#pragma once
#include <QString>

// One unit of work for the conversion worker. Built by the session controller
// at batch-build time and consumed exactly once; the worker reads nothing else.
struct ConversionTask {
    int index = -1;
    QString inputPath;
    QString targetPath;
    bool sanitize = false;

    // Encode settings captured when the batch was built.
    int quality = 90;
    int effort = 7;
    bool deleteOriginal = false;
};
