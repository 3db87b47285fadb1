#pragma once
#include <QString>

// Encode and browsing options edited from the UI. Plain values, read by the
// session controller when a batch is built; nothing is persisted.
struct ConverterSettings {
    static constexpr int kMinQuality = 1;
    static constexpr int kMaxQuality = 100;
    static constexpr int kMinEffort = 1;
    static constexpr int kMaxEffort = 9;

    int quality = 90;
    int effort = 7;
    bool recursive = false;
    bool deleteOriginals = false;
    QString outputDir;  // empty: next to each source file
    bool debugLogging = false;

    // Out-of-range values are rejected and leave the setting unchanged.
    bool setQuality(int value);
    bool setEffort(int value);

    bool sameAsSource() const { return outputDir.isEmpty(); }

    // <cwd>/converted
    static QString defaultOutputDir();
    // Expands a leading ~ and makes the path absolute and clean.
    static QString normalizeDir(const QString& path);
};

// Locations of the external tools; empty means not installed.
struct ToolPaths {
    QString encoder;
    QString sanitizer;

    bool hasEncoder() const { return !encoder.isEmpty(); }
    bool hasSanitizer() const { return !sanitizer.isEmpty(); }

    // cjxl for encoding; magick, else convert, for sanitizing.
    static ToolPaths locate();
};
