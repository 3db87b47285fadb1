#pragma once
#include <QString>

// Column geometry of the file list for a given terminal width.
struct ListLayout {
    int origX = 2;
    int origW = 0;
    int previewX = 0;
    int previewW = 0;
    int statusX = 0;
    int statusW = 0;
    int infoX = 0;
    int infoW = 0;
};

namespace TuiLayout {

constexpr int kMinRows = 10;
constexpr int kMinCols = 80;
constexpr int kChromeRows = 5;  // header, column titles, status bar, two footer lines

ListLayout computeLayout(int width);

// Truncates with a trailing ellipsis when the text does not fit in `width`
// cells, then pads with spaces to exactly `width`.
QString fitText(const QString& text, int width);

// Shortens a path to at most maxLen characters, preferring "first/.../last"
// and falling back to "...tail".
QString abbreviatePath(const QString& path, int maxLen);

} // namespace TuiLayout
