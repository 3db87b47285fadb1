#pragma once
#include <QSet>
#include <QVector>

// Which inventory indices are marked for conversion, and whether the list is
// filtered down to failed files. Independent of conversion status.
class SelectionModel {
public:
    // New inventory of `count` files: nothing selected, filter off.
    void reset(int count);

    int fileCount() const { return m_count; }

    bool isSelected(int index) const { return m_selected.contains(index); }
    void toggle(int index);
    void selectAll(const QVector<int>& indices);
    void setSelection(const QSet<int>& indices);
    void clear() { m_selected.clear(); }

    int count() const { return m_selected.size(); }
    bool isEmpty() const { return m_selected.isEmpty(); }
    QSet<int> selection() const { return m_selected; }
    QVector<int> sortedSelection() const;

    bool failedOnly() const { return m_failedOnly; }
    void setFailedOnly(bool on) { m_failedOnly = on; }

    // Rows to show, as inventory indices in ascending order.
    QVector<int> visibleIndices(const QSet<int>& failed) const;

private:
    bool inRange(int index) const { return index >= 0 && index < m_count; }

    QSet<int> m_selected;
    int m_count = 0;
    bool m_failedOnly = false;
};
