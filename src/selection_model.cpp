#include "selection_model.h"

#include <algorithm>

void SelectionModel::reset(int count)
{
    m_count = qMax(0, count);
    m_selected.clear();
    m_failedOnly = false;
}

void SelectionModel::toggle(int index)
{
    if (!inRange(index)) return;
    if (m_selected.contains(index)) m_selected.remove(index);
    else m_selected.insert(index);
}

void SelectionModel::selectAll(const QVector<int>& indices)
{
    m_selected.clear();
    for (int i : indices) {
        if (inRange(i)) m_selected.insert(i);
    }
}

void SelectionModel::setSelection(const QSet<int>& indices)
{
    m_selected.clear();
    for (int i : indices) {
        if (inRange(i)) m_selected.insert(i);
    }
}

QVector<int> SelectionModel::sortedSelection() const
{
    QVector<int> out(m_selected.cbegin(), m_selected.cend());
    std::sort(out.begin(), out.end());
    return out;
}

QVector<int> SelectionModel::visibleIndices(const QSet<int>& failed) const
{
    QVector<int> out;
    if (m_failedOnly) {
        for (int i : failed) {
            if (inRange(i)) out.push_back(i);
        }
        std::sort(out.begin(), out.end());
        return out;
    }
    out.reserve(m_count);
    for (int i = 0; i < m_count; ++i) out.push_back(i);
    return out;
}
