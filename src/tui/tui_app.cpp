#include "tui/tui_app.h"
#include "tui/tui_dialogs.h"
#include "tui/tui_layout.h"
#include "session_controller.h"
#include "utils.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <clocale>

#include <curses.h>

namespace {

constexpr int kEsc = 27;
constexpr int kTickMs = 20;

// Colour pairs, 1-based as initialised by CursesSession.
enum Pair {
    kTitlePair = 1,     // black on white
    kGreenPair = 2,
    kYellowPair = 3,
    kRedPair = 4,
    kCyanPair = 5,
    kActivePair = 6,    // black on green
    kMagentaPair = 7,
    kBluePair = 8
};

int tonePair(StatusTone tone)
{
    switch (tone) {
    case StatusTone::Neutral: return kCyanPair;
    case StatusTone::Highlight: return kYellowPair;
    case StatusTone::Queued: return kBluePair;
    case StatusTone::Busy: return kMagentaPair;
    case StatusTone::Good: return kGreenPair;
    case StatusTone::Bad: return kRedPair;
    }
    return kRedPair;
}

int levelPair(SessionController::MessageLevel level)
{
    switch (level) {
    case SessionController::MessageLevel::Info: return kCyanPair;
    case SessionController::MessageLevel::Success: return kGreenPair;
    case SessionController::MessageLevel::Warning: return kYellowPair;
    case SessionController::MessageLevel::Error: return kRedPair;
    }
    return kCyanPair;
}

// Writes clipped to the line; curses errors at the right edge are ignored.
void putText(int y, int x, const QString& text, int attr = A_NORMAL)
{
    int h = 0, w = 0;
    getmaxyx(stdscr, h, w);
    if (y < 0 || y >= h || x < 0 || x >= w) return;
    wattrset(stdscr, attr);
    mvwaddnstr(stdscr, y, x, text.toUtf8().constData(), -1);
    wattrset(stdscr, A_NORMAL);
}

bool isNavigationKey(int key)
{
    return key == KEY_UP || key == 'k' || key == KEY_DOWN || key == 'j'
        || key == KEY_PPAGE || key == KEY_NPAGE || key == 'g' || key == 'G';
}

} // namespace

CursesSession::CursesSession()
{
    std::setlocale(LC_ALL, "");
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    if (has_colors()) {
        start_color();
        init_pair(kTitlePair, COLOR_BLACK, COLOR_WHITE);
        init_pair(kGreenPair, COLOR_GREEN, COLOR_BLACK);
        init_pair(kYellowPair, COLOR_YELLOW, COLOR_BLACK);
        init_pair(kRedPair, COLOR_RED, COLOR_BLACK);
        init_pair(kCyanPair, COLOR_CYAN, COLOR_BLACK);
        init_pair(kActivePair, COLOR_BLACK, COLOR_GREEN);
        init_pair(kMagentaPair, COLOR_MAGENTA, COLOR_BLACK);
        init_pair(kBluePair, COLOR_BLUE, COLOR_BLACK);
    }
    curs_set(0);
    nodelay(stdscr, TRUE);
}

CursesSession::~CursesSession()
{
    endwin();
}

TuiApp::TuiApp(SessionController& controller)
    : m_controller(controller)
{
}

int TuiApp::pageRows() const
{
    return qMax(getmaxy(stdscr) - TuiLayout::kChromeRows, 1);
}

void TuiApp::run()
{
    for (;;) {
        QVector<int> keys;
        for (int key = wgetch(stdscr); key != ERR; key = wgetch(stdscr)) keys.push_back(key);
        if (!keys.isEmpty()) m_controller.clearSummary();

        QVector<int> ordered;
        int lastNav = ERR;
        for (int key : keys) {
            if (isNavigationKey(key)) lastNav = key;
            else ordered.push_back(key);
        }
        if (lastNav != ERR) ordered.push_back(lastNav);

        for (int key : ordered) {
            if (key == kEsc || key == 'q') {
                if (isQuitConfirmed()) return;
                continue;
            }
            handleKey(key, m_controller.visibleIndices());
        }

        QCoreApplication::processEvents();
        m_controller.poll();

        const QVector<int> visible = m_controller.visibleIndices();
        if (m_currentRow >= visible.size()) m_currentRow = qMax(int(visible.size()) - 1, 0);
        keepCursorVisible(visible.size());
        draw(visible);
        napms(kTickMs);
    }
}

bool TuiApp::isQuitConfirmed()
{
    if (!m_controller.isBatchActive()) return true;
    return TuiDialogs::confirm("Still converting. Quit anyway?");
}

void TuiApp::handleKey(int key, const QVector<int>& visible)
{
    m_controller.clearMessage();
    const int count = visible.size();
    const int page = pageRows();

    switch (key) {
    case KEY_UP:
    case 'k':
        if (m_currentRow > 0) --m_currentRow;
        break;
    case KEY_DOWN:
    case 'j':
        if (m_currentRow < count - 1) ++m_currentRow;
        break;
    case KEY_PPAGE:
        m_currentRow = qMax(0, m_currentRow - page);
        break;
    case KEY_NPAGE:
        m_currentRow = qMax(0, qMin(count - 1, m_currentRow + page));
        break;
    case 'g':
        m_currentRow = m_scrollOffset = 0;
        break;
    case 'G':
        m_currentRow = qMax(count - 1, 0);
        break;
    case ' ':
        if (m_currentRow < count) m_controller.selection().toggle(visible.at(m_currentRow));
        break;
    case 'a':
        m_controller.selection().selectAll(visible);
        break;
    case 'A':
        m_controller.selection().clear();
        break;
    case '\n':
    case KEY_ENTER:
        m_controller.startBatch();
        break;
    case KEY_F(5):
        if (m_controller.reload()) m_currentRow = m_scrollOffset = 0;
        break;
    case 'f':
    case 'F':
        if (m_controller.toggleFailedFilter()) m_currentRow = m_scrollOffset = 0;
        break;
    case 'b':
    case 'B':
        m_controller.toggleDebugLogging();
        break;
    case 'Q':
        m_controller.editQuality();
        break;
    case 'e':
    case 'E':
        m_controller.editEffort();
        break;
    case 'r':
    case 'R':
        if (m_controller.toggleRecursive()) m_currentRow = m_scrollOffset = 0;
        break;
    case 'o':
    case 'O':
        m_controller.editOutputDir();
        break;
    case 'd':
    case 'D':
        m_controller.toggleDeleteOriginals();
        break;
    default:
        break;
    }
    keepCursorVisible(count);
}

void TuiApp::keepCursorVisible(int visibleCount)
{
    const int page = pageRows();
    if (m_currentRow < m_scrollOffset) m_scrollOffset = m_currentRow;
    if (m_currentRow >= m_scrollOffset + page) m_scrollOffset = m_currentRow - page + 1;
    if (m_scrollOffset > qMax(visibleCount - 1, 0)) m_scrollOffset = qMax(visibleCount - 1, 0);
}

void TuiApp::draw(const QVector<int>& visible)
{
    werase(stdscr);
    int h = 0, w = 0;
    getmaxyx(stdscr, h, w);
    if (h < TuiLayout::kMinRows || w < TuiLayout::kMinCols) {
        putText(0, 0, "Terminal too small...");
    } else {
        drawHeader(w);
        drawFileList(h, w, visible);
        drawStatusBar(h, w);
        drawFooter(h, w);
    }
    wrefresh(stdscr);
}

void TuiApp::drawHeader(int w)
{
    putText(0, 0, QString(w - 1, QLatin1Char(' ')), COLOR_PAIR(kBluePair));
    const QString title = " JxlBatch ";
    putText(0, 2, title, COLOR_PAIR(kTitlePair) | A_BOLD);

    const int contentX = title.size() + 4;
    const int available = w - contentX - 1;
    const StatusAggregator& agg = m_controller.aggregator();
    const BatchSession& batch = agg.batch();

    QString content;
    if (batch.active) {
        content = QString("Converting: %1/%2 | Saved: %3 | Elapsed: %4")
                      .arg(batch.processed()).arg(batch.totalSelected)
                      .arg(Utils::formatBytes(batch.savedBytes()), Utils::formatClock(batch.elapsedMs()));
    } else if (!agg.lastSummary().isEmpty()) {
        content = agg.lastSummary();
    } else {
        const QString sourceLabel = "Source: ";
        const QString outputLabel = " | Output: ";
        const int perPath = (available - sourceLabel.size() - outputLabel.size()) / 2;
        const ConverterSettings& s = m_controller.settings();
        const QString output = s.sameAsSource() ? QStringLiteral("Same as Source") : TuiLayout::abbreviatePath(s.outputDir, perPath);
        content = sourceLabel + TuiLayout::abbreviatePath(m_controller.rootDir(), perPath) + outputLabel + output;
        if (m_controller.selection().failedOnly()) content += " | FILTER: FAILED";
    }
    putText(0, contentX, content.left(qMax(available, 0)), COLOR_PAIR(kBluePair));
}

void TuiApp::drawFileList(int h, int w, const QVector<int>& visible)
{
    const ListLayout layout = TuiLayout::computeLayout(w);
    const int headerAttr = COLOR_PAIR(kGreenPair) | A_BOLD;
    putText(1, 0, QString(w - 1, QLatin1Char(' ')), headerAttr);
    putText(1, layout.origX, "Original", headerAttr);
    putText(1, layout.previewX, "Target JXL (*=Selected)", headerAttr);
    putText(1, layout.statusX, "Status", headerAttr);
    putText(1, layout.infoX, "Info / Savings", headerAttr);

    const FileInventory& inventory = m_controller.inventory();
    const SelectionModel& selection = m_controller.selection();
    const StatusAggregator& agg = m_controller.aggregator();
    const int maxRows = h - TuiLayout::kChromeRows;
    for (int i = 0; i < maxRows; ++i) {
        const int row = i + m_scrollOffset;
        if (row >= visible.size()) break;
        const int index = visible.at(row);
        if (!inventory.isValidIndex(index) || !agg.isValidIndex(index)) continue;

        const int y = 2 + i;
        const int attr = row == m_currentRow ? A_REVERSE : A_NORMAL;
        const bool selected = selection.isSelected(index);
        const StatusRecord& rec = agg.record(index);
        const ConversionStatus shown = displayStatus(rec.status, selected);
        const int statusAttr = attr | COLOR_PAIR(tonePair(statusTone(shown)));

        putText(y, 0, QString(w - 1, QLatin1Char(' ')), attr);
        putText(y, layout.origX, TuiLayout::fitText(inventory.at(index).fileName, layout.origW), attr);
        const QString target = QString("%1 %2").arg(selected ? QStringLiteral("*") : QStringLiteral(" "), m_controller.targetName(index));
        putText(y, layout.previewX, TuiLayout::fitText(target, layout.previewW), attr | (selected ? COLOR_PAIR(kYellowPair) : 0));
        putText(y, layout.statusX, TuiLayout::fitText(statusLabel(shown), layout.statusW), statusAttr);
        putText(y, layout.infoX, TuiLayout::fitText(rec.infoStr, layout.infoW - 1), statusAttr);
    }
}

void TuiApp::drawStatusBar(int h, int w)
{
    putText(h - 3, 0, QString(w - 1, QLatin1Char(' ')));
    const QString msg = m_controller.lastMessage();
    if (!msg.isEmpty()) putText(h - 3, 2, msg.left(qMax(w - 3, 0)), COLOR_PAIR(levelPair(m_controller.lastMessageLevel())));
}

int TuiApp::drawKeyHelper(int y, int x, const QString& key, const QString& text, bool active)
{
    const int keyAttr = active ? (COLOR_PAIR(kActivePair) | A_BOLD) : COLOR_PAIR(kGreenPair);
    const int textAttr = active ? (COLOR_PAIR(kYellowPair) | A_BOLD) : COLOR_PAIR(kCyanPair);
    putText(y, x, QString("(%1)").arg(key), keyAttr);
    putText(y, x + key.size() + 2, " " + text, textAttr);
    return x + key.size() + text.size() + 3 + 2;
}

void TuiApp::drawFooter(int h, int w)
{
    const int top = h - 2;
    const int bottom = h - 1;
    putText(top, 0, QString(w - 1, QLatin1Char(' ')));
    putText(bottom, 0, QString(w - 1, QLatin1Char(' ')));

    struct Toggle { QString key; QString text; bool active; };
    const ConverterSettings& s = m_controller.settings();
    QVector<Toggle> toggles = {
        {"Q", QString("Qual:%1").arg(s.quality), false},
        {"E", QString("Eff:%1").arg(s.effort), false},
        {"R", "Recur", s.recursive},
        {"D", "DelOrig", s.deleteOriginals},
        {"O", "Out Dir", !s.sameAsSource()},
        {"B", "Bug Log", s.debugLogging},
    };
    if (m_controller.hasFailures()) toggles.push_back({"F", "Filter Failed", m_controller.selection().failedOnly()});

    int x = 2;
    for (const Toggle& t : toggles) {
        if (x + t.key.size() + t.text.size() + 5 > w) break;
        x = drawKeyHelper(top, x, t.key, t.text, t.active);
    }

    x = 2;
    x = drawKeyHelper(bottom, x, QString::fromUtf8("↑↓/jk"), "Nav");
    x = drawKeyHelper(bottom, x, "Space", "Select");
    x = drawKeyHelper(bottom, x, "a/A", "All/None");
    x = drawKeyHelper(bottom, x, "Enter", "Convert");
    drawKeyHelper(bottom, x, "F5", "Refresh");
    const QString quit = "(ESC/q) Quit";
    putText(bottom, w - quit.size() - 2, quit, COLOR_PAIR(kGreenPair));
}
