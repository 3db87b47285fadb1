#include "tui/tui_dialogs.h"

#include <QByteArray>
#include <memory>

#include <curses.h>

namespace {

constexpr int kEsc = 27;

using WindowPtr = std::unique_ptr<WINDOW, int (*)(WINDOW*)>;

WindowPtr centeredWindow(int height, int width)
{
    int h = 0, w = 0;
    getmaxyx(stdscr, h, w);
    width = qMin(width, qMax(w, 1));
    WINDOW* win = newwin(height, width, qMax((h - height) / 2, 0), qMax((w - width) / 2, 0));
    if (win) keypad(win, TRUE);
    return WindowPtr(win, delwin);
}

void restoreMainScreen()
{
    touchwin(stdscr);
    nodelay(stdscr, TRUE);
}

} // namespace

namespace TuiDialogs {

bool confirm(const QString& question)
{
    curs_set(0);
    WindowPtr win = centeredWindow(3, question.size() + 6);
    if (!win) return false;
    box(win.get(), 0, 0);
    mvwaddstr(win.get(), 1, 2, question.toUtf8().constData());
    nodelay(stdscr, FALSE);
    wrefresh(win.get());

    bool choice = false;
    for (;;) {
        const int key = wgetch(win.get());
        if (key == 'y' || key == 'Y') { choice = true; break; }
        if (key == 'n' || key == 'N' || key == kEsc) { choice = false; break; }
    }
    win.reset();
    restoreMainScreen();
    return choice;
}

bool inputText(const QString& prompt, const QString& initialValue, QString& value)
{
    curs_set(1);
    QString text = initialValue;
    WindowPtr win = centeredWindow(3, qMax(int(prompt.size() + text.size()), 40) + 6);
    if (!win) { curs_set(0); return false; }

    bool accepted = false;
    for (;;) {
        werase(win.get());
        box(win.get(), 0, 0);
        mvwaddstr(win.get(), 1, 2, QString("%1: %2").arg(prompt, text).toUtf8().constData());
        wrefresh(win.get());
        const int key = wgetch(win.get());
        if (key == KEY_RESIZE || key == kEsc) break;
        if (key == '\n' || key == KEY_ENTER) { accepted = true; break; }
        if (key == KEY_BACKSPACE || key == 127 || key == 8) text.chop(1);
        else if (key >= 32 && key <= 126) text.append(QChar(key));
    }
    win.reset();
    curs_set(0);
    restoreMainScreen();
    if (accepted) value = text;
    return accepted;
}

} // namespace TuiDialogs

bool CursesPrompter::confirm(const QString& question)
{
    return TuiDialogs::confirm(question);
}

bool CursesPrompter::promptText(const QString& label, const QString& initialValue, QString& value)
{
    return TuiDialogs::inputText(label, initialValue, value);
}
