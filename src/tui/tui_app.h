#pragma once
#include <QString>
#include <QVector>

class SessionController;

// Owns the curses screen for its lifetime: raw-ish key input, no echo,
// hidden cursor, non-blocking reads and the fixed colour pairs.
class CursesSession {
public:
    CursesSession();
    ~CursesSession();

    CursesSession(const CursesSession&) = delete;
    CursesSession& operator=(const CursesSession&) = delete;
};

// Full-screen file list driven by a SessionController. run() returns when
// the user quits.
class TuiApp {
public:
    explicit TuiApp(SessionController& controller);

    void run();

private:
    // Returns true when the key should end the program.
    bool isQuitConfirmed();
    void handleKey(int key, const QVector<int>& visible);
    void keepCursorVisible(int visibleCount);

    void draw(const QVector<int>& visible);
    void drawHeader(int w);
    void drawFileList(int h, int w, const QVector<int>& visible);
    void drawStatusBar(int h, int w);
    void drawFooter(int h, int w);
    int drawKeyHelper(int y, int x, const QString& key, const QString& text, bool active = false);

    int pageRows() const;

    SessionController& m_controller;
    int m_currentRow = 0;
    int m_scrollOffset = 0;
};
