#pragma once
#include <QString>

// Blocking dialogs the session controller needs from whatever front end runs it.
class UserPrompter {
public:
    virtual ~UserPrompter() = default;

    virtual bool confirm(const QString& question) = 0;

    // Returns false when the user cancels; `value` is then untouched.
    virtual bool promptText(const QString& label, const QString& initialValue, QString& value) = 0;
};
