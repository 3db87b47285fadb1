#pragma once
#include <QString>

#include "user_prompter.h"

// Centered modal boxes drawn over the main screen. Both block until answered.
namespace TuiDialogs {

// y/Y answers yes; n/N or ESC answers no.
bool confirm(const QString& question);

// Single-line editor for printable ASCII. Enter accepts; ESC or a terminal
// resize cancels and returns false.
bool inputText(const QString& prompt, const QString& initialValue, QString& value);

} // namespace TuiDialogs

class CursesPrompter : public UserPrompter {
public:
    bool confirm(const QString& question) override;
    bool promptText(const QString& label, const QString& initialValue, QString& value) override;
};
