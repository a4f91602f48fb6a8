#pragma once

namespace karltui {

enum class KeyCode {
    Char,
    Enter,
    Esc,
    Backspace,
    Delete,
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    Tab,
    BackTab,
    Unknown,
};

// One input event, already translated from the terminal's key codes.
struct Key {
    KeyCode code = KeyCode::Unknown;
    char ch = 0;       // set when code == Char
    bool ctrl = false; // Ctrl held (ch is the lowercase letter)

    static Key character(char c) { return {KeyCode::Char, c, false}; }
    static Key control(char c) { return {KeyCode::Char, c, true}; }
    static Key special(KeyCode code) { return {code, 0, false}; }

    bool is_char(char c) const { return code == KeyCode::Char && !ctrl && ch == c; }
    bool is_ctrl(char c) const { return code == KeyCode::Char && ctrl && ch == c; }
};

} // namespace karltui
