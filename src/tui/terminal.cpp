#include "terminal.hpp"
#include <curses.h>
#include <clocale>
#include <stdexcept>

namespace karltui {

Terminal::Terminal() {
    // Multibyte text only displays with the user's locale in effect.
    std::setlocale(LC_ALL, "");
    if (initscr() == nullptr) {
        throw std::runtime_error("Failed to initialise terminal");
    }
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);

    if (::has_colors()) {
        start_color();
        use_default_colors();
        init_pair(kPairAccent, COLOR_CYAN, -1);
        init_pair(kPairSelected, COLOR_BLACK, COLOR_CYAN);
        init_pair(kPairSuccess, COLOR_GREEN, -1);
        init_pair(kPairError, COLOR_RED, -1);
        init_pair(kPairWarning, COLOR_YELLOW, -1);
        init_pair(kPairMuted, COLOR_WHITE, -1);
        colors_ = true;
    }
}

Terminal::~Terminal() {
    if (!suspended_) endwin();
}

std::optional<Key> Terminal::read_key(int timeout_ms) {
    timeout(timeout_ms);
    int ch = getch();
    if (ch == ERR) return std::nullopt;
    return translate_key(ch);
}

void Terminal::suspend() {
    def_prog_mode();
    endwin();
    suspended_ = true;
}

void Terminal::resume() {
    reset_prog_mode();
    suspended_ = false;
    clear();
    refresh();
}

Key translate_key(int ch) {
    switch (ch) {
        case KEY_UP:        return Key::special(KeyCode::Up);
        case KEY_DOWN:      return Key::special(KeyCode::Down);
        case KEY_LEFT:      return Key::special(KeyCode::Left);
        case KEY_RIGHT:     return Key::special(KeyCode::Right);
        case KEY_HOME:      return Key::special(KeyCode::Home);
        case KEY_END:       return Key::special(KeyCode::End);
        case KEY_DC:        return Key::special(KeyCode::Delete);
        case KEY_BTAB:      return Key::special(KeyCode::BackTab);
        case KEY_ENTER:
        case '\n':
        case '\r':          return Key::special(KeyCode::Enter);
        case KEY_BACKSPACE:
        case 127:
        case 8:             return Key::special(KeyCode::Backspace);
        case '\t':          return Key::special(KeyCode::Tab);
        case 27:            return Key::special(KeyCode::Esc);
        default:
            break;
    }
    if (ch >= 1 && ch <= 26) return Key::control(static_cast<char>('a' + ch - 1));
    if (ch >= 32 && ch < 256) return Key::character(static_cast<char>(ch));
    return Key::special(KeyCode::Unknown);
}

} // namespace karltui
