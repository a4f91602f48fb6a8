#include "widgets.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace karltui {

namespace {

bool is_printable(char c) {
    // UTF-8 continuation and lead bytes are inserted as-is
    return static_cast<unsigned char>(c) >= 0x20 && c != 0x7f;
}

// Bytes of a multibyte sequence are never whitespace, whatever the locale.
bool is_space(char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x80 && std::isspace(u);
}

// Pull col back to the start of the character it falls inside.
size_t char_start(const std::string& line, size_t col) {
    col = std::min(col, line.size());
    while (col > 0 && col < line.size() &&
           (static_cast<unsigned char>(line[col]) & 0xC0) == 0x80)
        --col;
    return col;
}

} // namespace

// ── TextInput ────────────────────────────────────────────────────

TextInput& TextInput::with_value(std::string value) {
    value_ = std::move(value);
    cursor_ = value_.size();
    return *this;
}

void TextInput::clear() {
    value_.clear();
    cursor_ = 0;
}

bool TextInput::handle_key(const Key& key) {
    switch (key.code) {
        case KeyCode::Char:
            if (key.ctrl) {
                switch (key.ch) {
                    case 'a': cursor_ = 0; break;
                    case 'e': cursor_ = value_.size(); break;
                    case 'u':
                        value_.erase(0, cursor_);
                        cursor_ = 0;
                        break;
                    case 'k': value_.erase(cursor_); break;
                    case 'w': {
                        // Delete word backward
                        size_t start = cursor_;
                        while (start > 0 && is_space(value_[start - 1])) --start;
                        while (start > 0 && !is_space(value_[start - 1])) --start;
                        value_.erase(start, cursor_ - start);
                        cursor_ = start;
                        break;
                    }
                    default: return false;
                }
                return true;
            }
            if (!is_printable(key.ch)) return false;
            value_.insert(value_.begin() + static_cast<std::ptrdiff_t>(cursor_), key.ch);
            ++cursor_;
            return true;
        case KeyCode::Backspace:
            if (cursor_ > 0) {
                size_t start = utf8_prev(value_, cursor_);
                value_.erase(start, cursor_ - start);
                cursor_ = start;
            }
            return true;
        case KeyCode::Delete:
            if (cursor_ < value_.size())
                value_.erase(cursor_, utf8_next(value_, cursor_) - cursor_);
            return true;
        case KeyCode::Left:
            cursor_ = utf8_prev(value_, cursor_);
            return true;
        case KeyCode::Right:
            cursor_ = utf8_next(value_, cursor_);
            return true;
        case KeyCode::Home:
            cursor_ = 0;
            return true;
        case KeyCode::End:
            cursor_ = value_.size();
            return true;
        default:
            return false;
    }
}

// ── TextArea ─────────────────────────────────────────────────────

TextArea& TextArea::with_text(const std::string& text) {
    lines_ = split(text, '\n');
    if (lines_.empty() || (!text.empty() && text.back() == '\n')) lines_.emplace_back();
    row_ = lines_.size() - 1;
    col_ = lines_[row_].size();
    return *this;
}

std::string TextArea::text() const {
    std::string out;
    for (size_t i = 0; i < lines_.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines_[i];
    }
    return out;
}

bool TextArea::handle_key(const Key& key) {
    std::string& line = lines_[row_];
    switch (key.code) {
        case KeyCode::Char:
            if (key.ctrl || !is_printable(key.ch)) return false;
            line.insert(line.begin() + static_cast<std::ptrdiff_t>(col_), key.ch);
            ++col_;
            return true;
        case KeyCode::Enter: {
            std::string rest = line.substr(col_);
            line.erase(col_);
            lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(row_) + 1, rest);
            ++row_;
            col_ = 0;
            return true;
        }
        case KeyCode::Backspace:
            if (col_ > 0) {
                size_t start = utf8_prev(line, col_);
                line.erase(start, col_ - start);
                col_ = start;
            } else if (row_ > 0) {
                std::string tail = line;
                lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row_));
                --row_;
                col_ = lines_[row_].size();
                lines_[row_] += tail;
            }
            return true;
        case KeyCode::Delete:
            if (col_ < line.size()) {
                line.erase(col_, utf8_next(line, col_) - col_);
            } else if (row_ + 1 < lines_.size()) {
                line += lines_[row_ + 1];
                lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(row_) + 1);
            }
            return true;
        case KeyCode::Left:
            if (col_ > 0) {
                col_ = utf8_prev(line, col_);
            } else if (row_ > 0) {
                --row_;
                col_ = lines_[row_].size();
            }
            return true;
        case KeyCode::Right:
            if (col_ < line.size()) {
                col_ = utf8_next(line, col_);
            } else if (row_ + 1 < lines_.size()) {
                ++row_;
                col_ = 0;
            }
            return true;
        case KeyCode::Up:
            if (row_ > 0) {
                --row_;
                col_ = char_start(lines_[row_], col_);
            }
            return true;
        case KeyCode::Down:
            if (row_ + 1 < lines_.size()) {
                ++row_;
                col_ = char_start(lines_[row_], col_);
            }
            return true;
        case KeyCode::Home:
            col_ = 0;
            return true;
        case KeyCode::End:
            col_ = line.size();
            return true;
        default:
            return false;
    }
}

// ── Selector ─────────────────────────────────────────────────────

void Selector::next() {
    if (options_.empty()) return;
    selected_ = (selected_ + 1) % options_.size();
}

void Selector::previous() {
    if (options_.empty()) return;
    selected_ = selected_ == 0 ? options_.size() - 1 : selected_ - 1;
}

bool Selector::select_by_value(const std::string& value) {
    auto it = std::find(options_.begin(), options_.end(), value);
    if (it == options_.end()) return false;
    selected_ = static_cast<size_t>(it - options_.begin());
    return true;
}

void Selector::select_or_insert(const std::string& value) {
    if (select_by_value(value)) return;
    options_.push_back(value);
    selected_ = options_.size() - 1;
}

std::optional<std::string> Selector::selected_value() const {
    if (selected_ >= options_.size()) return std::nullopt;
    return options_[selected_];
}

bool Selector::handle_key(const Key& key) {
    if (key.code == KeyCode::Left || key.is_char('h')) {
        previous();
        return true;
    }
    if (key.code == KeyCode::Right || key.code == KeyCode::Enter ||
        key.is_char('l') || key.is_char(' ')) {
        next();
        return true;
    }
    return false;
}

// ── Toggle ───────────────────────────────────────────────────────

bool Toggle::handle_key(const Key& key) {
    if (key.is_char(' ') || key.code == KeyCode::Enter) {
        toggle();
        return true;
    }
    return false;
}

} // namespace karltui
