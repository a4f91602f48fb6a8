#pragma once
#include "key.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace karltui {

// Single-line text field. The cursor is a byte offset kept on UTF-8
// character boundaries.
class TextInput {
public:
    TextInput() = default;
    explicit TextInput(std::string placeholder) : placeholder_(std::move(placeholder)) {}

    TextInput& with_value(std::string value);

    // Returns true if the key was consumed.
    bool handle_key(const Key& key);

    void clear();
    void set_value(std::string value) { with_value(std::move(value)); }

    const std::string& value() const { return value_; }
    const std::string& placeholder() const { return placeholder_; }
    size_t cursor() const { return cursor_; }
    bool empty() const { return value_.empty(); }

private:
    std::string value_;
    size_t cursor_ = 0;
    std::string placeholder_;
};

// Multi-line text field; Enter inserts a line break.
class TextArea {
public:
    explicit TextArea(std::string placeholder = {}) : placeholder_(std::move(placeholder)) {}

    TextArea& with_text(const std::string& text);

    bool handle_key(const Key& key);

    std::string text() const;
    const std::vector<std::string>& lines() const { return lines_; }
    const std::string& placeholder() const { return placeholder_; }
    size_t row() const { return row_; }
    size_t col() const { return col_; }

private:
    std::vector<std::string> lines_{std::string()};
    size_t row_ = 0;
    size_t col_ = 0;
    std::string placeholder_;
};

// Pick one value from a list.
class Selector {
public:
    Selector() = default;
    explicit Selector(std::vector<std::string> options) : options_(std::move(options)) {}

    // Returns true if the selected value may have changed.
    bool handle_key(const Key& key);

    void next();
    void previous();
    bool select_by_value(const std::string& value);
    // Selects value, appending it first when it is not one of the options.
    void select_or_insert(const std::string& value);

    std::optional<std::string> selected_value() const;
    const std::vector<std::string>& options() const { return options_; }
    size_t selected() const { return selected_; }
    bool empty() const { return options_.empty(); }

private:
    std::vector<std::string> options_;
    size_t selected_ = 0;
};

class Toggle {
public:
    explicit Toggle(std::string label, bool value = false)
        : label_(std::move(label)), value_(value) {}

    bool handle_key(const Key& key);
    void toggle() { value_ = !value_; }

    bool value() const { return value_; }
    const std::string& label() const { return label_; }
    const char* display() const { return value_ ? "[x]" : "[ ]"; }

private:
    std::string label_;
    bool value_;
};

// Yes/No prompt; starts on the cancel button.
class ConfirmDialog {
public:
    ConfirmDialog(std::string title, std::string message)
        : title_(std::move(title)), message_(std::move(message)) {}

    void toggle() { confirmed_ = !confirmed_; }
    void select_confirm() { confirmed_ = true; }
    void select_cancel() { confirmed_ = false; }
    bool is_confirmed() const { return confirmed_; }

    const std::string& title() const { return title_; }
    const std::string& message() const { return message_; }
    const char* confirm_label() const { return "Yes"; }
    const char* cancel_label() const { return "No"; }

private:
    std::string title_;
    std::string message_;
    bool confirmed_ = false;
};

} // namespace karltui
