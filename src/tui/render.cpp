#include "render.hpp"
#include "terminal.hpp"
#include "../util.hpp"
#include <curses.h>
#include <algorithm>
#include <string>
#include <vector>

namespace karltui {

namespace {

// attron/attroff for one scope
class ScopedAttr {
public:
    explicit ScopedAttr(attr_t attr) : attr_(attr) { attron(attr_); }
    ~ScopedAttr() { attroff(attr_); }
    ScopedAttr(const ScopedAttr&) = delete;
    ScopedAttr& operator=(const ScopedAttr&) = delete;
private:
    attr_t attr_;
};

// Byte offset after `chars` characters starting at `from`.
size_t advance_chars(const std::string& text, size_t from, size_t chars) {
    while (chars-- > 0 && from < text.size()) from = utf8_next(text, from);
    return from;
}

size_t count_chars(const std::string& text, size_t from, size_t to) {
    size_t n = 0;
    while (from < to) {
        from = utf8_next(text, from);
        ++n;
    }
    return n;
}

// Width is in characters; a multibyte character is never cut.
void put(int y, int x, const std::string& text, int width) {
    if (width <= 0 || y < 0 || y >= LINES) return;
    size_t len = advance_chars(text, 0, static_cast<size_t>(width));
    mvaddnstr(y, x, text.c_str(), static_cast<int>(len));
}

// Reverse-video cell for the character at byte offset pos (a space past the end).
void put_cursor(int y, int x, const std::string& text, size_t pos) {
    std::string under = pos < text.size() ? text.substr(pos, utf8_next(text, pos) - pos) : " ";
    ScopedAttr rev(A_REVERSE);
    mvaddstr(y, x, under.c_str());
}

void blank(int y, int x, int h, int w) {
    std::string spaces(static_cast<size_t>(std::max(w, 0)), ' ');
    for (int row = y; row < y + h; ++row) put(row, x, spaces, w);
}

void draw_box(int y, int x, int h, int w, const std::string& title) {
    blank(y, x, h, w);
    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + w - 1, ACS_URCORNER);
    mvaddch(y + h - 1, x, ACS_LLCORNER);
    mvaddch(y + h - 1, x + w - 1, ACS_LRCORNER);
    mvhline(y, x + 1, ACS_HLINE, w - 2);
    mvhline(y + h - 1, x + 1, ACS_HLINE, w - 2);
    mvvline(y + 1, x, ACS_VLINE, h - 2);
    mvvline(y + 1, x + w - 1, ACS_VLINE, h - 2);
    if (!title.empty()) {
        ScopedAttr bold(A_BOLD | COLOR_PAIR(kPairAccent));
        put(y, x + 2, " " + title + " ", w - 4);
    }
}

// Text field with the cursor cell reversed when focused.
void draw_input(int y, int x, int width, const TextInput& input, bool focused) {
    if (input.empty() && !focused) {
        ScopedAttr dim(A_DIM);
        put(y, x, input.placeholder(), width);
        return;
    }
    const std::string& value = input.value();
    size_t cursor = input.cursor();
    size_t column = count_chars(value, 0, cursor);
    size_t skip = column >= static_cast<size_t>(width) ? column - static_cast<size_t>(width) + 1 : 0;
    size_t first = advance_chars(value, 0, skip);
    put(y, x, value.substr(first), width);
    if (focused) put_cursor(y, x + static_cast<int>(column - skip), value, cursor);
}

void draw_selector(int y, int x, int width, const Selector& selector, bool focused) {
    std::string text = selector.empty()
        ? "(none)"
        : "< " + selector.selected_value().value_or("") + " >";
    ScopedAttr attr(focused ? A_BOLD : A_NORMAL);
    put(y, x, text, width);
}

void draw_toggle(int y, int x, int width, const Toggle& toggle, bool focused) {
    ScopedAttr attr(focused ? A_BOLD : A_NORMAL);
    put(y, x, std::string(toggle.display()) + " " + toggle.label(), width);
}

// Returns rows used.
int draw_textarea(int y, int x, int width, int max_rows, const TextArea& area, bool focused) {
    const auto& lines = area.lines();
    if (lines.size() == 1 && lines[0].empty() && !focused) {
        ScopedAttr dim(A_DIM);
        put(y, x, area.placeholder(), width);
        return 1;
    }
    size_t first = area.row() >= static_cast<size_t>(max_rows)
        ? area.row() - static_cast<size_t>(max_rows) + 1 : 0;
    int used = 0;
    for (size_t i = first; i < lines.size() && used < max_rows; ++i, ++used) {
        put(y + used, x, lines[i], width);
        if (focused && i == area.row()) {
            size_t column = count_chars(lines[i], 0, area.col());
            if (column < static_cast<size_t>(width))
                put_cursor(y + used, x + static_cast<int>(column), lines[i], area.col());
        }
    }
    return std::max(used, 1);
}

void draw_label(int y, int x, const char* label, bool focused) {
    ScopedAttr attr(focused ? (A_BOLD | COLOR_PAIR(kPairAccent)) : A_NORMAL);
    put(y, x, std::string(focused ? "> " : "  ") + label, 18);
}

// ── Lists ───────────────────────────────────────────────────────

template<typename T, typename LineFn>
void draw_list(const FilteredList<T>& list, int top, int height, int width, LineFn line) {
    if (list.empty()) {
        ScopedAttr dim(A_DIM);
        put(top, 2, list.total_count() == 0 ? "Nothing here yet" : "No matches", width - 2);
        return;
    }
    int selected = static_cast<int>(list.selected_position().value_or(0));
    int offset = std::max(0, selected - height + 1);
    int pos = 0;
    for (const auto& item : list.visible_items()) {
        int row = pos - offset;
        if (row >= height) break;
        if (row >= 0) {
            std::string text = line(item);
            if (pos == selected) {
                ScopedAttr sel(COLOR_PAIR(kPairSelected) | A_BOLD);
                std::string padded = " " + text;
                padded.resize(static_cast<size_t>(std::max(width - 2, 0)), ' ');
                put(top + row, 1, padded, width - 2);
            } else {
                put(top + row, 2, text, width - 3);
            }
        }
        ++pos;
    }
}

std::string pad(const std::string& s, size_t n) {
    return s.size() >= n ? s + " " : s + std::string(n - s.size(), ' ');
}

std::string stack_origin(const StackInfo& stack) {
    return stack.is_inline() ? "inline" : "file";
}

void draw_settings(const Application& app, int top, int width) {
    const Config& config = app.store().config();
    int y = top;
    put(y++, 2, "Config file:   " + app.store().source_path(), width - 3);
    std::string def = config.default_model;
    if (!config.default_model_entry()) def += " (not configured)";
    put(y++, 2, "Default model: " + def, width - 3);
    put(y++, 2, "Models: " + std::to_string(config.models.size()) +
                "   Stacks: " + std::to_string(app.stacks().total_count()) +
                "   Skills: " + std::to_string(app.skills().total_count()) +
                "   Hooks: " + std::to_string(app.hooks().total_count()), width - 3);
    ++y;
    {
        ScopedAttr bold(A_BOLD);
        put(y++, 2, "Providers", width - 3);
    }
    if (config.providers.empty()) {
        ScopedAttr dim(A_DIM);
        put(y++, 4, "No providers configured (run karl-tui --init)", width - 5);
    }
    for (const auto& [name, provider] : config.providers) {
        std::string auth = provider.auth_type.value_or(provider.api_key ? "api_key" : "none");
        put(y++, 4, pad(name, 18) + pad(provider.type, 12) + auth, width - 5);
    }
    ++y;
    {
        ScopedAttr bold(A_BOLD);
        put(y++, 2, "karl CLI", width - 3);
    }
    const CliStatus& cli = app.cli_status();
    switch (cli.state()) {
        case CliStatus::State::Loading: {
            ScopedAttr dim(A_DIM);
            put(y++, 4, "Loading...", width - 5);
            break;
        }
        case CliStatus::State::NotAvailable: {
            ScopedAttr warn(COLOR_PAIR(kPairWarning));
            put(y++, 4, "karl not found in PATH", width - 5);
            break;
        }
        case CliStatus::State::Error: {
            ScopedAttr err(COLOR_PAIR(kPairError));
            put(y++, 4, "Error: " + cli.message(), width - 5);
            break;
        }
        case CliStatus::State::Loaded: {
            const CliInfo* info = cli.info();
            put(y++, 4, "Version: " + info->version, width - 5);
            for (const auto& [name, auth] : info->auth) {
                ScopedAttr attr(COLOR_PAIR(auth.authenticated ? kPairSuccess : kPairWarning));
                std::string line = pad(name, 18) +
                    (auth.authenticated ? "authenticated (" + auth.method + ")" : "not authenticated");
                if (auth.expires_at) line += ", expires " + *auth.expires_at;
                put(y++, 4, line, width - 5);
            }
            break;
        }
    }
    ++y;
    ScopedAttr dim(A_DIM);
    put(y, 2, "L: login   r: refresh", width - 3);
}

void draw_detail(const Application& app, int top, int width) {
    std::vector<std::pair<std::string, std::string>> rows;
    auto opt = [](const std::optional<std::string>& v) { return v.value_or("-"); };

    switch (app.section()) {
        case Section::Settings:
            draw_settings(app, top, width);
            return;
        case Section::Models:
            if (const auto* m = app.models().selected()) {
                rows = {{"Alias", m->alias}, {"Provider", m->entry.provider},
                        {"Model", m->entry.model},
                        {"Default", app.store().config().default_model == m->alias ? "yes" : "no"}};
            }
            break;
        case Section::Stacks:
            if (const auto* s = app.stacks().selected()) {
                const StackEntry& e = s->entry;
                rows = {{"Name", s->name}, {"Source", s->source},
                        {"Extends", opt(e.extends)}, {"Model", opt(e.model)},
                        {"Temperature", e.temperature ? format_real(*e.temperature) : "-"},
                        {"Timeout", e.timeout ? std::to_string(*e.timeout) + " ms" : "-"},
                        {"Max tokens", e.max_tokens ? std::to_string(*e.max_tokens) : "-"},
                        {"Skill", opt(e.skill)}, {"Context file", opt(e.context_file)},
                        {"Unrestricted", e.unrestricted.value_or(false) ? "yes" : "no"}};
                if (e.context) {
                    bool first = true;
                    for (const auto& line : split(*e.context, '\n')) {
                        rows.emplace_back(first ? "Context" : "", line);
                        first = false;
                    }
                }
            }
            break;
        case Section::Skills:
            if (const auto* s = app.skills().selected()) {
                rows = {{"Name", s->name}, {"Description", s->description},
                        {"License", opt(s->license)}, {"Path", s->path}};
            }
            break;
        case Section::Tools:
            if (const auto* t = app.tools().selected()) {
                rows = {{"Name", t->name}, {"Kind", t->builtin ? "built-in" : "custom"},
                        {"Enabled", t->enabled ? "yes" : "no"}};
            }
            break;
        case Section::Hooks:
            if (const auto* h = app.hooks().selected()) {
                rows = {{"Name", h->name}, {"Type", h->hook_type}, {"Path", h->path}};
            }
            break;
    }

    int y = top;
    for (const auto& [label, value] : rows) {
        {
            ScopedAttr bold(A_BOLD);
            put(y, 2, label, 16);
        }
        put(y, 18, value, width - 19);
        ++y;
    }
}

void draw_section(const Application& app, int top, int height, int width) {
    if (app.view() == View::Detail || app.section() == Section::Settings) {
        draw_detail(app, top, width);
        return;
    }
    const std::string& default_model = app.store().config().default_model;
    switch (app.section()) {
        case Section::Settings:
            break;
        case Section::Models:
            draw_list(app.models(), top, height, width, [&](const ModelItem& m) {
                std::string line = pad(m.alias, 16) + m.entry.provider + "/" + m.entry.model;
                if (m.alias == default_model) line += "  (default)";
                return line;
            });
            break;
        case Section::Stacks:
            draw_list(app.stacks(), top, height, width, [](const StackInfo& s) {
                return pad(s.name, 24) + stack_origin(s);
            });
            break;
        case Section::Skills:
            draw_list(app.skills(), top, height, width, [](const SkillInfo& s) {
                return pad(s.name, 24) + s.description;
            });
            break;
        case Section::Tools:
            draw_list(app.tools(), top, height, width, [](const ToolItem& t) {
                return std::string(t.enabled ? "[x] " : "[ ] ") + t.name +
                       (t.builtin ? "" : "  (custom)");
            });
            break;
        case Section::Hooks:
            draw_list(app.hooks(), top, height, width, [](const HookInfo& h) {
                return pad(h.name, 24) + h.hook_type;
            });
            break;
    }
}

// ── Modal overlays ──────────────────────────────────────────────

void draw_form(const Form& form) {
    int w = std::min(COLS - 4, 72);
    int field_x = 20;
    int field_w = w - field_x - 2;
    bool is_stack = form.kind() == FormKind::Stack;
    int h = static_cast<int>(form.field_count()) + (is_stack ? 3 : 0) + 4;
    int y = std::max(1, (LINES - h) / 2);
    int x = std::max(0, (COLS - w) / 2);
    draw_box(y, x, h, w, form.title());

    int row = y + 2;
    size_t focus = form.focused_field();
    auto label = [&](size_t field, const char* text) {
        draw_label(row, x + 2, text, focus == field);
    };

    switch (form.kind()) {
        case FormKind::Model: {
            const auto& f = static_cast<const ModelForm&>(form);
            label(ModelForm::kAlias, "Alias");
            draw_input(row++, x + field_x, field_w, f.alias, focus == ModelForm::kAlias);
            label(ModelForm::kProvider, "Provider");
            draw_selector(row++, x + field_x, field_w, f.provider, focus == ModelForm::kProvider);
            label(ModelForm::kModel, "Model");
            draw_selector(row++, x + field_x, field_w, f.model, focus == ModelForm::kModel);
            label(ModelForm::kSetDefault, "Default");
            draw_toggle(row++, x + field_x, field_w, f.set_default, focus == ModelForm::kSetDefault);
            break;
        }
        case FormKind::Stack: {
            const auto& f = static_cast<const StackForm&>(form);
            const std::pair<size_t, std::pair<const char*, const TextInput*>> inputs[] = {
                {StackForm::kName, {"Name", &f.name}},
                {StackForm::kExtends, {"Extends", &f.extends}},
                {StackForm::kModel, {"Model", &f.model}},
                {StackForm::kTemperature, {"Temperature", &f.temperature}},
                {StackForm::kTimeout, {"Timeout", &f.timeout}},
                {StackForm::kMaxTokens, {"Max tokens", &f.max_tokens}},
                {StackForm::kSkill, {"Skill", &f.skill}},
            };
            for (const auto& [field, input] : inputs) {
                label(field, input.first);
                draw_input(row++, x + field_x, field_w, *input.second, focus == field);
            }
            label(StackForm::kContext, "Context");
            row += draw_textarea(row, x + field_x, field_w, 4, f.context,
                                 focus == StackForm::kContext);
            label(StackForm::kContextFile, "Context file");
            draw_input(row++, x + field_x, field_w, f.context_file,
                       focus == StackForm::kContextFile);
            label(StackForm::kUnrestricted, "Unrestricted");
            draw_toggle(row++, x + field_x, field_w, f.unrestricted,
                        focus == StackForm::kUnrestricted);
            break;
        }
        case FormKind::Tool: {
            const auto& f = static_cast<const ToolForm&>(form);
            label(0, "Path");
            draw_input(row++, x + field_x, field_w, f.path, true);
            break;
        }
    }

    ScopedAttr dim(A_DIM);
    put(y + h - 2, x + 2, "Tab: next field  Ctrl-S: save  Esc: cancel", w - 4);
}

void draw_confirm(const ConfirmDialog& dialog) {
    int w = std::min(COLS - 4, std::max(40, static_cast<int>(dialog.message().size()) + 6));
    int h = 6;
    int y = std::max(1, (LINES - h) / 2);
    int x = std::max(0, (COLS - w) / 2);
    draw_box(y, x, h, w, dialog.title());
    put(y + 2, x + 3, dialog.message(), w - 6);

    std::string yes = std::string("[ ") + dialog.confirm_label() + " ]";
    std::string no = std::string("[ ") + dialog.cancel_label() + " ]";
    int bx = x + (w - static_cast<int>(yes.size() + no.size()) - 4) / 2;
    {
        ScopedAttr attr(dialog.is_confirmed() ? (COLOR_PAIR(kPairSelected) | A_BOLD) : A_NORMAL);
        put(y + 4, bx, yes, w);
    }
    ScopedAttr attr(!dialog.is_confirmed() ? (COLOR_PAIR(kPairSelected) | A_BOLD) : A_NORMAL);
    put(y + 4, bx + static_cast<int>(yes.size()) + 4, no, w);
}

void draw_wizard(const InitWizard& wizard) {
    int w = std::min(COLS - 4, 70);
    int h = std::min(LINES - 2, 16);
    int y = std::max(0, (LINES - h) / 2);
    int x = std::max(0, (COLS - w) / 2);
    draw_box(y, x, h, w, "karl setup");
    int row = y + 2;
    int tx = x + 3;
    int tw = w - 6;
    const ProviderOption& provider = wizard.selected_provider();
    std::string hint;

    switch (wizard.step()) {
        case InitStep::Welcome:
            put(row++, tx, "Welcome! This sets up a provider and a default model.", tw);
            hint = "Enter: continue   Esc: quit";
            break;
        case InitStep::SelectProvider: {
            put(row++, tx, "Choose a provider:", tw);
            ++row;
            const auto& options = provider_options();
            for (size_t i = 0; i < options.size(); ++i) {
                bool sel = i == wizard.provider_index();
                ScopedAttr attr(sel ? (COLOR_PAIR(kPairSelected) | A_BOLD) : A_NORMAL);
                put(row++, tx, std::string(sel ? "> " : "  ") + options[i].label, tw);
            }
            hint = "j/k: move   Enter: select   Backspace: back";
            break;
        }
        case InitStep::AuthenticateOAuth:
            put(row++, tx, std::string("Sign in to ") + provider.label + " in your browser.", tw);
            ++row;
            if (wizard.oauth_status() == OAuthStatus::InProgress) {
                put(row++, tx, "Waiting for login...", tw);
            }
            hint = "Enter: log in   s: skip   Backspace: back";
            break;
        case InitStep::AuthenticateApiKey: {
            put(row++, tx, std::string(provider.label) + " API key:", tw);
            ++row;
            // Never echo the key itself
            TextInput masked(wizard.api_key_input().placeholder());
            masked.set_value(std::string(wizard.api_key_input().value().size(), '*'));
            draw_input(row++, tx, tw, masked, true);
            hint = "Enter: continue   Backspace on empty: back";
            break;
        }
        case InitStep::CreateModel:
            put(row++, tx, "Name your default model:", tw);
            ++row;
            draw_label(row, tx, "Alias", wizard.model_focus() == 0);
            draw_input(row++, tx + 18, tw - 18, wizard.alias_input(), wizard.model_focus() == 0);
            draw_label(row, tx, "Model", wizard.model_focus() == 1);
            draw_selector(row++, tx + 18, tw - 18, wizard.model_selector(),
                          wizard.model_focus() == 1);
            hint = "Tab: switch field   j/k: choose model   Enter: continue";
            break;
        case InitStep::Confirm:
            put(row++, tx, "Ready to write the configuration:", tw);
            ++row;
            put(row++, tx, std::string("Provider: ") + provider.label, tw);
            put(row++, tx, "Model:    " + wizard.model_alias() + " -> " +
                           wizard.selected_model().value_or("-"), tw);
            hint = "Enter/y: save   n/Backspace: back   Esc: quit";
            break;
    }

    if (!wizard.error_message().empty()) {
        ScopedAttr err(COLOR_PAIR(kPairError) | A_BOLD);
        put(y + h - 3, tx, wizard.error_message(), tw);
    }
    ScopedAttr dim(A_DIM);
    put(y + h - 2, tx, hint, tw);
}

const char* normal_hints(const Application& app) {
    if (app.view() == View::Detail) return "Esc: back  e: edit  q: quit";
    switch (app.section()) {
        case Section::Settings: return "Tab: section  L: login  r: refresh  Ctrl-S: save  q: quit";
        case Section::Models:
        case Section::Stacks:   return "j/k: move  /: search  n: new  e: edit  d: delete  Ctrl-S: save  q: quit";
        case Section::Tools:    return "j/k: move  Space: toggle  n: add  d: remove  Ctrl-S: save  q: quit";
        case Section::Skills:
        case Section::Hooks:    return "j/k: move  /: search  Enter: details  q: quit";
    }
    return "";
}

} // namespace

void render(const Application& app) {
    erase();
    int width = COLS;

    if (const InitWizard* wizard = app.modal().wizard()) {
        draw_wizard(*wizard);
        refresh();
        return;
    }

    // Header: section tabs
    {
        ScopedAttr title(A_BOLD | COLOR_PAIR(kPairAccent));
        put(0, 1, "karl", width);
    }
    int x = 7;
    for (size_t i = 0; i < kSectionCount; ++i) {
        auto section = static_cast<Section>(i);
        std::string tab = std::to_string(i + 1) + " " + section_name(section);
        ScopedAttr attr(section == app.section() ? (COLOR_PAIR(kPairSelected) | A_BOLD) : A_NORMAL);
        put(0, x, " " + tab + " ", width - x);
        x += static_cast<int>(tab.size()) + 3;
    }
    if (app.dirty()) {
        ScopedAttr warn(COLOR_PAIR(kPairWarning) | A_BOLD);
        put(0, std::max(x + 1, width - 12), "[modified]", 10);
    }
    mvhline(1, 0, ACS_HLINE, width);

    int top = 2;
    int height = LINES - top - 2;
    draw_section(app, top, height, width);

    // Search line
    const TextInput& query = app.search_query(app.section());
    bool searching = app.modal().active() == ModalKind::Search;
    if (searching || !query.empty()) {
        ScopedAttr attr(searching ? A_BOLD : A_DIM);
        put(LINES - 2, 1, "/", 1);
        draw_input(LINES - 2, 2, width - 3, query, searching);
    }

    // Status line
    if (!app.status_message().empty()) {
        put(LINES - 1, 1, app.status_message(), width - 2);
    } else {
        ScopedAttr dim(A_DIM);
        put(LINES - 1, 1, normal_hints(app), width - 2);
    }

    if (const Form* form = app.modal().form()) draw_form(*form);
    if (const ConfirmModal* confirm = app.modal().confirm()) draw_confirm(confirm->dialog);

    refresh();
}

} // namespace karltui
