#include "app.hpp"
#include "util.hpp"
#include <algorithm>

namespace karltui {

// ── Sections ────────────────────────────────────────────────────

const char* section_name(Section section) {
    switch (section) {
        case Section::Settings: return "Settings";
        case Section::Models:   return "Models";
        case Section::Stacks:   return "Stacks";
        case Section::Skills:   return "Skills";
        case Section::Tools:    return "Tools";
        case Section::Hooks:    return "Hooks";
    }
    return "";
}

Section next_section(Section section) {
    switch (section) {
        case Section::Settings: return Section::Models;
        case Section::Models:   return Section::Stacks;
        case Section::Stacks:   return Section::Skills;
        case Section::Skills:   return Section::Tools;
        case Section::Tools:    return Section::Hooks;
        case Section::Hooks:    return Section::Settings;
    }
    return Section::Settings;
}

Section prev_section(Section section) {
    switch (section) {
        case Section::Settings: return Section::Hooks;
        case Section::Models:   return Section::Settings;
        case Section::Stacks:   return Section::Models;
        case Section::Skills:   return Section::Stacks;
        case Section::Tools:    return Section::Skills;
        case Section::Hooks:    return Section::Tools;
    }
    return Section::Settings;
}

std::optional<Section> section_from_number(int n) {
    switch (n) {
        case 1: return Section::Settings;
        case 2: return Section::Models;
        case 3: return Section::Stacks;
        case 4: return Section::Skills;
        case 5: return Section::Tools;
        case 6: return Section::Hooks;
        default: return std::nullopt;
    }
}

// ── ModalController ─────────────────────────────────────────────

ModalKind ModalController::active() const {
    switch (state_.index()) {
        case 1: return ModalKind::Search;
        case 2: return ModalKind::Form;
        case 3: return ModalKind::Confirm;
        case 4: return ModalKind::Wizard;
        default: return ModalKind::None;
    }
}

void ModalController::open_form(std::unique_ptr<Form> form) {
    state_ = FormModal{std::move(form)};
}

void ModalController::open_confirm(ConfirmDialog dialog, PendingAction action) {
    state_ = ConfirmModal{std::move(dialog), std::move(action)};
}

Form* ModalController::form() {
    auto* modal = std::get_if<FormModal>(&state_);
    return modal ? modal->form.get() : nullptr;
}

const Form* ModalController::form() const {
    const auto* modal = std::get_if<FormModal>(&state_);
    return modal ? modal->form.get() : nullptr;
}

ConfirmModal* ModalController::confirm() {
    return std::get_if<ConfirmModal>(&state_);
}

const ConfirmModal* ModalController::confirm() const {
    return std::get_if<ConfirmModal>(&state_);
}

InitWizard* ModalController::wizard() {
    auto* modal = std::get_if<WizardModal>(&state_);
    return modal ? &modal->wizard : nullptr;
}

const InitWizard* ModalController::wizard() const {
    const auto* modal = std::get_if<WizardModal>(&state_);
    return modal ? &modal->wizard : nullptr;
}

// ── Application ─────────────────────────────────────────────────

namespace {

constexpr const char* kBuiltinTools[] = {"bash", "read", "write", "edit"};

size_t section_index(Section section) {
    return static_cast<size_t>(section);
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += ", ";
        out += e;
    }
    return out;
}

} // namespace

Application::Application(AppOptions options)
    : options_(std::move(options)),
      store_(ConfigStore::load(options_.paths)),
      search_{TextInput(),
              TextInput("Search models..."),
              TextInput("Search stacks..."),
              TextInput("Search skills..."),
              TextInput("Search tools..."),
              TextInput("Search hooks...")} {
    if (!options_.fetcher) {
        options_.fetcher = [] { return fetch_cli_status(); };
    }
    if (options_.init_mode) {
        modal_.open_wizard();
        return;
    }
    refresh_cli_status();
    refresh_all();
}

const TextInput& Application::search_query(Section section) const {
    return search_[section_index(section)];
}

TextInput& Application::query_for(Section section) {
    return search_[section_index(section)];
}

// ── CLI status ──────────────────────────────────────────────────

void Application::refresh_cli_status() {
    cli_status_ = CliStatus::loading();
    cli_mailbox_ = fetch_cli_status_async(options_.fetcher);
}

void Application::poll_cli_status() {
    if (!cli_mailbox_) return;
    if (auto status = cli_mailbox_->take()) {
        cli_status_ = std::move(*status);
        cli_mailbox_.reset();
    }
}

void Application::login_complete(bool success) {
    if (auto* wizard = modal_.wizard()) {
        wizard->oauth_complete(success);
        return;
    }
    status_ = success ? "Login successful" : "Login cancelled";
    refresh_cli_status();
}

// ── Refresh ─────────────────────────────────────────────────────

void Application::refresh_all() {
    refresh_models();
    refresh_stacks();
    refresh_skills();
    refresh_tools();
    refresh_hooks();
}

void Application::refresh_models() {
    std::vector<ModelItem> items;
    for (const auto& [alias, entry] : store_.config().models) {
        items.push_back({alias, entry});
    }
    models_.replace_all(std::move(items));
    apply_search(Section::Models);
}

void Application::refresh_stacks() {
    stacks_.replace_all(discover_stacks(store_.config(), options_.roots));
    apply_search(Section::Stacks);
}

void Application::refresh_skills() {
    skills_.replace_all(discover_skills(options_.roots));
    apply_search(Section::Skills);
}

void Application::refresh_tools() {
    const auto& tools = store_.config().tools;
    std::vector<ToolItem> items;
    for (const char* name : kBuiltinTools) {
        bool enabled = std::find(tools.enabled.begin(), tools.enabled.end(), name) !=
                       tools.enabled.end();
        items.push_back({name, enabled, true});
    }
    for (const auto& path : tools.custom) {
        items.push_back({path, true, false});
    }
    tools_.replace_all(std::move(items));
    apply_search(Section::Tools);
}

void Application::refresh_hooks() {
    hooks_.replace_all(discover_hooks(options_.roots));
    apply_search(Section::Hooks);
}

// ── Search ──────────────────────────────────────────────────────

void Application::apply_search(Section section) {
    const std::string& query = search_query(section).value();
    if (query.empty()) {
        clear_search(section);
        return;
    }
    switch (section) {
        case Section::Settings:
            break;
        case Section::Models:
            models_.apply_filter([&](const ModelItem& m) { return contains_ci(m.alias, query); });
            break;
        case Section::Stacks:
            stacks_.apply_filter([&](const StackInfo& s) { return contains_ci(s.name, query); });
            break;
        case Section::Skills:
            skills_.apply_filter([&](const SkillInfo& s) {
                return contains_ci(s.name, query) || contains_ci(s.description, query);
            });
            break;
        case Section::Tools:
            tools_.apply_filter([&](const ToolItem& t) { return contains_ci(t.name, query); });
            break;
        case Section::Hooks:
            hooks_.apply_filter([&](const HookInfo& h) { return contains_ci(h.name, query); });
            break;
    }
}

void Application::clear_search(Section section) {
    query_for(section).clear();
    switch (section) {
        case Section::Settings: break;
        case Section::Models:   models_.clear_filter(); break;
        case Section::Stacks:   stacks_.clear_filter(); break;
        case Section::Skills:   skills_.clear_filter(); break;
        case Section::Tools:    tools_.clear_filter(); break;
        case Section::Hooks:    hooks_.clear_filter(); break;
    }
}

// ── Dispatch ────────────────────────────────────────────────────

Effect Application::handle_key(const Key& key) {
    switch (modal_.active()) {
        case ModalKind::Wizard:
            return handle_wizard_key(key);
        case ModalKind::Confirm:
            handle_confirm_key(key);
            return Effect::None;
        case ModalKind::Form:
            handle_form_key(key);
            return Effect::None;
        case ModalKind::Search:
            handle_search_key(key);
            return Effect::None;
        case ModalKind::None:
            return handle_normal_key(key);
    }
    return Effect::None;
}

Effect Application::handle_normal_key(const Key& key) {
    if (key.is_char('q')) {
        request_quit();
        return Effect::None;
    }
    if (key.is_ctrl('c')) {
        request_quit();
        return Effect::None;
    }
    if (key.is_ctrl('s')) {
        save();
        return Effect::None;
    }

    if (key.code == KeyCode::Tab) {
        switch_section(next_section(section_));
        return Effect::None;
    }
    if (key.code == KeyCode::BackTab) {
        switch_section(prev_section(section_));
        return Effect::None;
    }
    if (key.code == KeyCode::Char && !key.ctrl && key.ch >= '0' && key.ch <= '9') {
        if (auto section = section_from_number(key.ch - '0')) switch_section(*section);
        return Effect::None;
    }

    switch (view_) {
        case View::List:
            return handle_list_key(key);
        case View::Detail:
            handle_detail_key(key);
            return Effect::None;
    }
    return Effect::None;
}

Effect Application::handle_list_key(const Key& key) {
    if (key.code == KeyCode::Down || key.is_char('j')) {
        move_selection(true);
    } else if (key.code == KeyCode::Up || key.is_char('k')) {
        move_selection(false);
    } else if (key.code == KeyCode::Enter || key.code == KeyCode::Right || key.is_char('l')) {
        view_ = View::Detail;
    } else if (key.is_char('/')) {
        if (section_ != Section::Settings) modal_.open_search();
    } else if (key.is_char('r')) {
        refresh_all();
        refresh_cli_status();
        status_ = "Refreshed";
    } else if (key.is_char('L')) {
        if (section_ == Section::Settings) return Effect::RunLogin;
    } else if (key.is_char(' ')) {
        if (section_ == Section::Tools) toggle_selected_tool();
    } else if (key.is_char('n')) {
        start_create();
    } else if (key.is_char('e')) {
        start_edit();
    } else if (key.is_char('d')) {
        confirm_delete();
    }
    return Effect::None;
}

void Application::handle_detail_key(const Key& key) {
    if (key.code == KeyCode::Esc || key.code == KeyCode::Left || key.is_char('h')) {
        view_ = View::List;
    } else if (key.is_char('e')) {
        start_edit();
    }
}

void Application::handle_search_key(const Key& key) {
    if (key.code == KeyCode::Esc) {
        clear_search(section_);
        modal_.close();
        return;
    }
    if (key.code == KeyCode::Enter) {
        modal_.close();
        return;
    }
    if (query_for(section_).handle_key(key)) apply_search(section_);
}

void Application::handle_form_key(const Key& key) {
    Form* form = modal_.form();
    if (key.is_ctrl('s')) {
        commit_form();
    } else if (key.code == KeyCode::Esc) {
        cancel_form();
    } else if (key.code == KeyCode::Tab) {
        form->next_field();
    } else if (key.code == KeyCode::BackTab) {
        form->prev_field();
    } else {
        form->handle_field_key(key);
    }
}

void Application::handle_confirm_key(const Key& key) {
    ConfirmModal* confirm = modal_.confirm();
    if (key.code == KeyCode::Left || key.is_char('h')) {
        confirm->dialog.select_cancel();
    } else if (key.code == KeyCode::Right || key.is_char('l')) {
        confirm->dialog.select_confirm();
    } else if (key.code == KeyCode::Tab) {
        confirm->dialog.toggle();
    } else if (key.code == KeyCode::Enter) {
        bool confirmed = confirm->dialog.is_confirmed();
        PendingAction action = std::move(confirm->action);
        modal_.close();
        if (confirmed) execute(action);
    } else if (key.code == KeyCode::Esc) {
        modal_.close();
    }
}

Effect Application::handle_wizard_key(const Key& key) {
    switch (modal_.wizard()->handle_key(key)) {
        case WizardOutcome::Continue:
            break;
        case WizardOutcome::RunLogin:
            return Effect::RunLogin;
        case WizardOutcome::Finish:
            complete_wizard();
            break;
        case WizardOutcome::Quit:
            status_ = "Setup cancelled";
            should_quit_ = true;
            break;
    }
    return Effect::None;
}

// ── Normal-mode actions ─────────────────────────────────────────

void Application::switch_section(Section section) {
    section_ = section;
    view_ = View::List;
}

void Application::move_selection(bool forward) {
    auto step = [forward](auto& list) {
        if (forward) {
            list.next();
        } else {
            list.previous();
        }
    };
    switch (section_) {
        case Section::Settings: break;
        case Section::Models:   step(models_); break;
        case Section::Stacks:   step(stacks_); break;
        case Section::Skills:   step(skills_); break;
        case Section::Tools:    step(tools_); break;
        case Section::Hooks:    step(hooks_); break;
    }
}

void Application::toggle_selected_tool() {
    auto idx = tools_.selected_index();
    if (!idx) return;
    ToolItem* tool = tools_.item_at(*idx);
    if (!tool || !tool->builtin) return;
    tool->enabled = !tool->enabled;
    store_.set_tool_enabled(tool->name, tool->enabled);
}

void Application::start_create() {
    switch (section_) {
        case Section::Models:
            modal_.open_form(std::make_unique<ModelForm>(ModelForm::create(store_.config())));
            break;
        case Section::Stacks:
            modal_.open_form(std::make_unique<StackForm>(StackForm::create()));
            break;
        case Section::Tools:
            modal_.open_form(std::make_unique<ToolForm>());
            break;
        case Section::Settings:
        case Section::Skills:
        case Section::Hooks:
            break;
    }
}

void Application::start_edit() {
    switch (section_) {
        case Section::Models:
            if (const auto* item = models_.selected()) {
                modal_.open_form(std::make_unique<ModelForm>(
                    ModelForm::edit(store_.config(), item->alias, item->entry)));
            }
            break;
        case Section::Stacks:
            if (const auto* stack = stacks_.selected()) {
                modal_.open_form(std::make_unique<StackForm>(
                    StackForm::edit(stack->name, stack->entry)));
            }
            break;
        case Section::Settings:
        case Section::Skills:
        case Section::Tools:
        case Section::Hooks:
            break;
    }
}

void Application::commit_form() {
    const Form* form = modal_.form();
    auto errors = form->commit(store_);
    if (!errors.empty()) {
        status_ = join_errors(errors);
        return;
    }

    status_ = form->success_message();
    FormKind kind = form->kind();
    modal_.close();
    view_ = View::List;
    switch (kind) {
        case FormKind::Model: refresh_models(); break;
        case FormKind::Stack: refresh_stacks(); break;
        case FormKind::Tool:  refresh_tools(); break;
    }
}

void Application::cancel_form() {
    modal_.close();
    view_ = View::List;
    status_ = "Cancelled";
}

void Application::confirm_delete() {
    switch (section_) {
        case Section::Models:
            if (const auto* item = models_.selected()) {
                modal_.open_confirm(
                    ConfirmDialog("Delete Model", "Delete model '" + item->alias + "'?"),
                    {PendingKind::DeleteModel, item->alias});
            }
            break;
        case Section::Stacks:
            if (const auto* stack = stacks_.selected()) {
                if (!stack->is_inline()) {
                    status_ = "Stack '" + stack->name + "' is defined in " + stack->source +
                              "; delete the file to remove it";
                    break;
                }
                modal_.open_confirm(
                    ConfirmDialog("Delete Stack", "Delete stack '" + stack->name + "'?"),
                    {PendingKind::DeleteStack, stack->name});
            }
            break;
        case Section::Tools:
            if (const auto* tool = tools_.selected()) {
                if (tool->builtin) break;
                modal_.open_confirm(
                    ConfirmDialog("Remove Tool", "Remove custom tool '" + tool->name + "'?"),
                    {PendingKind::RemoveTool, tool->name});
            }
            break;
        case Section::Settings:
        case Section::Skills:
        case Section::Hooks:
            break;
    }
}

void Application::request_quit() {
    if (!store_.dirty()) {
        should_quit_ = true;
        return;
    }
    modal_.open_confirm(
        ConfirmDialog("Unsaved Changes", "You have unsaved changes. Quit anyway?"),
        {PendingKind::Quit, ""});
}

void Application::execute(const PendingAction& action) {
    switch (action.kind) {
        case PendingKind::DeleteModel:
            store_.remove_model(action.target);
            refresh_models();
            status_ = "Deleted model '" + action.target + "'";
            break;
        case PendingKind::DeleteStack:
            store_.remove_stack(action.target);
            refresh_stacks();
            status_ = "Deleted stack '" + action.target + "'";
            break;
        case PendingKind::RemoveTool:
            store_.remove_custom_tool(action.target);
            refresh_tools();
            status_ = "Removed tool '" + action.target + "'";
            break;
        case PendingKind::Quit:
            should_quit_ = true;
            break;
    }
}

void Application::save() {
    try {
        store_.save();
        status_ = "Config saved";
    } catch (const std::exception& e) {
        status_ = std::string("Save failed: ") + e.what();
    }
}

void Application::complete_wizard() {
    const InitWizard* wizard = modal_.wizard();
    wizard->apply(store_);
    std::string alias = wizard->model_alias();
    modal_.close();
    try {
        store_.save();
        status_ = "Setup complete! Default model: " + alias;
    } catch (const std::exception& e) {
        status_ = std::string("Setup failed: ") + e.what();
    }
    should_quit_ = true;
}

} // namespace karltui
