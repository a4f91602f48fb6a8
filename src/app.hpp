#pragma once
#include "cli_status.hpp"
#include "config_store.hpp"
#include "discovery.hpp"
#include "filtered_list.hpp"
#include "form.hpp"
#include "key.hpp"
#include "widgets.hpp"
#include "wizard.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace karltui {

// ── Sections ────────────────────────────────────────────────────

enum class Section { Settings, Models, Stacks, Skills, Tools, Hooks };

constexpr size_t kSectionCount = 6;

const char* section_name(Section section);
Section next_section(Section section);
Section prev_section(Section section);
// 1-based, as shown on screen; nullopt outside 1..6.
std::optional<Section> section_from_number(int n);

enum class View { List, Detail };

// ── List items ──────────────────────────────────────────────────

struct ModelItem {
    std::string alias;
    ModelEntry entry;
};

struct ToolItem {
    std::string name;   // built-in name or custom tool path
    bool enabled = false;
    bool builtin = false;
};

// ── Modal contexts ──────────────────────────────────────────────

enum class PendingKind { DeleteModel, DeleteStack, RemoveTool, Quit };

struct PendingAction {
    PendingKind kind;
    std::string target; // alias, stack name or tool path; empty for Quit
};

struct SearchModal {};

struct FormModal {
    std::unique_ptr<Form> form;
};

struct ConfirmModal {
    ConfirmDialog dialog;
    PendingAction action;
};

struct WizardModal {
    InitWizard wizard;
};

// Ordered by precedence, lowest first.
enum class ModalKind { None, Search, Form, Confirm, Wizard };

// Owns whichever modal context currently receives input. At most one is
// open; opening another replaces it.
class ModalController {
public:
    ModalKind active() const;
    bool is_open() const { return active() != ModalKind::None; }

    void open_search() { state_ = SearchModal{}; }
    void open_form(std::unique_ptr<Form> form);
    void open_confirm(ConfirmDialog dialog, PendingAction action);
    void open_wizard() { state_ = WizardModal{InitWizard()}; }
    void close() { state_ = std::monostate{}; }

    // Accessors return nullptr unless that context is active.
    Form* form();
    const Form* form() const;
    ConfirmModal* confirm();
    const ConfirmModal* confirm() const;
    InitWizard* wizard();
    const InitWizard* wizard() const;

private:
    std::variant<std::monostate, SearchModal, FormModal, ConfirmModal, WizardModal> state_;
};

// ── Application ─────────────────────────────────────────────────

// Side effect the driver loop must perform after handle_key().
enum class Effect { None, RunLogin };

struct AppOptions {
    ConfigPaths paths = ConfigPaths::defaults();
    DiscoveryRoots roots = DiscoveryRoots::defaults();
    bool init_mode = false;
    CliFetcher fetcher; // empty: run `karl info --json`
};

class Application {
public:
    explicit Application(AppOptions options);

    // Route one key to the highest-precedence active context.
    Effect handle_key(const Key& key);

    // Non-blocking; picks up a finished background fetch.
    void poll_cli_status();
    void refresh_cli_status();

    // Result of the RunLogin effect.
    void login_complete(bool success);

    // Rebuild every list from the store and the filesystem.
    void refresh_all();

    Section section() const { return section_; }
    View view() const { return view_; }
    bool should_quit() const { return should_quit_; }
    bool dirty() const { return store_.dirty(); }
    const std::string& status_message() const { return status_; }
    bool is_wizard_mode() const { return modal_.active() == ModalKind::Wizard; }

    const ConfigStore& store() const { return store_; }
    const ModalController& modal() const { return modal_; }
    const CliStatus& cli_status() const { return cli_status_; }
    const TextInput& search_query(Section section) const;

    const FilteredList<ModelItem>& models() const { return models_; }
    const FilteredList<StackInfo>& stacks() const { return stacks_; }
    const FilteredList<SkillInfo>& skills() const { return skills_; }
    const FilteredList<ToolItem>& tools() const { return tools_; }
    const FilteredList<HookInfo>& hooks() const { return hooks_; }

private:
    Effect handle_normal_key(const Key& key);
    Effect handle_list_key(const Key& key);
    void handle_detail_key(const Key& key);
    void handle_search_key(const Key& key);
    void handle_form_key(const Key& key);
    void handle_confirm_key(const Key& key);
    Effect handle_wizard_key(const Key& key);

    void switch_section(Section section);
    void move_selection(bool forward);
    void apply_search(Section section);
    void clear_search(Section section);
    TextInput& query_for(Section section);

    void start_create();
    void start_edit();
    void commit_form();
    void cancel_form();
    void confirm_delete();
    void request_quit();
    void execute(const PendingAction& action);
    void toggle_selected_tool();
    void save();
    void complete_wizard();

    void refresh_models();
    void refresh_stacks();
    void refresh_skills();
    void refresh_tools();
    void refresh_hooks();

    AppOptions options_;
    ConfigStore store_;
    ModalController modal_;

    Section section_ = Section::Settings;
    View view_ = View::List;
    bool should_quit_ = false;
    std::string status_;

    FilteredList<ModelItem> models_;
    FilteredList<StackInfo> stacks_;
    FilteredList<SkillInfo> skills_;
    FilteredList<ToolItem> tools_;
    FilteredList<HookInfo> hooks_;
    std::array<TextInput, kSectionCount> search_;

    CliStatus cli_status_ = CliStatus::loading();
    std::shared_ptr<Mailbox<CliStatus>> cli_mailbox_;
};

} // namespace karltui
