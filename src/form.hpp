#pragma once
#include "config_store.hpp"
#include "key.hpp"
#include "widgets.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace karltui {

enum class FormMode { Create, Edit };

// Tag for the concrete form type; renderers static_cast on it.
enum class FormKind { Model, Stack, Tool };

// Staged edit of one entity. Fields hold scratch copies; nothing reaches
// the store until commit() succeeds.
class Form {
public:
    virtual ~Form() = default;

    FormMode mode() const { return mode_; }
    // Key being edited; empty in Create mode.
    const std::string& original_key() const { return original_key_; }

    size_t focused_field() const { return focused_; }
    void next_field();
    void prev_field();

    virtual FormKind kind() const = 0;
    virtual size_t field_count() const = 0;
    virtual const char* title() const = 0;

    // Route a key (other than Tab/BackTab/Esc/Ctrl-S) to the focused field.
    virtual void handle_field_key(const Key& key) = 0;

    // Every violated rule, in field order.
    virtual std::vector<std::string> validate() const = 0;

    // Validate against the current store contents and apply. On errors the
    // store is left untouched and the errors are returned.
    std::vector<std::string> commit(ConfigStore& store) const;

    // Status line shown after a successful commit.
    virtual std::string success_message() const = 0;

protected:
    Form(FormMode mode, std::string original_key)
        : mode_(mode), original_key_(std::move(original_key)) {}

    // Checks that need the live configuration (duplicates).
    virtual std::vector<std::string> validate_against(const Config& config) const;
    virtual void apply(ConfigStore& store) const = 0;

    const char* verb() const { return mode_ == FormMode::Create ? "Created" : "Updated"; }

private:
    FormMode mode_;
    std::string original_key_;
    size_t focused_ = 0;
};

class ModelForm : public Form {
public:
    enum Field : size_t { kAlias, kProvider, kModel, kSetDefault, kFieldCount };

    static ModelForm create(const Config& config);
    static ModelForm edit(const Config& config, const std::string& alias,
                          const ModelEntry& entry);

    FormKind kind() const override { return FormKind::Model; }
    size_t field_count() const override { return kFieldCount; }
    const char* title() const override {
        return mode() == FormMode::Create ? "New Model" : "Edit Model";
    }
    void handle_field_key(const Key& key) override;
    std::vector<std::string> validate() const override;
    std::string success_message() const override;

    // Rebuild the model id choices for the selected provider.
    void update_model_options();

    TextInput alias{"e.g., fast, smart, claude"};
    Selector provider;
    Selector model;
    Toggle set_default{"Set as default model"};

protected:
    void apply(ConfigStore& store) const override;

private:
    ModelForm(FormMode mode, std::string original_key,
              std::map<std::string, ProviderEntry> providers);

    std::map<std::string, ProviderEntry> providers_;
    nlohmann::json extra_ = nlohmann::json::object();
};

class StackForm : public Form {
public:
    enum Field : size_t {
        kName, kExtends, kModel, kTemperature, kTimeout, kMaxTokens,
        kSkill, kContext, kContextFile, kUnrestricted, kFieldCount
    };

    static StackForm create();
    static StackForm edit(const std::string& name, const StackEntry& entry);

    FormKind kind() const override { return FormKind::Stack; }
    size_t field_count() const override { return kFieldCount; }
    const char* title() const override {
        return mode() == FormMode::Create ? "New Stack" : "Edit Stack";
    }
    void handle_field_key(const Key& key) override;
    std::vector<std::string> validate() const override;
    std::string success_message() const override;

    // Entry built from the current field values. Only meaningful when
    // validate() is empty.
    StackEntry to_entry() const;

    TextInput name{"e.g., codex-architect"};
    TextInput extends{"Base stack to extend (optional)"};
    TextInput model{"Model alias (optional)"};
    TextInput temperature{"0.0 - 2.0 (optional)"};
    TextInput timeout{"Timeout in ms (optional)"};
    TextInput max_tokens{"Max tokens (optional)"};
    TextInput skill{"Skill name (optional)"};
    TextArea context{"Multi-line context (optional)"};
    TextInput context_file{"Path to context file (optional)"};
    Toggle unrestricted{"Unrestricted mode"};

protected:
    void apply(ConfigStore& store) const override;

private:
    StackForm(FormMode mode, std::string original_key)
        : Form(mode, std::move(original_key)) {}
};

class ToolForm : public Form {
public:
    ToolForm() : Form(FormMode::Create, "") {}

    FormKind kind() const override { return FormKind::Tool; }
    size_t field_count() const override { return 1; }
    const char* title() const override { return "Add Custom Tool"; }
    void handle_field_key(const Key& key) override { path.handle_key(key); }
    std::vector<std::string> validate() const override;
    std::string success_message() const override;

    TextInput path{"Path to custom tool executable"};

protected:
    std::vector<std::string> validate_against(const Config& config) const override;
    void apply(ConfigStore& store) const override;
};

} // namespace karltui
