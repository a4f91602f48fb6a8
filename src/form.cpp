#include "form.hpp"
#include "catalog.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdint>

namespace karltui {

// ── Form ─────────────────────────────────────────────────────────

void Form::next_field() {
    focused_ = (focused_ + 1) % field_count();
}

void Form::prev_field() {
    focused_ = focused_ == 0 ? field_count() - 1 : focused_ - 1;
}

std::vector<std::string> Form::validate_against(const Config& /*config*/) const {
    return validate();
}

std::vector<std::string> Form::commit(ConfigStore& store) const {
    auto errors = validate_against(store.config());
    if (errors.empty()) apply(store);
    return errors;
}

namespace {

std::optional<std::string> optional_text(const std::string& value) {
    std::string t = trim(value);
    if (t.empty()) return std::nullopt;
    return t;
}

std::vector<std::string> provider_names(const std::map<std::string, ProviderEntry>& providers) {
    std::vector<std::string> names;
    names.reserve(providers.size());
    for (const auto& [name, entry] : providers) {
        (void)entry;
        names.push_back(name);
    }
    return names;
}

} // namespace

// ── ModelForm ────────────────────────────────────────────────────

ModelForm::ModelForm(FormMode mode, std::string original_key,
                     std::map<std::string, ProviderEntry> providers)
    : Form(mode, std::move(original_key)),
      provider(provider_names(providers)),
      providers_(std::move(providers)) {}

ModelForm ModelForm::create(const Config& config) {
    ModelForm form(FormMode::Create, "", config.providers);
    form.update_model_options();
    return form;
}

ModelForm ModelForm::edit(const Config& config, const std::string& alias,
                          const ModelEntry& entry) {
    ModelForm form(FormMode::Edit, alias, config.providers);
    form.alias.set_value(alias);
    // Keep values that are no longer (or never were) in the option lists
    form.provider.select_or_insert(entry.provider);
    form.update_model_options();
    form.model.select_or_insert(entry.model);
    if (config.default_model == alias) form.set_default.toggle();
    form.extra_ = entry.extra;
    return form;
}

void ModelForm::update_model_options() {
    auto selected = provider.selected_value();
    model = Selector(selected ? models_for_configured_provider(providers_, *selected)
                              : std::vector<std::string>{});
}

void ModelForm::handle_field_key(const Key& key) {
    switch (focused_field()) {
        case kAlias:
            alias.handle_key(key);
            break;
        case kProvider:
            if (provider.handle_key(key)) update_model_options();
            break;
        case kModel:
            model.handle_key(key);
            break;
        case kSetDefault:
            set_default.handle_key(key);
            break;
        default:
            break;
    }
}

std::vector<std::string> ModelForm::validate() const {
    std::vector<std::string> errors;
    if (trim(alias.value()).empty()) errors.emplace_back("Alias is required");
    if (provider.empty()) errors.emplace_back("No providers configured");
    if (!model.selected_value()) errors.emplace_back("Model is required");
    return errors;
}

void ModelForm::apply(ConfigStore& store) const {
    std::string key = trim(alias.value());
    ModelEntry entry;
    entry.provider = provider.selected_value().value_or("");
    entry.model = model.selected_value().value_or("");
    entry.extra = extra_;
    store.upsert_model(key, std::move(entry), original_key());
    if (set_default.value()) store.set_default_model(key);
}

std::string ModelForm::success_message() const {
    return std::string(verb()) + " model '" + trim(alias.value()) + "'";
}

// ── StackForm ────────────────────────────────────────────────────

StackForm StackForm::create() {
    return StackForm(FormMode::Create, "");
}

StackForm StackForm::edit(const std::string& name, const StackEntry& entry) {
    StackForm form(FormMode::Edit, name);
    form.name.set_value(name);
    form.extends.set_value(entry.extends.value_or(""));
    form.model.set_value(entry.model.value_or(""));
    if (entry.temperature) form.temperature.set_value(format_real(*entry.temperature));
    if (entry.timeout) form.timeout.set_value(std::to_string(*entry.timeout));
    if (entry.max_tokens) form.max_tokens.set_value(std::to_string(*entry.max_tokens));
    form.skill.set_value(entry.skill.value_or(""));
    if (entry.context) form.context.with_text(*entry.context);
    form.context_file.set_value(entry.context_file.value_or(""));
    if (entry.unrestricted.value_or(false)) form.unrestricted.toggle();
    return form;
}

void StackForm::handle_field_key(const Key& key) {
    switch (focused_field()) {
        case kName:         name.handle_key(key); break;
        case kExtends:      extends.handle_key(key); break;
        case kModel:        model.handle_key(key); break;
        case kTemperature:  temperature.handle_key(key); break;
        case kTimeout:      timeout.handle_key(key); break;
        case kMaxTokens:    max_tokens.handle_key(key); break;
        case kSkill:        skill.handle_key(key); break;
        case kContext:      context.handle_key(key); break;
        case kContextFile:  context_file.handle_key(key); break;
        case kUnrestricted: unrestricted.handle_key(key); break;
        default: break;
    }
}

std::vector<std::string> StackForm::validate() const {
    std::vector<std::string> errors;
    if (trim(name.value()).empty()) errors.emplace_back("Name is required");

    if (!trim(temperature.value()).empty()) {
        auto t = parse_real(temperature.value());
        if (!t) {
            errors.emplace_back("Temperature must be a number");
        } else if (*t < 0.0 || *t > 2.0) {
            errors.emplace_back("Temperature must be between 0.0 and 2.0");
        }
    }
    if (!trim(timeout.value()).empty() && !parse_unsigned(timeout.value())) {
        errors.emplace_back("Timeout must be a positive number");
    }
    if (!trim(max_tokens.value()).empty() &&
        !parse_unsigned(max_tokens.value(), UINT32_MAX)) {
        errors.emplace_back("Max tokens must be a positive number");
    }
    return errors;
}

StackEntry StackForm::to_entry() const {
    StackEntry entry;
    entry.name = optional_text(name.value());
    entry.extends = optional_text(extends.value());
    entry.model = optional_text(model.value());
    entry.temperature = parse_real(temperature.value());
    entry.timeout = parse_unsigned(timeout.value());
    if (auto tokens = parse_unsigned(max_tokens.value(), UINT32_MAX)) {
        entry.max_tokens = static_cast<uint32_t>(*tokens);
    }
    entry.skill = optional_text(skill.value());
    std::string text = context.text();
    if (!trim(text).empty()) entry.context = text;
    entry.context_file = optional_text(context_file.value());
    if (unrestricted.value()) entry.unrestricted = true;
    return entry;
}

void StackForm::apply(ConfigStore& store) const {
    store.upsert_stack(trim(name.value()), to_entry(), original_key());
}

std::string StackForm::success_message() const {
    return std::string(verb()) + " stack '" + trim(name.value()) + "'";
}

// ── ToolForm ─────────────────────────────────────────────────────

std::vector<std::string> ToolForm::validate() const {
    std::vector<std::string> errors;
    if (trim(path.value()).empty()) errors.emplace_back("Path is required");
    return errors;
}

std::vector<std::string> ToolForm::validate_against(const Config& config) const {
    auto errors = validate();
    if (!errors.empty()) return errors;
    const auto& custom = config.tools.custom;
    if (std::find(custom.begin(), custom.end(), trim(path.value())) != custom.end()) {
        errors.emplace_back("Tool already exists");
    }
    return errors;
}

void ToolForm::apply(ConfigStore& store) const {
    store.add_custom_tool(trim(path.value()));
}

std::string ToolForm::success_message() const {
    return "Added tool '" + trim(path.value()) + "'";
}

} // namespace karltui
