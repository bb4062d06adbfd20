// Keystrap kernel: built-in startup presets
#include "kernel/presets.hpp"

namespace ks {

namespace {

BindingSpec bind(const std::string& modes, const std::string& lhs,
                 std::vector<ActionRef> action, const std::string& desc, bool silent = false) {
    BindingSpec b;
    b.modes = modes;
    b.lhs = lhs;
    b.action = std::move(action);
    b.desc = desc;
    b.silent = silent;
    return b;
}

ActionRef own(const std::string& name) { return {"", name}; }
ActionRef builtin(const std::string& name) { return {kBuiltinOwner, name}; }

ExtensionDescriptor fuzzy_finder() {
    ExtensionDescriptor d;
    d.role = ExtensionRole::FuzzyFinder;
    d.capability = "telescope";
    d.options = YAML::Load(R"(
defaults:
  mappings:
    i:
      "<C-j>": move_selection_next
      "<C-k>": move_selection_previous
  layout_config:
    prompt_position: top
  sorting_strategy: ascending
)");
    d.bindings = {
        bind("n", "<leader>ff", {own("find_files")}, "Find files"),
        bind("n", "<leader>fg", {own("live_grep")}, "Grep (ripgrep)"),
        bind("n", "<leader>fb", {own("buffers")}, "Buffers"),
        bind("n", "<leader>fh", {own("help_tags")}, "Help tags"),
    };
    return d;
}

ExtensionDescriptor syntax_tree() {
    ExtensionDescriptor d;
    d.role = ExtensionRole::SyntaxTree;
    d.capability = "nvim-treesitter.configs";
    d.options = YAML::Load(R"(
ensure_installed: [bash, lua, vim, vimdoc, json, yaml, markdown, regex,
                   javascript, typescript, go, rust, python]
highlight: {enable: true}
indent: {enable: true}
incremental_selection: {enable: true}
)");
    return d;
}

ExtensionDescriptor language_client() {
    ExtensionDescriptor d;
    d.role = ExtensionRole::LanguageClient;
    d.capability = "lspconfig";
    return d;
}

LanguageClientPlan language_client_plan() {
    LanguageClientPlan p;
    p.servers = {"lua_ls", "gopls", "pyright", "tsserver", "rust_analyzer"};
    p.debounce_text_changes_ms = 100;
    p.capability_provider = "cmp_nvim_lsp";
    p.diagnostics.virtual_text = true;
    p.diagnostics.virtual_text_spacing = 2;
    p.diagnostics.virtual_text_prefix = "\xE2\x97\x8F";  // U+25CF
    p.diagnostics.signs = true;
    p.diagnostics.update_in_insert = false;
    p.diagnostics.severity_sort = true;
    p.attach_bindings = {
        bind("n", "gd", {own("definition")}, "Goto Definition", true),
        bind("n", "gr", {own("references")}, "References", true),
        bind("n", "gD", {own("declaration")}, "Goto Declaration", true),
        bind("n", "gi", {own("implementation")}, "Goto Implementation", true),
        bind("n", "K", {own("hover")}, "Hover", true),
        bind("n", "<leader>rn", {own("rename")}, "Rename", true),
        bind("n", "<leader>ca", {own("code_action")}, "Code Action", true),
        bind("n", "[d", {builtin("diagnostic.goto_prev")}, "Prev Diagnostic", true),
        bind("n", "]d", {builtin("diagnostic.goto_next")}, "Next Diagnostic", true),
    };
    return p;
}

ExtensionDescriptor snippet() {
    ExtensionDescriptor d;
    d.role = ExtensionRole::Snippet;
    d.capability = "luasnip";
    return d;
}

ExtensionDescriptor completion() {
    ExtensionDescriptor d;
    d.role = ExtensionRole::Completion;
    d.capability = "cmp";
    d.options = YAML::Load(R"(
snippet: auto
sources:
  - [nvim_lsp, path]
  - [buffer]
)");
    d.bindings = {
        bind("i", "<C-Space>", {own("complete")}, "Complete"),
        bind("i", "<CR>", {own("confirm")}, "Confirm selection"),
        bind("is", "<Tab>", {own("select_next_item"), {"luasnip", "expand_or_jump"}}, "Next item / snippet jump"),
        bind("is", "<S-Tab>", {own("select_prev_item"), {"luasnip", "jump_prev"}}, "Previous item / snippet jump"),
    };
    return d;
}

std::vector<PluginSpec> lean_plugins() {
    return {
        {"nvim-telescope/telescope.nvim", {"nvim-lua/plenary.nvim"}},
        {"nvim-treesitter/nvim-treesitter", {}},
        {"hrsh7th/nvim-cmp",
         {"hrsh7th/cmp-nvim-lsp", "hrsh7th/cmp-buffer", "hrsh7th/cmp-path",
          "L3MON4D3/LuaSnip", "saadparwaiz1/cmp_luasnip"}},
    };
}

}  // namespace

StartupPlan make_lean_preset() {
    StartupPlan plan;
    plan.name = "lean";
    plan.settings = {
        {"mapleader", std::string(" ")},
        {"number", true},
        {"relativenumber", false},
        {"signcolumn", std::string("yes")},
        {"ignorecase", true},
        {"smartcase", true},
        {"updatetime", 200},
        {"timeoutlen", 400},
        {"termguicolors", false},
    };
    plan.plugins = lean_plugins();
    plan.extensions = {fuzzy_finder(), syntax_tree(), language_client(), snippet(), completion()};
    plan.language_client = language_client_plan();
    plan.bindings = {
        bind("n", "<leader>e", {builtin("diagnostic.open_float")}, "Line diagnostics"),
        bind("n", "<leader>q", {builtin("diagnostic.setloclist")}, "Diagnostics to LocList"),
    };
    return plan;
}

StartupPlan make_truecolor_preset() {
    StartupPlan plan = make_lean_preset();
    plan.name = "truecolor";
    plan.override_setting("termguicolors", true);
    plan.plugins.push_back({"neovim/nvim-lspconfig", {}});
    return plan;
}

std::optional<StartupPlan> preset_by_name(const std::string& name) {
    if (name == "lean") return make_lean_preset();
    if (name == "truecolor") return make_truecolor_preset();
    return std::nullopt;
}

std::vector<std::string> preset_names() { return {"lean", "truecolor"}; }

} // namespace ks
