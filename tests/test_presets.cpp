#include <gtest/gtest.h>

#include "kernel/presets.hpp"
#include "test_support.hpp"

namespace {

class PresetTest : public ::testing::Test {
protected:
    void SetUp() override {
        ks_test::isolate(kernel_);
        journal_ = std::make_shared<ks_test::Journal>();
        ks_test::register_fake(kernel_.registry(), "telescope",
                               {"find_files", "live_grep", "buffers", "help_tags"}, journal_);
        ks_test::register_fake(kernel_.registry(), "nvim-treesitter.configs", {}, journal_);
        auto journal = journal_;
        kernel_.registry().register_capability("lspconfig", [journal] {
            std::map<std::string, std::vector<std::string>> servers{
                {"lua_ls", {"lua"}}, {"gopls", {"go"}}, {"pyright", {"python"}}, {"rust_analyzer", {"rust"}}};
            return std::make_shared<ks_test::FakeLanguageClient>(servers, journal);
        });
    }

    void register_completion_stack() {
        ks_test::register_fake(kernel_.registry(), "cmp",
                               {"complete", "confirm", "select_next_item", "select_prev_item"}, journal_);
        auto journal = journal_;
        kernel_.registry().register_capability("cmp_nvim_lsp", [journal] {
            return std::make_shared<ks_test::FakeContributor>(journal);
        });
    }

    ks::Kernel kernel_;
    std::shared_ptr<ks_test::Journal> journal_;
};

}  // namespace

TEST(PresetNamesTest, LookupByName) {
    EXPECT_TRUE(ks::preset_by_name("lean").has_value());
    EXPECT_TRUE(ks::preset_by_name("truecolor").has_value());
    EXPECT_FALSE(ks::preset_by_name("heavy").has_value());
    EXPECT_EQ(ks::preset_names().size(), 2u);
}

TEST(PresetNamesTest, LeanMirrorsSourceConfiguration) {
    auto lean = ks::make_lean_preset();
    std::vector<std::string> repos;
    for (const auto& p : lean.plugins) repos.push_back(p.repo);
    std::vector<std::string> expected_repos{"nvim-telescope/telescope.nvim", "nvim-treesitter/nvim-treesitter",
                                            "hrsh7th/nvim-cmp"};
    EXPECT_EQ(repos, expected_repos);
    EXPECT_EQ(lean.plugins[2].dependencies.size(), 5u);

    std::vector<std::string> capabilities;
    for (const auto& d : lean.extensions) capabilities.push_back(d.capability);
    std::vector<std::string> expected_caps{"telescope", "nvim-treesitter.configs", "lspconfig", "luasnip", "cmp"};
    EXPECT_EQ(capabilities, expected_caps);
    EXPECT_EQ(lean.language_client.capability_provider, "cmp_nvim_lsp");

    for (const auto& [name, value] : lean.settings) EXPECT_NE(name, "colorscheme");
}

TEST(PresetNamesTest, TruecolorDiffersOnlyInColoursAndOnePlugin) {
    auto lean = ks::make_lean_preset();
    auto truecolor = ks::make_truecolor_preset();
    ASSERT_EQ(truecolor.settings.size(), lean.settings.size());
    for (size_t i = 0; i < lean.settings.size(); ++i) {
        EXPECT_EQ(truecolor.settings[i].first, lean.settings[i].first);
        if (lean.settings[i].first == "termguicolors") {
            EXPECT_EQ(truecolor.settings[i].second, ks::SettingValue(true));
        } else {
            EXPECT_EQ(truecolor.settings[i].second, lean.settings[i].second);
        }
    }
    ASSERT_EQ(truecolor.plugins.size(), lean.plugins.size() + 1);
    EXPECT_EQ(truecolor.plugins.back().repo, "neovim/nvim-lspconfig");
    EXPECT_EQ(truecolor.extensions.size(), lean.extensions.size());
    EXPECT_EQ(truecolor.bindings.size(), lean.bindings.size());
    EXPECT_EQ(truecolor.language_client.servers, lean.language_client.servers);
}

TEST_F(PresetTest, LeanStartupWithoutCompletionStack) {
    auto report = kernel_.run_startup(ks::make_lean_preset());
    EXPECT_EQ(report.active_count(), 3);
    EXPECT_EQ(report.find("cmp")->state, ks::ExtensionState::Inactive);
    EXPECT_TRUE(kernel_.options().get_bool("number"));
    EXPECT_EQ(kernel_.options().get_int("timeoutlen"), 400);
    EXPECT_FALSE(kernel_.options().get_bool("termguicolors"));

    for (const char* lhs : {"<Space>ff", "<Space>fg", "<Space>fb", "<Space>fh", "<Space>e", "<Space>q"})
        EXPECT_NE(kernel_.triggers().find(ks::Mode::Normal, lhs), nullptr) << lhs;
    EXPECT_EQ(kernel_.triggers().size(), 6u);

    // tsserver has no configuration in the client; the rest come up.
    ASSERT_EQ(report.servers.size(), 5u);
    std::vector<std::string> expected{"lua_ls", "gopls", "pyright", "rust_analyzer"};
    EXPECT_EQ(kernel_.active_servers(), expected);
    EXPECT_FALSE(report.capabilities_contributed);
    EXPECT_EQ(kernel_.diagnostics().config().virtual_text_spacing, 2);
    EXPECT_TRUE(kernel_.diagnostics().config().severity_sort);

    EXPECT_EQ(kernel_.feed(ks::Mode::Normal, " ff").status, ks::DispatchStatus::Handled);
    EXPECT_EQ(journal_->invoked.back(), "telescope:find_files");
}

TEST_F(PresetTest, LeanStartupWiresCompletionChains) {
    register_completion_stack();
    ks_test::register_fake(kernel_.registry(), "luasnip", {"expand", "expand_or_jump", "jump_prev"}, journal_);

    auto report = kernel_.run_startup(ks::make_lean_preset());
    EXPECT_EQ(report.active_count(), 5);
    EXPECT_TRUE(report.capabilities_contributed);
    EXPECT_FALSE(kernel_.options().get_bool("termguicolors"));
    EXPECT_EQ(kernel_.options().get_string("colorscheme"), "default");

    for (auto mode : {ks::Mode::Insert, ks::Mode::Select}) {
        const auto* tab = kernel_.triggers().find(mode, "<Tab>");
        ASSERT_NE(tab, nullptr);
        EXPECT_EQ(ks::describe_action(tab->action), "cmp:select_next_item > luasnip:expand_or_jump");
        const auto* stab = kernel_.triggers().find(mode, "<S-Tab>");
        ASSERT_NE(stab, nullptr);
        EXPECT_EQ(ks::describe_action(stab->action), "cmp:select_prev_item > luasnip:jump_prev");
    }
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Insert, "<C-Space>"), nullptr);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Insert, "<CR>"), nullptr);

    ASSERT_EQ(journal_->servers.count("lua_ls"), 1u);
    auto caps = journal_->servers.at("lua_ls").capabilities;
    EXPECT_TRUE(caps["textDocument"]["completion"]["completionItem"]["snippetSupport"].as<bool>());
}

TEST_F(PresetTest, LeanStartupWithoutSnippetEngine) {
    register_completion_stack();

    auto report = kernel_.run_startup(ks::make_lean_preset());
    const auto* snip = report.find("luasnip");
    ASSERT_NE(snip, nullptr);
    EXPECT_EQ(snip->state, ks::ExtensionState::Inactive);
    EXPECT_EQ(ks::describe_action(kernel_.triggers().find(ks::Mode::Insert, "<Tab>")->action),
              "cmp:select_next_item");
    EXPECT_FALSE(kernel_.triggers().references("luasnip"));
}

TEST_F(PresetTest, TruecolorStartupKeepsLeanTriggers) {
    register_completion_stack();
    kernel_.run_startup(ks::make_lean_preset());
    auto lean_size = kernel_.triggers().size();

    auto report = kernel_.run_startup(ks::make_truecolor_preset());
    EXPECT_EQ(report.plan, "truecolor");
    EXPECT_TRUE(kernel_.options().get_bool("termguicolors"));
    EXPECT_EQ(kernel_.options().get_string("colorscheme"), "default");
    EXPECT_EQ(kernel_.triggers().size(), lean_size);
}

TEST_F(PresetTest, AttachUsesPresetBindings) {
    kernel_.run_startup(ks::make_lean_preset());
    auto attached = kernel_.attach_buffer(3, "go");
    ASSERT_EQ(attached.size(), 1u);
    EXPECT_EQ(attached[0], "gopls");

    // The fake client offers definition, hover and rename only.
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Normal, "gd", 3), nullptr);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Normal, "K", 3), nullptr);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Normal, "<Space>rn", 3), nullptr);
    EXPECT_EQ(kernel_.triggers().find(ks::Mode::Normal, "gr", 3), nullptr);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Normal, "]d", 3), nullptr);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Normal, "[d", 3), nullptr);
    EXPECT_TRUE(kernel_.attach_buffer(4, "typescript").empty());
}
