#include <gtest/gtest.h>

#include "test_support.hpp"

using ks_test::binding;
using ks_test::descriptor;

namespace {

class StartupTest : public ::testing::Test {
protected:
    void SetUp() override {
        ks_test::isolate(kernel_);
        journal_ = std::make_shared<ks_test::Journal>();
    }

    void add_fake(const std::string& name, std::vector<std::string> actions) {
        ks_test::register_fake(kernel_.registry(), name, std::move(actions), journal_);
    }

    void add_client(std::map<std::string, std::vector<std::string>> servers) {
        auto journal = journal_;
        kernel_.registry().register_capability("client", [servers, journal] {
            return std::make_shared<ks_test::FakeLanguageClient>(servers, journal);
        });
    }

    void add_contributor(const std::string& name) {
        auto journal = journal_;
        kernel_.registry().register_capability(name, [journal] {
            return std::make_shared<ks_test::FakeContributor>(journal);
        });
    }

    ks::Kernel kernel_;
    std::shared_ptr<ks_test::Journal> journal_;
};

// One line per trigger entry, in table order.
std::vector<std::string> table_lines(const ks::TriggerTable& table) {
    std::vector<std::string> out;
    for (const auto& b : table.entries())
        out.push_back(std::to_string(static_cast<int>(b.key.mode)) + " " + b.key.lhs + " " + b.owner + " " +
                      ks::describe_action(b.action));
    return out;
}

bool snippet_support(const YAML::Node& caps) {
    return caps["textDocument"]["completion"]["completionItem"]["snippetSupport"].as<bool>();
}

}  // namespace

TEST_F(StartupTest, MissingExtensionDoesNotAbortStartup) {
    add_fake("finder", {"find"});
    auto plan = ks_test::bare_plan();
    plan.extensions.push_back(descriptor("absent", {binding("n", "a", {{"", "go"}})}));
    plan.extensions.push_back(descriptor("finder", {binding("n", "f", {{"", "find"}})}));
    plan.bindings.push_back(binding("n", "x", {{"absent", "go"}}));

    auto report = kernel_.run_startup(plan);
    ASSERT_EQ(report.extensions.size(), 2u);
    const auto* absent = report.find("absent");
    ASSERT_NE(absent, nullptr);
    EXPECT_EQ(absent->state, ks::ExtensionState::Inactive);
    EXPECT_EQ(absent->reason, "capability not registered");
    EXPECT_EQ(report.find("finder")->state, ks::ExtensionState::Active);
    EXPECT_EQ(report.find("finder")->source, "built-in");
    EXPECT_EQ(report.active_count(), 1);

    // Only the active extension contributed a trigger.
    EXPECT_EQ(kernel_.triggers().size(), 1u);
    EXPECT_EQ(kernel_.triggers().find(ks::Mode::Normal, "a"), nullptr);
    ASSERT_EQ(report.skipped_bindings.size(), 1u);
    EXPECT_EQ(report.skipped_bindings[0].lhs, "x");
    EXPECT_EQ(report.skipped_bindings[0].owner, "absent");
    EXPECT_FALSE(kernel_.capability_active("absent"));
}

TEST_F(StartupTest, SettingsApplyBeforeBindings) {
    add_fake("finder", {"find"});
    auto plan = ks_test::bare_plan();
    plan.settings.emplace_back("mapleader", std::string(" "));
    plan.extensions.push_back(descriptor("finder", {binding("n", "<leader>ff", {{"", "find"}})}));

    kernel_.run_startup(plan);
    const auto* b = kernel_.triggers().find(ks::Mode::Normal, "<Space>ff");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->owner, "finder");
    EXPECT_EQ(kernel_.triggers().find(ks::Mode::Normal, "\\ff"), nullptr);

    auto result = kernel_.feed(ks::Mode::Normal, " ff");
    EXPECT_EQ(result.status, ks::DispatchStatus::Handled);
    ASSERT_EQ(journal_->invoked.size(), 1u);
    EXPECT_EQ(journal_->invoked[0], "finder:find");
}

TEST_F(StartupTest, LaterBindingReplacesEarlier) {
    add_fake("a", {"one"});
    add_fake("c", {"two"});
    auto plan = ks_test::bare_plan();
    plan.extensions.push_back(descriptor("a", {binding("n", "x", {{"", "one"}})}));
    plan.extensions.push_back(descriptor("c", {binding("n", "x", {{"", "two"}})}));

    kernel_.run_startup(plan);
    ASSERT_EQ(kernel_.triggers().size(), 1u);
    const auto* b = kernel_.triggers().find(ks::Mode::Normal, "x");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(ks::describe_action(b->action), "c:two");
    EXPECT_EQ(b->owner, "c");
}

TEST_F(StartupTest, FailedMiddleExtensionNeverBinds) {
    add_fake("a", {"one"});
    add_fake("b", {"mid"});
    add_fake("c", {"two"});
    auto plan = ks_test::bare_plan();
    plan.extensions.push_back(descriptor("a", {binding("n", "x", {{"", "one"}})}));
    auto failing = descriptor("b", {binding("n", "x", {{"", "mid"}})});
    failing.options = YAML::Load("{fail: true}");
    plan.extensions.push_back(failing);
    plan.extensions.push_back(descriptor("c", {binding("n", "x", {{"", "two"}})}));

    for (int run = 0; run < 2; ++run) {
        auto report = kernel_.run_startup(plan);
        EXPECT_EQ(report.find("b")->state, ks::ExtensionState::Inactive);
        EXPECT_EQ(report.find("b")->bindings, 0);
        ASSERT_EQ(kernel_.triggers().size(), 1u);
        const auto* b = kernel_.triggers().find(ks::Mode::Normal, "x");
        ASSERT_NE(b, nullptr);
        EXPECT_EQ(ks::describe_action(b->action), "c:two");
        EXPECT_FALSE(kernel_.triggers().references("b"));
    }
    EXPECT_EQ(kernel_.feed(ks::Mode::Normal, "x").status, ks::DispatchStatus::Handled);
    std::vector<std::string> invoked{"c:two"};
    EXPECT_EQ(journal_->invoked, invoked);
}

TEST_F(StartupTest, SamePlanTwiceGivesIdenticalTable) {
    add_fake("finder", {"find", "grep"});
    add_fake("cmp", {"next"});
    auto plan = ks_test::bare_plan();
    plan.settings.emplace_back("mapleader", std::string(","));
    plan.extensions.push_back(descriptor("finder", {
        binding("n", "<leader>f", {{"", "find"}}),
        binding("nv", "<leader>g", {{"", "grep"}}),
    }));
    plan.extensions.push_back(descriptor("absent", {binding("n", "q", {{"", "go"}})}));
    plan.extensions.push_back(descriptor("cmp", {binding("is", "<Tab>", {{"", "next"}, {"absent", "jump"}})}));
    plan.bindings.push_back(binding("n", "<leader>e", {{ks::kBuiltinOwner, "diagnostic.open_float"}}));

    kernel_.run_startup(plan);
    auto first = table_lines(kernel_.triggers());
    ASSERT_EQ(first.size(), 6u);

    kernel_.run_startup(plan);
    EXPECT_EQ(table_lines(kernel_.triggers()), first);
}

TEST_F(StartupTest, RepeatedDeclarationIsNotProbedAgain) {
    add_fake("a", {"one"});
    auto plan = ks_test::bare_plan();
    plan.extensions.push_back(descriptor("a", {binding("n", "y", {{"", "one"}})}));
    auto again = descriptor("a", {binding("n", "z", {{"", "one"}})});
    again.options = YAML::Load("{fail: true}");
    plan.extensions.push_back(again);

    auto report = kernel_.run_startup(plan);
    EXPECT_EQ(journal_->setups, 1);
    ASSERT_EQ(report.extensions.size(), 2u);
    EXPECT_EQ(report.extensions[0].state, ks::ExtensionState::Active);
    EXPECT_EQ(report.extensions[1].state, ks::ExtensionState::Declared);
    EXPECT_EQ(report.extensions[1].reason, "already declared");
    EXPECT_EQ(report.find("a")->state, ks::ExtensionState::Active);
    EXPECT_EQ(report.active_count(), 1);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Normal, "y"), nullptr);
    EXPECT_EQ(kernel_.triggers().find(ks::Mode::Normal, "z"), nullptr);
}

TEST_F(StartupTest, NonStandardThrowsStayContained) {
    add_fake("odd", {"go"});
    add_fake("finder", {"find"});
    add_client({{"alpha", {"c"}}, {"raw", {"x"}}});
    auto plan = ks_test::bare_plan();
    auto odd = descriptor("odd", {binding("n", "o", {{"", "go"}})});
    odd.options = YAML::Load("{throw_raw: true}");
    plan.extensions.push_back(odd);
    plan.extensions.push_back(descriptor("finder", {binding("n", "f", {{"", "find"}})}));
    plan.language_client.servers = {"raw", "alpha"};
    plan.extensions.push_back(descriptor("client", {}, ks::ExtensionRole::LanguageClient));

    ks::StartupReport report;
    ASSERT_NO_THROW(report = kernel_.run_startup(plan));
    EXPECT_EQ(report.find("odd")->state, ks::ExtensionState::Inactive);
    EXPECT_EQ(report.find("odd")->reason, "setup failed: unknown exception");
    EXPECT_EQ(report.find("finder")->state, ks::ExtensionState::Active);
    ASSERT_EQ(report.servers.size(), 2u);
    EXPECT_FALSE(report.servers[0].active);
    EXPECT_EQ(report.servers[0].reason, "unknown exception");
    EXPECT_TRUE(report.servers[1].active);
}

TEST_F(StartupTest, MultiModeBindingCreatesOneEntryPerMode) {
    add_fake("cmp", {"next"});
    auto plan = ks_test::bare_plan();
    plan.extensions.push_back(descriptor("cmp", {binding("is", "<tab>", {{"", "next"}})}));

    auto report = kernel_.run_startup(plan);
    EXPECT_EQ(report.find("cmp")->bindings, 1);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Insert, "<Tab>"), nullptr);
    EXPECT_NE(kernel_.triggers().find(ks::Mode::Select, "<Tab>"), nullptr);
    EXPECT_EQ(kernel_.triggers().find(ks::Mode::Normal, "<Tab>"), nullptr);
}

TEST_F(StartupTest, SetupFailureLeavesExtensionInactive) {
    add_fake("picky", {"go"});
    auto plan = ks_test::bare_plan();
    auto d = descriptor("picky", {binding("n", "p", {{"", "go"}})});
    d.options = YAML::Load("{fail: true}");
    plan.extensions.push_back(d);

    auto report = kernel_.run_startup(plan);
    const auto* rec = report.find("picky");
    ASSERT_NE(rec, nullptr);
    EXPECT_EQ(rec->state, ks::ExtensionState::Inactive);
    EXPECT_EQ(rec->reason.rfind("setup failed:", 0), 0u);
    EXPECT_EQ(journal_->setups, 1);
    EXPECT_TRUE(kernel_.triggers().empty());
}

TEST_F(StartupTest, ExtensionReceivesItsOptions) {
    add_fake("finder", {"find"});
    auto plan = ks_test::bare_plan();
    auto d = descriptor("finder", {});
    d.options = YAML::Load("{layout: top, depth: 3}");
    plan.extensions.push_back(d);

    kernel_.run_startup(plan);
    ASSERT_TRUE(journal_->last_options.IsMap());
    EXPECT_EQ(journal_->last_options["layout"].as<std::string>(), "top");
    EXPECT_EQ(journal_->last_options["depth"].as<int>(), 3);
}

TEST_F(StartupTest, InvalidSettingsAreReportedAndSkipped) {
    auto plan = ks_test::bare_plan();
    plan.settings.emplace_back("bogus", true);
    plan.settings.emplace_back("number", std::string("yes"));
    plan.settings.emplace_back("updatetime", 250);

    auto report = kernel_.run_startup(plan);
    ASSERT_EQ(report.rejected_settings.size(), 2u);
    EXPECT_EQ(report.rejected_settings[0].first, "bogus");
    EXPECT_EQ(report.rejected_settings[1].first, "number");
    EXPECT_FALSE(kernel_.options().get_bool("number"));
    EXPECT_EQ(kernel_.options().get_int("updatetime"), 250);
}

TEST_F(StartupTest, BindingsToUnknownActionsAreSkipped) {
    add_fake("finder", {"find"});
    auto plan = ks_test::bare_plan();
    plan.extensions.push_back(descriptor("finder", {
        binding("n", "a", {{"", "nonexistent"}}),
        binding("z", "b", {{"", "find"}}),
        binding("n", "", {{"", "find"}}),
        binding("n", "c", {}),
    }));
    plan.bindings.push_back(binding("n", "d", {{"", "diagnostic.explode"}}));

    auto report = kernel_.run_startup(plan);
    EXPECT_TRUE(kernel_.triggers().empty());
    ASSERT_EQ(report.skipped_bindings.size(), 5u);
    EXPECT_EQ(report.skipped_bindings[0].reason, "'finder' has no action 'nonexistent'");
    EXPECT_EQ(report.skipped_bindings[1].reason, "invalid mode set 'z'");
    EXPECT_EQ(report.skipped_bindings[2].reason, "empty trigger");
    EXPECT_EQ(report.skipped_bindings[3].reason, "no action");
    EXPECT_EQ(report.skipped_bindings[4].owner, "builtin");
    EXPECT_EQ(report.find("finder")->bindings, 0);
}

TEST_F(StartupTest, ChainStepsOfInactiveOwnersAreDropped) {
    add_fake("cmp", {"next"});
    add_fake("snip", {"jump"});

    auto chain = binding("is", "<Tab>", {{"", "next"}, {"snip", "jump"}, {"snip", "unknown"}});
    auto without = ks_test::bare_plan();
    without.extensions.push_back(descriptor("cmp", {chain}));
    kernel_.run_startup(without);
    EXPECT_EQ(ks::describe_action(kernel_.triggers().find(ks::Mode::Insert, "<Tab>")->action), "cmp:next");

    auto with = ks_test::bare_plan();
    with.extensions.push_back(descriptor("snip", {}, ks::ExtensionRole::Snippet));
    with.extensions.push_back(descriptor("cmp", {chain}, ks::ExtensionRole::Completion));
    kernel_.run_startup(with);
    const auto* b = kernel_.triggers().find(ks::Mode::Insert, "<Tab>");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(ks::describe_action(b->action), "cmp:next > snip:jump");
    EXPECT_TRUE(kernel_.triggers().references("snip"));
}

TEST_F(StartupTest, CapabilitiesIncludeContributionWhenProviderActive) {
    add_client({{"alpha", {"c"}}});
    add_contributor("contrib");
    auto plan = ks_test::bare_plan();
    plan.language_client.capability_provider = "contrib";
    plan.language_client.servers = {"alpha"};
    plan.language_client.debounce_text_changes_ms = 75;
    plan.extensions.push_back(descriptor("client", {}, ks::ExtensionRole::LanguageClient));

    auto report = kernel_.run_startup(plan);
    EXPECT_TRUE(report.capabilities_contributed);
    ASSERT_EQ(journal_->servers.count("alpha"), 1u);
    const auto& config = journal_->servers.at("alpha");
    EXPECT_EQ(config.debounce_text_changes_ms, 75);
    EXPECT_TRUE(snippet_support(config.capabilities));
}

TEST_F(StartupTest, DefaultCapabilitiesWithoutProvider) {
    add_client({{"alpha", {"c"}}});
    auto plan = ks_test::bare_plan();
    plan.language_client.capability_provider = "contrib";
    plan.language_client.servers = {"alpha"};
    plan.extensions.push_back(descriptor("client", {}, ks::ExtensionRole::LanguageClient));

    auto report = kernel_.run_startup(plan);
    EXPECT_FALSE(report.capabilities_contributed);
    ASSERT_EQ(journal_->servers.count("alpha"), 1u);
    EXPECT_FALSE(snippet_support(journal_->servers.at("alpha").capabilities));
}

TEST_F(StartupTest, EveryListedServerIsAttemptedOnce) {
    add_client({{"alpha", {"c"}}, {"beta", {"go"}}, {"broken", {"x"}}});
    auto plan = ks_test::bare_plan();
    plan.language_client.servers = {"alpha", "broken", "unknown", "beta"};
    plan.extensions.push_back(descriptor("client", {}, ks::ExtensionRole::LanguageClient));

    auto report = kernel_.run_startup(plan);
    ASSERT_EQ(report.servers.size(), 4u);
    EXPECT_TRUE(report.servers[0].active);
    EXPECT_FALSE(report.servers[1].active);
    EXPECT_EQ(report.servers[1].reason, "server binary missing");
    EXPECT_FALSE(report.servers[2].active);
    EXPECT_EQ(report.servers[2].reason, "no configuration for server");
    EXPECT_TRUE(report.servers[3].active);

    std::vector<std::string> expected{"alpha", "beta"};
    EXPECT_EQ(kernel_.active_servers(), expected);
    EXPECT_EQ(journal_->servers.size(), 2u);
}

TEST_F(StartupTest, LanguageClientRoleRequiresClientInterface) {
    add_fake("notaclient", {});
    auto plan = ks_test::bare_plan();
    plan.language_client.servers = {"alpha"};
    plan.extensions.push_back(descriptor("notaclient", {}, ks::ExtensionRole::LanguageClient));

    auto report = kernel_.run_startup(plan);
    EXPECT_EQ(report.find("notaclient")->state, ks::ExtensionState::Inactive);
    EXPECT_EQ(report.find("notaclient")->reason, "does not implement the language client interface");
    EXPECT_TRUE(report.servers.empty());
}

TEST_F(StartupTest, AttachInstallsBufferBindingsOnce) {
    add_client({{"alpha", {"c", "cpp"}}, {"broken", {"x"}}});
    auto plan = ks_test::bare_plan();
    plan.language_client.servers = {"alpha", "broken"};
    plan.language_client.attach_bindings = {
        binding("n", "gd", {{"", "definition"}}),
        binding("n", "]d", {{ks::kBuiltinOwner, "diagnostic.goto_next"}}),
    };
    plan.extensions.push_back(descriptor("client", {}, ks::ExtensionRole::LanguageClient));
    kernel_.run_startup(plan);

    // No attach bindings exist before a buffer attaches.
    EXPECT_TRUE(kernel_.triggers().empty());

    auto attached = kernel_.attach_buffer(7, "cpp");
    ASSERT_EQ(attached.size(), 1u);
    EXPECT_EQ(attached[0], "alpha");
    EXPECT_TRUE(kernel_.is_attached(7));
    EXPECT_EQ(kernel_.triggers().size(), 2u);
    EXPECT_EQ(kernel_.triggers().find(ks::Mode::Normal, "gd"), nullptr);
    const auto* gd = kernel_.triggers().find(ks::Mode::Normal, "gd", 7);
    ASSERT_NE(gd, nullptr);
    EXPECT_EQ(gd->owner, "client");
    EXPECT_EQ(kernel_.triggers().find(ks::Mode::Normal, "]d", 7)->owner, "builtin");

    auto omnifunc = kernel_.options().get_local(7, "omnifunc");
    ASSERT_TRUE(omnifunc.has_value());
    EXPECT_EQ(ks::setting_to_string(*omnifunc), "lsp");

    kernel_.attach_buffer(7, "c");
    EXPECT_EQ(kernel_.triggers().size(), 2u);

    // The broken server never became active, so nothing attaches.
    EXPECT_TRUE(kernel_.attach_buffer(8, "x").empty());
    EXPECT_FALSE(kernel_.is_attached(8));
    EXPECT_FALSE(kernel_.options().get_local(8, "omnifunc").has_value());

    auto result = kernel_.feed(ks::Mode::Normal, "gd", 7);
    EXPECT_EQ(result.status, ks::DispatchStatus::Handled);
    ASSERT_FALSE(journal_->invoked.empty());
    EXPECT_EQ(journal_->invoked.back(), "client:definition@7");
    EXPECT_EQ(kernel_.feed(ks::Mode::Normal, "gd").status, ks::DispatchStatus::Unmapped);
}

TEST_F(StartupTest, AttachWithoutClientDoesNothing) {
    kernel_.run_startup(ks_test::bare_plan());
    EXPECT_TRUE(kernel_.attach_buffer(1, "c").empty());
    EXPECT_FALSE(kernel_.is_attached(1));
}

TEST_F(StartupTest, RerunStartsFromEmptyTables) {
    add_fake("finder", {"find"});
    auto first = ks_test::bare_plan("first");
    first.settings.emplace_back("number", true);
    first.extensions.push_back(descriptor("finder", {binding("n", "f", {{"", "find"}})}));
    kernel_.run_startup(first);
    EXPECT_EQ(kernel_.triggers().size(), 1u);

    auto report = kernel_.run_startup(ks_test::bare_plan("second"));
    EXPECT_EQ(report.plan, "second");
    EXPECT_TRUE(kernel_.triggers().empty());
    EXPECT_FALSE(kernel_.options().get_bool("number"));
    EXPECT_FALSE(kernel_.capability_active("finder"));
    ASSERT_TRUE(kernel_.last_report().has_value());
    EXPECT_EQ(kernel_.last_report()->plan, "second");
    // The registry itself survives reruns.
    EXPECT_TRUE(kernel_.registry().contains("finder"));
}
