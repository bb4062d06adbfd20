#include "cli/render_tables.hpp"

#include "ftxui/dom/elements.hpp"
#include "ftxui/dom/table.hpp"
#include "ftxui/screen/screen.hpp"

using namespace ftxui;

namespace {

std::string render(std::vector<std::vector<std::string>> rows) {
    Table table(std::move(rows));
    table.SelectAll().Border(LIGHT);
    table.SelectAll().SeparatorVertical(LIGHT);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).BorderBottom(LIGHT);
    auto document = table.Render();
    auto screen = Screen::Create(Dimension::Fit(document));
    Render(screen, document);
    return screen.ToString() + "\n";
}

} // namespace

std::string render_key_table(const std::vector<ks::Binding>& bindings,
                             const std::map<std::string, std::string>* sources) {
    std::vector<std::vector<std::string>> rows = {{"Scope", "Mode", "Keys", "Action", "Owner", "Description"}};
    for (const auto& b : bindings) {
        std::string owner = b.owner;
        if (sources) {
            auto it = sources->find(b.owner);
            if (it != sources->end()) owner = it->second;
        }
        rows.push_back({b.key.buffer ? "buf " + std::to_string(*b.key.buffer) : "global",
                        std::string(1, ks::mode_to_char(b.key.mode)), b.key.lhs,
                        ks::describe_action(b.action), owner,
                        b.desc + (b.silent ? " (silent)" : "")});
    }
    return render(std::move(rows));
}

std::string render_extension_table(const ks::StartupReport& report) {
    std::vector<std::vector<std::string>> rows = {{"Capability", "Role", "State", "Bindings", "Source / Reason"}};
    for (const auto& r : report.extensions) {
        rows.push_back({r.capability, ks::role_name(r.role), ks::state_name(r.state), std::to_string(r.bindings),
                        r.state == ks::ExtensionState::Active ? r.source : r.reason});
    }
    return render(std::move(rows));
}

std::string render_server_table(const ks::StartupReport& report) {
    std::vector<std::vector<std::string>> rows = {{"Server", "Active", "Reason"}};
    for (const auto& s : report.servers) rows.push_back({s.name, s.active ? "yes" : "no", s.reason});
    return render(std::move(rows));
}

std::string render_diagnostic_table(const std::vector<ks::Diagnostic>& items,
                                    const ks::InteractionService& svc) {
    std::vector<std::vector<std::string>> rows = {{"Line", "Col", "Severity", "Message", "Virtual text"}};
    for (const auto& d : items) {
        rows.push_back({std::to_string(d.line), std::to_string(d.col), ks::severity_name(d.severity),
                        d.source.empty() ? d.message : d.message + " [" + d.source + "]",
                        svc.cmd_virtual_text(d)});
    }
    return render(std::move(rows));
}
