#include "extension_api.hpp"

namespace {

// Completion source for language servers. Its only job during startup is
// to widen the client capabilities the servers are told about.
class CompletionLspSource : public ks::CapabilityContributor {
public:
    std::string name() const override { return "cmp_nvim_lsp"; }
    void setup(const YAML::Node&, ks::Host&) override {}
    std::vector<std::string> actions() const override { return {}; }
    ks::ActionResult invoke(const std::string&, ks::ActionContext&) override {
        return ks::ActionResult::NotApplicable;
    }

    void contribute(YAML::Node& caps) override {
        auto item = caps["textDocument"]["completion"]["completionItem"];
        item["snippetSupport"] = true;
        item["preselectSupport"] = true;
        item["insertReplaceSupport"] = true;
        item["labelDetailsSupport"] = true;
        item["commitCharactersSupport"] = true;
        item["resolveSupport"]["properties"].push_back("documentation");
        item["resolveSupport"]["properties"].push_back("detail");
        item["resolveSupport"]["properties"].push_back("additionalTextEdits");
        caps["textDocument"]["completion"]["contextSupport"] = true;
    }
};

} // namespace

extern "C" EXTENSION_API void register_keystrap_extensions(ks::CapabilityRegistry* registry) {
    registry->register_capability("cmp_nvim_lsp", [] { return std::make_shared<CompletionLspSource>(); });
}
