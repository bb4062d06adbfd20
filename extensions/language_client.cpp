#include "extension_api.hpp"

#include <algorithm>
#include <map>

namespace {

// Server name -> filetypes it handles.
const std::map<std::string, std::vector<std::string>>& server_table() {
    static const std::map<std::string, std::vector<std::string>> table = {
        {"clangd", {"c", "cpp"}},
        {"gopls", {"go", "gomod"}},
        {"lua_ls", {"lua"}},
        {"pyright", {"python"}},
        {"rust_analyzer", {"rust"}},
        {"ts_ls", {"javascript", "typescript"}},
    };
    return table;
}

class LanguageClient : public ks::LanguageClient {
public:
    std::string name() const override { return "lspconfig"; }

    void setup(const YAML::Node&, ks::Host&) override {}

    std::vector<std::string> actions() const override {
        return {"definition", "references", "declaration", "implementation", "hover", "rename", "code_action"};
    }

    ks::ActionResult invoke(const std::string& action, ks::ActionContext& ctx) override {
        if (!ctx.buffer) return ks::ActionResult::NotApplicable;
        ctx.host.message(ks::MessageLevel::Info, "lsp: " + action + " at " + std::to_string(*ctx.buffer) + ":" +
                                                     std::to_string(ctx.line));
        return ks::ActionResult::Handled;
    }

    bool has_server(const std::string& server) const override { return server_table().count(server) > 0; }

    void setup_server(const std::string& server, const ks::ServerConfig& config) override {
        if (!has_server(server))
            throw ks::LoaderError(ks::LoaderErrc::NotFound, "unknown server '" + server + "'");
        if (config.debounce_text_changes_ms < 0)
            throw ks::LoaderError(ks::LoaderErrc::SetupFailed, "debounce_text_changes must not be negative");
        configured_[server] = config;
    }

    std::vector<std::string> servers_for_filetype(const std::string& filetype) const override {
        std::vector<std::string> out;
        for (const auto& [server, config] : configured_) {
            const auto& fts = server_table().at(server);
            if (std::find(fts.begin(), fts.end(), filetype) != fts.end()) out.push_back(server);
        }
        return out;
    }

private:
    std::map<std::string, ks::ServerConfig> configured_;
};

} // namespace

extern "C" EXTENSION_API void register_keystrap_extensions(ks::CapabilityRegistry* registry) {
    registry->register_capability("lspconfig", [] { return std::make_shared<LanguageClient>(); });
}
