#include "extension_api.hpp"

#include <algorithm>
#include <set>

namespace {

const std::set<std::string>& known_parsers() {
    static const std::set<std::string> parsers = {
        "bash", "c", "cpp", "go", "javascript", "json", "lua", "markdown",
        "python", "regex", "rust", "typescript", "vim", "vimdoc", "yaml",
    };
    return parsers;
}

bool enabled(const YAML::Node& options, const char* module) {
    const auto& m = options[module];
    return m && m.IsMap() && m["enable"].as<bool>(false);
}

class SyntaxTree : public ks::Extension {
public:
    std::string name() const override { return "nvim-treesitter.configs"; }

    void setup(const YAML::Node& options, ks::Host& host) override {
        if (!options || options.IsNull()) return;
        for (const auto& p : options["ensure_installed"]) {
            auto parser = p.as<std::string>();
            if (!known_parsers().count(parser)) {
                host.message(ks::MessageLevel::Warning, "treesitter: no parser for '" + parser + "'");
                continue;
            }
            installed_.insert(parser);
        }
        highlight_ = enabled(options, "highlight");
        indent_ = enabled(options, "indent");
        selection_ = enabled(options, "incremental_selection");
    }

    std::vector<std::string> actions() const override {
        return {"init_selection", "node_incremental", "scope_incremental", "node_decremental"};
    }

    ks::ActionResult invoke(const std::string& action, ks::ActionContext& ctx) override {
        if (!selection_) return ks::ActionResult::NotApplicable;
        if (action == "init_selection") {
            depth_ = 1;
            ctx.host.message(ks::MessageLevel::Debug,
                             "treesitter: " + std::to_string(installed_.size()) + " parser(s), highlight " +
                                 (highlight_ ? "on" : "off") + ", indent " + (indent_ ? "on" : "off"));
        } else if (action == "node_incremental") {
            ++depth_;
        } else if (action == "scope_incremental") {
            depth_ += 2;
        } else if (action == "node_decremental") {
            depth_ = std::max(0, depth_ - 1);
        }
        ctx.host.message(ks::MessageLevel::Info, "treesitter: selection depth " + std::to_string(depth_));
        return ks::ActionResult::Handled;
    }

private:
    std::set<std::string> installed_;
    bool highlight_ = false;
    bool indent_ = false;
    bool selection_ = false;
    int depth_ = 0;
};

} // namespace

extern "C" EXTENSION_API void register_keystrap_extensions(ks::CapabilityRegistry* registry) {
    registry->register_capability("nvim-treesitter.configs", [] { return std::make_shared<SyntaxTree>(); });
}
