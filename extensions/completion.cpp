#include "extension_api.hpp"

namespace {

// Completion menu. Items are the configured source names; the menu opens
// on "complete" and closes on "confirm" or "abort".
class Completion : public ks::Extension {
public:
    std::string name() const override { return "cmp"; }

    void setup(const YAML::Node& options, ks::Host& host) override {
        if (!options || options.IsNull()) return;
        auto snippet = options["snippet"].as<std::string>("none");
        if (snippet == "auto") snippet_engine_ = host.capability_active("luasnip") ? "luasnip" : "builtin";
        else if (snippet != "none") snippet_engine_ = snippet;

        for (const auto& group : options["sources"]) {
            if (!group.IsSequence())
                throw ks::LoaderError(ks::LoaderErrc::SetupFailed, "cmp sources must be a list of groups");
            for (const auto& s : group) items_.push_back(s.as<std::string>());
        }
    }

    std::vector<std::string> actions() const override {
        return {"complete", "confirm", "select_next_item", "select_prev_item", "abort"};
    }

    ks::ActionResult invoke(const std::string& action, ks::ActionContext& ctx) override {
        if (action == "complete") {
            if (items_.empty()) return ks::ActionResult::NotApplicable;
            open_ = true;
            selected_ = -1;
            ctx.host.message(ks::MessageLevel::Info, "cmp: " + std::to_string(items_.size()) + " item(s)");
            return ks::ActionResult::Handled;
        }
        if (!open_) return ks::ActionResult::NotApplicable;

        const int n = static_cast<int>(items_.size());
        if (action == "select_next_item") {
            selected_ = (selected_ + 1) % n;
        } else if (action == "select_prev_item") {
            selected_ = selected_ <= 0 ? n - 1 : selected_ - 1;
        } else if (action == "confirm") {
            if (selected_ < 0) selected_ = 0;  // nothing picked: confirm the first entry
            std::string text = "cmp: inserted " + items_[selected_];
            if (!snippet_engine_.empty()) text += " (snippets: " + snippet_engine_ + ")";
            ctx.host.message(ks::MessageLevel::Info, text);
            open_ = false;
            return ks::ActionResult::Handled;
        } else if (action == "abort") {
            open_ = false;
            return ks::ActionResult::Handled;
        }
        ctx.host.message(ks::MessageLevel::Info, "cmp: selected " + items_[selected_]);
        return ks::ActionResult::Handled;
    }

private:
    std::string snippet_engine_;
    std::vector<std::string> items_;
    bool open_ = false;
    int selected_ = -1;
};

} // namespace

extern "C" EXTENSION_API void register_keystrap_extensions(ks::CapabilityRegistry* registry) {
    registry->register_capability("cmp", [] { return std::make_shared<Completion>(); });
}
