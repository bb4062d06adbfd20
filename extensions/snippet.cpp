#include "extension_api.hpp"

namespace {

// Snippet engine with one pending snippet of three tabstops.
class Snippet : public ks::Extension {
public:
    std::string name() const override { return "luasnip"; }
    void setup(const YAML::Node&, ks::Host&) override {}

    std::vector<std::string> actions() const override { return {"expand", "expand_or_jump", "jump_prev"}; }

    ks::ActionResult invoke(const std::string& action, ks::ActionContext& ctx) override {
        if (action == "expand" || action == "expand_or_jump") {
            if (tabstop_ == 0) {
                tabstop_ = 1;
            } else if (tabstop_ < kTabstops) {
                ++tabstop_;
            } else {
                tabstop_ = 0;
                return ks::ActionResult::NotApplicable;
            }
        } else if (action == "jump_prev") {
            if (tabstop_ <= 1) return ks::ActionResult::NotApplicable;
            --tabstop_;
        }
        ctx.host.message(ks::MessageLevel::Info, "luasnip: tabstop " + std::to_string(tabstop_));
        return ks::ActionResult::Handled;
    }

private:
    static constexpr int kTabstops = 3;
    int tabstop_ = 0;
};

} // namespace

extern "C" EXTENSION_API void register_keystrap_extensions(ks::CapabilityRegistry* registry) {
    registry->register_capability("luasnip", [] { return std::make_shared<Snippet>(); });
}
