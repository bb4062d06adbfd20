#include "extension_api.hpp"

#include <map>

namespace {

// Picker front end. Setup validates the option shape; actions only
// report which picker would open.
class FuzzyFinder : public ks::Extension {
public:
    std::string name() const override { return "telescope"; }

    void setup(const YAML::Node& options, ks::Host&) override {
        if (!options || options.IsNull()) return;
        if (!options.IsMap())
            throw ks::LoaderError(ks::LoaderErrc::SetupFailed, "telescope options must be a map");
        const auto& defaults = options["defaults"];
        if (!defaults) return;
        sorting_ = defaults["sorting_strategy"].as<std::string>(sorting_);
        if (sorting_ != "ascending" && sorting_ != "descending")
            throw ks::LoaderError(ks::LoaderErrc::SetupFailed, "unknown sorting_strategy '" + sorting_ + "'");
        if (const auto& layout = defaults["layout_config"])
            prompt_position_ = layout["prompt_position"].as<std::string>(prompt_position_);
        for (const auto& mode : defaults["mappings"]) {
            for (const auto& kv : mode.second)
                prompt_mappings_[mode.first.as<std::string>() + " " + kv.first.as<std::string>()] =
                    kv.second.as<std::string>();
        }
    }

    std::vector<std::string> actions() const override {
        return {"find_files", "live_grep", "buffers", "help_tags"};
    }

    ks::ActionResult invoke(const std::string& action, ks::ActionContext& ctx) override {
        ctx.host.message(ks::MessageLevel::Info,
                         "telescope: " + action + " (prompt " + prompt_position_ + ", " + sorting_ + ", " +
                             std::to_string(prompt_mappings_.size()) + " prompt mapping(s))");
        return ks::ActionResult::Handled;
    }

private:
    std::string sorting_ = "descending";
    std::string prompt_position_ = "bottom";
    std::map<std::string, std::string> prompt_mappings_;
};

} // namespace

extern "C" EXTENSION_API void register_keystrap_extensions(ks::CapabilityRegistry* registry) {
    registry->register_capability("telescope", [] { return std::make_shared<FuzzyFinder>(); });
}
