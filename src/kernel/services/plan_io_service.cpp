#include "kernel/services/plan_io_service.hpp"

#include <fstream>

#include "kernel/options.hpp"

namespace ks {

namespace {

ActionRef parse_ref(const std::string& text) {
  auto pos = text.find(':');
  if (pos == std::string::npos) return {"", text};
  return {text.substr(0, pos), text.substr(pos + 1)};
}

std::string ref_to_string(const ActionRef& ref) {
  return ref.owner.empty() ? ref.name : ref.owner + ":" + ref.name;
}

std::vector<BindingSpec> bindings_from_yaml(const YAML::Node& n) {
  std::vector<BindingSpec> out;
  if (!n) return out;
  if (!n.IsSequence())
    throw LoaderError(LoaderErrc::InvalidYaml, "bindings must be a sequence");
  for (const auto& it : n) {
    BindingSpec b;
    b.modes = it["modes"].as<std::string>("n");
    b.lhs = it["lhs"].as<std::string>("");
    b.desc = it["desc"].as<std::string>("");
    b.silent = it["silent"].as<bool>(false);
    const auto& action = it["action"];
    if (action && action.IsSequence()) {
      for (const auto& step : action) b.action.push_back(parse_ref(step.as<std::string>()));
    } else if (action && action.IsScalar()) {
      b.action.push_back(parse_ref(action.as<std::string>()));
    }
    out.push_back(std::move(b));
  }
  return out;
}

YAML::Node bindings_to_yaml(const std::vector<BindingSpec>& specs) {
  YAML::Node arr(YAML::NodeType::Sequence);
  for (const auto& b : specs) {
    YAML::Node n;
    n["modes"] = b.modes;
    n["lhs"] = b.lhs;
    if (b.action.size() == 1) {
      n["action"] = ref_to_string(b.action.front());
    } else {
      for (const auto& ref : b.action) n["action"].push_back(ref_to_string(ref));
    }
    if (!b.desc.empty()) n["desc"] = b.desc;
    if (b.silent) n["silent"] = true;
    arr.push_back(n);
  }
  return arr;
}

DiagnosticsConfig diagnostics_from_yaml(const YAML::Node& n) {
  DiagnosticsConfig c;
  if (!n) return c;
  const auto& vt = n["virtual_text"];
  if (vt && vt.IsScalar()) {
    c.virtual_text = vt.as<bool>();
  } else if (vt && vt.IsMap()) {
    c.virtual_text = true;
    c.virtual_text_spacing = vt["spacing"].as<int>(c.virtual_text_spacing);
    c.virtual_text_prefix = vt["prefix"].as<std::string>(c.virtual_text_prefix);
  }
  c.signs = n["signs"].as<bool>(c.signs);
  c.update_in_insert = n["update_in_insert"].as<bool>(c.update_in_insert);
  c.severity_sort = n["severity_sort"].as<bool>(c.severity_sort);
  return c;
}

YAML::Node diagnostics_to_yaml(const DiagnosticsConfig& c) {
  YAML::Node n;
  if (c.virtual_text) {
    n["virtual_text"]["spacing"] = c.virtual_text_spacing;
    n["virtual_text"]["prefix"] = c.virtual_text_prefix;
  } else {
    n["virtual_text"] = false;
  }
  n["signs"] = c.signs;
  n["update_in_insert"] = c.update_in_insert;
  n["severity_sort"] = c.severity_sort;
  return n;
}

SettingValue setting_from_yaml(const std::string& name, const YAML::Node& v) {
  if (!v.IsScalar())
    throw LoaderError(LoaderErrc::InvalidYaml, "setting '" + name + "' must be a scalar");
  const std::string text = v.Scalar();
  // Unknown names are kept as text; run_startup() rejects them with a warning.
  if (!Options::find_spec(name)) return text;
  return Options::parse_value(name, text);
}

}  // namespace

StartupPlan PlanIOService::from_yaml(const YAML::Node& root) {
  if (!root.IsMap())
    throw LoaderError(LoaderErrc::InvalidYaml, "Manifest root is not a map.");

  StartupPlan plan;
  try {
    plan.name = root["name"].as<std::string>("custom");

    if (const auto& settings = root["settings"]) {
      if (!settings.IsMap())
        throw LoaderError(LoaderErrc::InvalidYaml, "settings must be a map");
      for (const auto& kv : settings) {
        auto name = kv.first.as<std::string>();
        plan.settings.emplace_back(name, setting_from_yaml(name, kv.second));
      }
    }

    if (const auto& m = root["manager"]) {
      plan.manager.enabled = m["enabled"].as<bool>(plan.manager.enabled);
      plan.manager.name = m["name"].as<std::string>(plan.manager.name);
      plan.manager.url = m["url"].as<std::string>(plan.manager.url);
      plan.manager.channel = m["channel"].as<std::string>(plan.manager.channel);
    }

    for (const auto& p : root["plugins"]) {
      PluginSpec spec;
      if (p.IsScalar()) {
        spec.repo = p.as<std::string>();
      } else {
        spec.repo = p["repo"].as<std::string>("");
        if (p["dependencies"])
          spec.dependencies = p["dependencies"].as<std::vector<std::string>>();
      }
      if (spec.repo.empty())
        throw LoaderError(LoaderErrc::InvalidYaml, "plugin entry without repo");
      plan.plugins.push_back(std::move(spec));
    }

    for (const auto& e : root["extensions"]) {
      ExtensionDescriptor d;
      auto role_text = e["role"].as<std::string>("custom");
      auto role = role_from_name(role_text);
      if (!role)
        throw LoaderError(LoaderErrc::InvalidYaml, "unknown extension role '" + role_text + "'");
      d.role = *role;
      d.capability = e["capability"].as<std::string>("");
      if (d.capability.empty())
        throw LoaderError(LoaderErrc::InvalidYaml, "extension entry without capability");
      if (e["options"]) d.options = YAML::Clone(e["options"]);
      d.bindings = bindings_from_yaml(e["bindings"]);
      plan.extensions.push_back(std::move(d));
    }

    if (const auto& lc = root["language_client"]) {
      auto& p = plan.language_client;
      if (lc["servers"]) p.servers = lc["servers"].as<std::vector<std::string>>();
      p.debounce_text_changes_ms = lc["debounce_text_changes_ms"].as<int>(p.debounce_text_changes_ms);
      p.capability_provider = lc["capability_provider"].as<std::string>(p.capability_provider);
      p.diagnostics = diagnostics_from_yaml(lc["diagnostics"]);
      p.attach_bindings = bindings_from_yaml(lc["attach_bindings"]);
    }

    plan.bindings = bindings_from_yaml(root["bindings"]);
  } catch (const YAML::Exception& e) {
    throw LoaderError(LoaderErrc::InvalidYaml, std::string("Malformed manifest: ") + e.what());
  }
  return plan;
}

YAML::Node PlanIOService::to_yaml(const StartupPlan& plan) {
  YAML::Node root;
  root["name"] = plan.name;
  for (const auto& [name, value] : plan.settings) {
    if (auto b = std::get_if<bool>(&value)) root["settings"][name] = *b;
    else if (auto i = std::get_if<int>(&value)) root["settings"][name] = *i;
    else root["settings"][name] = std::get<std::string>(value);
  }

  root["manager"]["enabled"] = plan.manager.enabled;
  root["manager"]["name"] = plan.manager.name;
  root["manager"]["url"] = plan.manager.url;
  root["manager"]["channel"] = plan.manager.channel;

  for (const auto& p : plan.plugins) {
    YAML::Node n;
    n["repo"] = p.repo;
    if (!p.dependencies.empty()) n["dependencies"] = p.dependencies;
    root["plugins"].push_back(n);
  }

  for (const auto& d : plan.extensions) {
    YAML::Node n;
    n["role"] = role_name(d.role);
    n["capability"] = d.capability;
    if (d.options && !d.options.IsNull()) n["options"] = d.options;
    if (!d.bindings.empty()) n["bindings"] = bindings_to_yaml(d.bindings);
    root["extensions"].push_back(n);
  }

  const auto& lc = plan.language_client;
  root["language_client"]["servers"] = lc.servers;
  root["language_client"]["debounce_text_changes_ms"] = lc.debounce_text_changes_ms;
  root["language_client"]["capability_provider"] = lc.capability_provider;
  root["language_client"]["diagnostics"] = diagnostics_to_yaml(lc.diagnostics);
  if (!lc.attach_bindings.empty())
    root["language_client"]["attach_bindings"] = bindings_to_yaml(lc.attach_bindings);

  if (!plan.bindings.empty()) root["bindings"] = bindings_to_yaml(plan.bindings);
  return root;
}

StartupPlan PlanIOService::load(const std::filesystem::path& yaml_path) const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(yaml_path.string());
  } catch (const std::exception& e) {
    throw LoaderError(LoaderErrc::Io, "Failed to load YAML file " +
                                          yaml_path.string() + ": " + e.what());
  }
  return from_yaml(root);
}

void PlanIOService::save(const StartupPlan& plan,
                         const std::filesystem::path& yaml_path) const {
  std::ofstream fout(yaml_path);
  if (!fout) {
    throw LoaderError(LoaderErrc::Io,
                      "Failed to open file for writing: " + yaml_path.string());
  }
  fout << to_yaml(plan);
}

}  // namespace ks
