// Keystrap kernel: Bootstrapper implementation
#include "kernel/bootstrap.hpp"

#include <cstdlib>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace ks {

namespace {

std::string shell_quote(const std::string& arg) {
#ifdef _WIN32
    return "\"" + arg + "\"";
#else
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    return out + "'";
#endif
}

}  // namespace

int run_system_command(const std::vector<std::string>& argv) {
    if (argv.empty()) return -1;
    std::string cmd;
    for (const auto& a : argv) {
        if (!cmd.empty()) cmd.push_back(' ');
        cmd += shell_quote(a);
    }
    int status = std::system(cmd.c_str());
#ifdef _WIN32
    return status;
#else
    if (status == -1) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif
}

Bootstrapper::Bootstrapper(Fetcher fetcher)
    : fetcher_(fetcher ? std::move(fetcher) : Fetcher(run_system_command)) {}

fs::path Bootstrapper::manager_path(const fs::path& data_dir, const ManagerSpec& spec) {
    return data_dir / "lazy" / spec.name;
}

std::vector<std::string> Bootstrapper::clone_command(const std::string& fetch_command,
                                                     const ManagerSpec& spec,
                                                     const fs::path& target) {
    return {fetch_command, "clone", "--filter=blob:none", spec.url,
            "--branch=" + spec.channel, target.string()};
}

BootstrapOutcome Bootstrapper::ensure(const fs::path& data_dir, const ManagerSpec& spec,
                                      const std::string& fetch_command) {
    BootstrapOutcome outcome;
    outcome.path = manager_path(data_dir, spec);

    std::error_code ec;
    if (fs::exists(outcome.path, ec)) return outcome;

    if (spec.url.empty())
        throw LoaderError(LoaderErrc::BootstrapFailed, "No source configured for manager '" + spec.name + "'");

    fs::create_directories(outcome.path.parent_path(), ec);
    if (ec) {
        throw LoaderError(LoaderErrc::BootstrapFailed,
                          "Cannot create " + outcome.path.parent_path().string() + ": " + ec.message());
    }

    outcome.command = clone_command(fetch_command, spec, outcome.path);
    ++attempts_;
    int status = fetcher_(outcome.command);
    if (status != 0) {
        throw LoaderError(LoaderErrc::BootstrapFailed,
                          "Fetching '" + spec.url + "' exited with status " + std::to_string(status));
    }
    if (!fs::exists(outcome.path, ec)) {
        throw LoaderError(LoaderErrc::BootstrapFailed,
                          "Fetch reported success but " + outcome.path.string() + " is missing");
    }
    outcome.fetched = true;
    return outcome;
}

} // namespace ks
