// Keystrap kernel: one-time extension manager bootstrap
#pragma once

#include <functional>
#include <string>
#include <vector>

#include "kernel/startup_plan.hpp"
#include "ks_types.hpp"

namespace ks {

struct BootstrapOutcome {
    fs::path path;
    bool fetched = false;  // false: the manager was already present
    std::vector<std::string> command;
};

class KEYSTRAP_API Bootstrapper {
public:
    // Runs a command given as argv and returns its exit status.
    using Fetcher = std::function<int(const std::vector<std::string>&)>;

    explicit Bootstrapper(Fetcher fetcher = {});

    static fs::path manager_path(const fs::path& data_dir, const ManagerSpec& spec);
    static std::vector<std::string> clone_command(const std::string& fetch_command,
                                                  const ManagerSpec& spec,
                                                  const fs::path& target);

    // Fetches the manager when `manager_path` does not exist. Throws
    // LoaderError(BootstrapFailed) when the fetch fails or leaves no
    // directory behind. Never retries.
    BootstrapOutcome ensure(const fs::path& data_dir, const ManagerSpec& spec,
                            const std::string& fetch_command = "git");

    int attempts() const { return attempts_; }

private:
    Fetcher fetcher_;
    int attempts_ = 0;
};

// Default fetcher: quotes argv for the shell and runs it with std::system.
int run_system_command(const std::vector<std::string>& argv);

} // namespace ks
