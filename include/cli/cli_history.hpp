#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace ks {

// Line history of the REPL, persisted to ~/.keystrap_history.
class CliHistory {
public:
    CliHistory();

    void Load();
    void Save() const;
    void Add(const std::string& command);

    // The last `count` entries, oldest first.
    std::vector<std::string> Recent(size_t count) const;

    void SetMaxSize(size_t size);

    // Expose the resolved history file path for UI/diagnostics.
    const std::filesystem::path& Path() const { return history_file_path_; }

private:
    static std::filesystem::path GetHistoryFilePath();
    void Trim();

    std::vector<std::string> history_;
    size_t max_size_ = 1000;
    std::filesystem::path history_file_path_;
};

} // namespace ks
