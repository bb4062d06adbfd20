#include "cli/cli_history.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <pwd.h>
#include <unistd.h>

namespace ks {

CliHistory::CliHistory() : history_file_path_(GetHistoryFilePath()) {
    Load();
}

std::filesystem::path CliHistory::GetHistoryFilePath() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) home = pw->pw_dir;
    }
    if (!home) return ".keystrap_history"; // fallback to current dir
    return std::filesystem::path(home) / ".keystrap_history";
}

void CliHistory::Load() {
    std::ifstream file(history_file_path_);
    if (!file) return;

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) history_.push_back(line);
    }
    Trim();
}

void CliHistory::Save() const {
    std::ofstream file(history_file_path_);
    if (!file) {
        std::cerr << "Warning: Could not save command history to " << history_file_path_ << std::endl;
        return;
    }
    for (const auto& line : history_) file << line << "\n";
}

void CliHistory::Add(const std::string& command) {
    if (command.empty()) return;
    // Consecutive duplicates are stored once.
    if (!history_.empty() && history_.back() == command) return;
    history_.push_back(command);
    Trim();
}

std::vector<std::string> CliHistory::Recent(size_t count) const {
    if (count >= history_.size()) return history_;
    return std::vector<std::string>(history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
}

void CliHistory::Trim() {
    if (max_size_ == 0) return; // 0 means infinite
    if (history_.size() > max_size_)
        history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(max_size_));
}

void CliHistory::SetMaxSize(size_t size) {
    max_size_ = size;
    Trim();
}

} // namespace ks
