// Implementation of extension library loading
#include "extension_loader.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <vector>
#include <map>

#include "extension_api.hpp"
#include "ks_types.hpp"

#ifdef _WIN32
  #include <windows.h>
#else
  #include <dlfcn.h>
#endif

namespace ks {

ExtensionLoadResult load_extensions(const std::vector<std::string>& dir_patterns,
                                    CapabilityRegistry& registry,
                                    std::map<std::string, std::string>& sources) {
    ExtensionLoadResult result;
    using RegisterFunc = void (*)(CapabilityRegistry*);

    auto iter_and_load = [&](const fs::path& base_dir, bool recursive) {
        std::error_code ec;
        if (!fs::exists(base_dir, ec) || !fs::is_directory(base_dir, ec)) {
            result.missing_dirs.push_back(base_dir.string());
            return;
        }

        auto process_path = [&](const fs::path& path) {
            #if defined(_WIN32)
                const std::string extension = ".dll";
            #elif defined(__APPLE__)
                const std::string extension = ".dylib";
            #else
                const std::string extension = ".so";
            #endif
            if (path.extension() != extension) return; // skip non-shared libraries

            const std::string abs_path = fs::absolute(path).string();
            ++result.attempted;
            auto keys_before = registry.get_keys();

            #ifdef _WIN32
            HMODULE handle = LoadLibrary(path.string().c_str());
            if (!handle) { result.errors.push_back({abs_path, LoaderErrc::Io, "LoadLibrary failed"}); return; }
            RegisterFunc register_func = (RegisterFunc)GetProcAddress(handle, KEYSTRAP_REGISTER_SYMBOL);
            if (!register_func) { result.errors.push_back({abs_path, LoaderErrc::MissingCapability, "Missing " KEYSTRAP_REGISTER_SYMBOL}); FreeLibrary(handle); return; }
            #else
            void* handle = dlopen(path.c_str(), RTLD_LAZY);
            if (!handle) { const char* e = dlerror(); result.errors.push_back({abs_path, LoaderErrc::Io, e?e:"dlopen failed"}); return; }
            dlerror();
            RegisterFunc register_func = nullptr;
            *(void**)(&register_func) = dlsym(handle, KEYSTRAP_REGISTER_SYMBOL);
            const char* dlsym_error = dlerror();
            if (dlsym_error || !register_func) { result.errors.push_back({abs_path, LoaderErrc::MissingCapability, dlsym_error?dlsym_error:"null " KEYSTRAP_REGISTER_SYMBOL}); dlclose(handle); return; }
            #endif

            std::vector<std::string> new_keys;
            try {
                register_func(&registry);
                auto keys_after = registry.get_keys();
                std::set_difference(keys_after.begin(), keys_after.end(), keys_before.begin(), keys_before.end(), std::back_inserter(new_keys));
                for (const auto& key : new_keys) { sources[key] = abs_path; }
                result.new_capabilities.insert(result.new_capabilities.end(), new_keys.begin(), new_keys.end());
                ++result.loaded;
            } catch (const std::exception& e) {
                result.errors.push_back({abs_path, LoaderErrc::SetupFailed, e.what()});
                // Factories point into the library; drop them before closing it.
                auto keys_after = registry.get_keys();
                std::set_difference(keys_after.begin(), keys_after.end(), keys_before.begin(), keys_before.end(), std::back_inserter(new_keys));
                for (const auto& key : new_keys) registry.unregister(key);
                #ifdef _WIN32
                FreeLibrary(handle);
                #else
                dlclose(handle);
                #endif
            }
        };

        try {
            if (recursive) {
                for (const auto& entry : fs::recursive_directory_iterator(base_dir)) {
                    if (entry.is_regular_file()) process_path(entry.path());
                }
            } else {
                for (const auto& entry : fs::directory_iterator(base_dir)) {
                    if (entry.is_regular_file()) process_path(entry.path());
                }
            }
        } catch (const fs::filesystem_error& e) {
            result.errors.push_back({base_dir.string(), LoaderErrc::Io, e.what()});
        }
    };

    for (const auto& raw_path : dir_patterns) {
        if (raw_path.empty()) continue;
        // Interpret simple wildcard suffixes:
        //   path/**  => recursive
        //   path/*   => shallow (explicit)
        //   path     => shallow
        bool recursive = false;
        std::string path_str = raw_path;
        if (path_str.size() >= 3 && path_str.substr(path_str.size() - 3) == "/**") {
            recursive = true;
            path_str = path_str.substr(0, path_str.size() - 3);
        } else if (path_str.size() >= 2 && path_str.substr(path_str.size() - 2) == "/*") {
            recursive = false;
            path_str = path_str.substr(0, path_str.size() - 2);
        }
        iter_and_load(path_str, recursive);
    }
    return result;
}

} // namespace ks
