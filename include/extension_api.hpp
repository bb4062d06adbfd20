// FILE: include/extension_api.hpp
#pragma once

#include "kernel/capability_registry.hpp"
#include "ks_types.hpp"

/**
 * @brief The function signature that every Keystrap extension library must
 * implement and export.
 *
 * When the extension manager loads a shared library (a .so, .dylib or .dll
 * file), it looks up a function named "register_keystrap_extensions". If found,
 * it is called with the kernel's capability registry, and the library registers
 * one factory per capability it provides. The registry pointer is only valid
 * for the duration of the call.
 *
 * Use extern "C" to prevent C++ name mangling, which ensures that the
 * manager can find the function by its exact name.
 */
#ifdef _WIN32
#define EXTENSION_API __declspec(dllexport)
#else
#define EXTENSION_API __attribute__((visibility("default")))
#endif

#define KEYSTRAP_REGISTER_SYMBOL "register_keystrap_extensions"

extern "C" EXTENSION_API void register_keystrap_extensions(ks::CapabilityRegistry* registry);
