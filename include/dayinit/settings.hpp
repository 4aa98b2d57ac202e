#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>

namespace dayinit {

    inline constexpr int settings_schema_version = 1;

    // Explicit --config path, else <root>/dayinit.json when it exists
    std::optional<std::filesystem::path> find_settings_file(const startup_config& cfg);

    /*
     * Applies the layout keys present in a JSON settings file onto `cfg`.
     * Unknown keys are ignored; a schema_version newer than settings_schema_version is rejected.
     * Throws scaffold_error: file_not_found, config_error.
     */
    void apply_settings_file(const std::filesystem::path& path, startup_config& cfg);

    // Persists the layout part of `cfg`; throws scaffold_error(io_failure)
    void write_settings_file(const startup_config& cfg, const std::filesystem::path& path);

}  // namespace dayinit
