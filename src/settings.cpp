#include "dayinit/settings.hpp"

#include "dayinit/error.hpp"
#include "dayinit/format.hpp"
#include "dayinit/splice.hpp"

#include <glaze/glaze.hpp>

#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace dayinit::literals;

namespace dayinit::detail {

    struct persisted_settings {
        int schema_version{settings_schema_version};
        std::optional<std::string> input_dir{};
        std::optional<std::string> src_dir{};
        std::optional<std::string> template_file{};
        std::optional<std::string> dispatch{};
        std::optional<std::string> source_extension{};
        std::optional<std::string> entry_indent{};
        std::optional<bool> create_empty_input{};
    };

}  // namespace dayinit::detail

namespace glz {

    template <>
    struct meta<dayinit::detail::persisted_settings> {
        using T = dayinit::detail::persisted_settings;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "input_dir",
                       &T::input_dir,
                       "src_dir",
                       &T::src_dir,
                       "template",
                       &T::template_file,
                       "dispatch",
                       &T::dispatch,
                       "source_extension",
                       &T::source_extension,
                       "entry_indent",
                       &T::entry_indent,
                       "create_empty_input",
                       &T::create_empty_input);
    };

}  // namespace glz

namespace dayinit {

    namespace detail {

        static persisted_settings make_persisted_settings(const startup_config& cfg) {
            persisted_settings data{};
            data.input_dir = cfg.input_dir.string();
            data.src_dir = cfg.src_dir.string();
            data.template_file = cfg.template_file.string();
            data.dispatch = cfg.dispatch_file.string();
            data.source_extension = cfg.source_extension;
            data.entry_indent = cfg.entry_indent;
            data.create_empty_input = cfg.create_empty_input;
            return data;
        }

    }  // namespace detail

    std::optional<fs::path> find_settings_file(const startup_config& cfg) {
        if (cfg.config_file) {
            return cfg.config_file;
        }
        auto candidate = cfg.root / default_settings_file;
        std::error_code ec{};
        if (fs::is_regular_file(candidate, ec) && !ec) {
            return candidate.lexically_normal();
        }
        return std::nullopt;
    }

    void apply_settings_file(const fs::path& path, startup_config& cfg) {
        auto json = read_text_file(path);

        detail::persisted_settings data{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, json);
        if (ec) {
            throw scaffold_error{error_kind::config_error, "failed to parse json file {}"_format(path.string())};
        }
        if (data.schema_version > settings_schema_version) {
            throw scaffold_error{
                    error_kind::config_error,
                    "unsupported schema_version in {}: {} > {}"_format(
                            path.string(), data.schema_version, settings_schema_version)};
        }

        if (data.input_dir) {
            cfg.input_dir = *data.input_dir;
        }
        if (data.src_dir) {
            cfg.src_dir = *data.src_dir;
        }
        if (data.template_file) {
            cfg.template_file = *data.template_file;
        }
        if (data.dispatch) {
            cfg.dispatch_file = *data.dispatch;
        }
        if (data.source_extension) {
            cfg.source_extension = *data.source_extension;
        }
        if (data.entry_indent) {
            cfg.entry_indent = *data.entry_indent;
        }
        if (data.create_empty_input) {
            cfg.create_empty_input = *data.create_empty_input;
        }
    }

    void write_settings_file(const startup_config& cfg, const fs::path& path) {
        std::string json{};
        auto ec = glz::write<glz::opts{.prettify = true}>(detail::make_persisted_settings(cfg), json);
        if (ec) {
            throw scaffold_error{error_kind::io_failure, "failed to serialize json for {}"_format(path.string())};
        }

        text_lines text{};
        text.lines.push_back(std::move(json));
        write_text_lines_atomic(path, text);
    }

}  // namespace dayinit
