#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dayinit {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        invalid_argument,
        file_not_found,
        anchor_not_found,
        io_failure,
        config_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::invalid_argument:
                return "invalid_argument"sv;
            case error_kind::file_not_found:
                return "file_not_found"sv;
            case error_kind::anchor_not_found:
                return "anchor_not_found"sv;
            case error_kind::io_failure:
                return "io_failure"sv;
            case error_kind::config_error:
                return "config_error"sv;
        }
        return "io_failure"sv;
    }

    // Usage errors exit with 2, everything that fails while touching the tree exits with 1
    inline constexpr int exit_code_for(error_kind kind) {
        switch (kind) {
            case error_kind::invalid_argument:
                return 2;
            case error_kind::file_not_found:
            case error_kind::anchor_not_found:
            case error_kind::io_failure:
            case error_kind::config_error:
                return 1;
        }
        return 1;
    }

    class scaffold_error : public std::runtime_error {
      public:
        scaffold_error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

}  // namespace dayinit
