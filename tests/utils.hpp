#pragma once

#include "dayinit.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <unistd.h>
}

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dayinit::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_file(const fs::path& path, std::string_view content) {
        fs::create_directories(path.parent_path());
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out);
        out << content;
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in);
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline constexpr std::string_view dispatch_source =
            "#![allow(dead_code)]\n"
            "\n"
            "mod helpers;\n"
            "\n"
            "use helpers::advent;\n"
            "\n"
            "advent! {\n"
            "    day 1\n"
            "    day 2\n"
            "}\n"
            "\n"
            "fn main() {\n"
            "    run()\n"
            "}\n";

    inline constexpr std::string_view template_source =
            "use std::fmt::Display;\n"
            "\n"
            "pub fn problem_1<I>(input_lines: I) -> impl Display\n"
            "where\n"
            "    I: Iterator<Item = String>,\n"
            "{\n"
            "    0\n"
            "}\n";

    // src/main.rs registering days 1 and 2, plus src/template.rs
    inline startup_config make_puzzle_tree(const temp_dir& temp) {
        write_file(temp.path / "src" / "main.rs", dispatch_source);
        write_file(temp.path / "src" / "template.rs", template_source);

        startup_config cfg{};
        cfg.root = temp.path;
        return cfg;
    }

    inline std::vector<std::string> entries_of(const fs::path& dispatch) {
        return read_text_lines(dispatch).lines;
    }
}  // namespace dayinit::test::detail
