#include "utils.hpp"

namespace dayinit::test {
    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    TEST_CASE("004: day paths follow the layout", "[004][scaffold]") {
        startup_config cfg{};

        auto paths = make_day_paths(cfg, 7);
        CHECK(paths.input == fs::path{"input/day_7.txt"});
        CHECK(paths.example_input == fs::path{"input/day_7_example.txt"});
        CHECK(paths.empty_input == fs::path{"input/empty.txt"});
        CHECK(paths.template_source == fs::path{"src/template.rs"});
        CHECK(paths.day_source == fs::path{"src/day_7.rs"});
        CHECK(paths.dispatch == fs::path{"src/main.rs"});

        cfg.root = "/puzzles";
        cfg.input_dir = "data";
        cfg.src_dir = "lib";
        cfg.template_file = "skeleton.cpp";
        cfg.dispatch_file = "days.cpp";
        cfg.source_extension = ".cpp";
        auto custom = make_day_paths(cfg, 12);
        CHECK(custom.input == fs::path{"/puzzles/data/day_12.txt"});
        CHECK(custom.day_source == fs::path{"/puzzles/lib/day_12.cpp"});
        CHECK(custom.template_source == fs::path{"/puzzles/lib/skeleton.cpp"});
        CHECK(custom.dispatch == fs::path{"/puzzles/lib/days.cpp"});
    }

    TEST_CASE("004: scaffold_day creates inputs, source and dispatch entry", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_day"};
        auto cfg = detail::make_puzzle_tree(temp);

        auto report = scaffold_day(cfg, 3);
        CHECK(report.day == 3);
        CHECK_FALSE(report.dry_run);
        CHECK(report.anchor == "day 2");
        CHECK(report.entry == "    day 3");
        CHECK(report.anchor_line == 9U);
        CHECK(report.dispatch_line_count == 15U);

        CHECK(fs::is_regular_file(temp.path / "input" / "day_3.txt"));
        CHECK(fs::file_size(temp.path / "input" / "day_3.txt") == 0U);
        CHECK(fs::is_regular_file(temp.path / "input" / "day_3_example.txt"));
        CHECK(fs::file_size(temp.path / "input" / "day_3_example.txt") == 0U);
        CHECK(fs::is_regular_file(temp.path / "input" / "empty.txt"));
        CHECK(detail::read_file(temp.path / "src" / "day_3.rs") == detail::template_source);

        auto entries = detail::entries_of(temp.path / "src" / "main.rs");
        CHECK(registered_days(entries) == std::vector<int>{1, 2, 3});
        REQUIRE(entries.size() == 15U);
        CHECK(entries[8] == "    day 2");
        CHECK(entries[9] == "    day 3");
        CHECK(entries[10] == "}");

        REQUIRE(report.steps.size() == 5U);
        CHECK(report.steps[0].action == file_action::created);
        CHECK(report.steps[1].action == file_action::created);
        CHECK(report.steps[2].action == file_action::created);
        CHECK(report.steps[3].action == file_action::copied);
        REQUIRE(report.steps[3].source);
        CHECK(*report.steps[3].source == (temp.path / "src" / "template.rs").lexically_normal());
        CHECK(report.steps[4].action == file_action::registered);
    }

    TEST_CASE("004: existing input files are left unchanged", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_keep_inputs"};
        auto cfg = detail::make_puzzle_tree(temp);
        detail::write_file(temp.path / "input" / "day_7.txt", "1000\n2000\n");
        detail::write_file(temp.path / "src" / "main.rs", "advent! {\n    day 6\n}\n");

        auto report = scaffold_day(cfg, 7);
        CHECK(report.steps[0].action == file_action::kept);
        CHECK(report.steps[1].action == file_action::created);
        CHECK(detail::read_file(temp.path / "input" / "day_7.txt") == "1000\n2000\n");
        CHECK(detail::read_file(temp.path / "input" / "day_7_example.txt").empty());
    }

    TEST_CASE("004: template copy overwrites an existing day source", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_overwrite"};
        auto cfg = detail::make_puzzle_tree(temp);
        detail::write_file(temp.path / "src" / "day_3.rs", "// solved already\n");

        auto report = scaffold_day(cfg, 3);
        CHECK(report.steps[3].action == file_action::overwritten);
        CHECK(detail::read_file(temp.path / "src" / "day_3.rs") == detail::template_source);
    }

    TEST_CASE("004: missing previous day fails after creating files", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_missing_anchor"};
        auto cfg = detail::make_puzzle_tree(temp);

        try {
            (void)scaffold_day(cfg, 5);
            FAIL("expected anchor_not_found");
        } catch (const scaffold_error& e) {
            CHECK(e.kind() == error_kind::anchor_not_found);
            CHECK(std::string{e.what()}.find("day 4") != std::string::npos);
        }

        CHECK(detail::read_file(temp.path / "src" / "main.rs") == detail::dispatch_source);
        // steps before the splice are not rolled back
        CHECK(fs::exists(temp.path / "input" / "day_5.txt"));
        CHECK(fs::exists(temp.path / "src" / "day_5.rs"));
    }

    TEST_CASE("004: missing template fails before touching the dispatch file", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_missing_template"};
        auto cfg = detail::make_puzzle_tree(temp);
        fs::remove(temp.path / "src" / "template.rs");

        try {
            (void)scaffold_day(cfg, 3);
            FAIL("expected file_not_found");
        } catch (const scaffold_error& e) {
            CHECK(e.kind() == error_kind::file_not_found);
            CHECK(std::string{e.what()}.find("template.rs") != std::string::npos);
        }

        CHECK_FALSE(fs::exists(temp.path / "src" / "day_3.rs"));
        CHECK(detail::read_file(temp.path / "src" / "main.rs") == detail::dispatch_source);
    }

    TEST_CASE("004: invalid day is rejected before any effect", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_invalid_day"};
        auto cfg = detail::make_puzzle_tree(temp);

        try {
            (void)scaffold_day(cfg, 0);
            FAIL("expected invalid_argument");
        } catch (const scaffold_error& e) {
            CHECK(e.kind() == error_kind::invalid_argument);
        }
        CHECK_FALSE(fs::exists(temp.path / "input"));
    }

    TEST_CASE("004: anchor override registers the first day", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_first_day"};
        auto cfg = detail::make_puzzle_tree(temp);
        detail::write_file(temp.path / "src" / "main.rs", "advent! {\n}\n");

        try {
            (void)scaffold_day(cfg, 1);
            FAIL("expected anchor_not_found for day 0");
        } catch (const scaffold_error& e) {
            CHECK(e.kind() == error_kind::anchor_not_found);
        }

        cfg.anchor_override = "advent! {";
        auto report = scaffold_day(cfg, 1);
        CHECK(report.anchor_line == 1U);
        CHECK(detail::read_file(temp.path / "src" / "main.rs") == "advent! {\n    day 1\n}\n");
    }

    TEST_CASE("004: running twice duplicates the registration", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_twice"};
        auto cfg = detail::make_puzzle_tree(temp);

        (void)scaffold_day(cfg, 3);
        (void)scaffold_day(cfg, 3);
        CHECK(registered_days(detail::entries_of(temp.path / "src" / "main.rs")) == std::vector<int>{1, 2, 3, 3});
    }

    TEST_CASE("004: dry run leaves the tree untouched", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_dry_run"};
        auto cfg = detail::make_puzzle_tree(temp);
        cfg.dry_run = true;

        auto report = scaffold_day(cfg, 3);
        CHECK(report.dry_run);
        CHECK(report.anchor_line == 9U);
        REQUIRE(report.steps.size() == 5U);
        CHECK(report.steps[0].action == file_action::created);
        CHECK(report.steps[3].action == file_action::copied);

        CHECK_FALSE(fs::exists(temp.path / "input"));
        CHECK_FALSE(fs::exists(temp.path / "src" / "day_3.rs"));
        CHECK(detail::read_file(temp.path / "src" / "main.rs") == detail::dispatch_source);

        cfg.anchor_override = "day 9";
        CHECK_THROWS_AS(scaffold_day(cfg, 3), scaffold_error);
    }

    TEST_CASE("004: empty input can be skipped", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_no_empty"};
        auto cfg = detail::make_puzzle_tree(temp);
        cfg.create_empty_input = false;

        auto report = scaffold_day(cfg, 3);
        CHECK(report.steps.size() == 4U);
        CHECK_FALSE(fs::exists(temp.path / "input" / "empty.txt"));
    }

    TEST_CASE("004: registered days of the configured dispatch file", "[004][scaffold][fs]") {
        detail::temp_dir temp{"dayinit_scaffold_registry"};
        auto cfg = detail::make_puzzle_tree(temp);

        CHECK(list_registered_days(cfg) == std::vector<int>{1, 2});
        CHECK(next_unregistered_day(cfg) == 3);

        (void)scaffold_day(cfg, next_unregistered_day(cfg));
        CHECK(next_unregistered_day(cfg) == 4);
    }
}  // namespace dayinit::test
