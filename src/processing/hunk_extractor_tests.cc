#include "processing/hunk_extractor.hpp"

#include <doctest.h>

using namespace fuzzpatch;

using Lines = std::vector<std::string>;

TEST_CASE("hunk_extractor") {
    SUBCASE("single hunk with file markers") {
        Lines patch = {"--- a/file.py", "+++ b/file.py", "@@ -1,2 +1,2 @@", " context", "-old", "+new"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].match_count() == 2);
        REQUIRE(hunks[0].filename == std::string("file.py"));
        REQUIRE_FALSE(hunks[0].is_new_file);
        REQUIRE_FALSE(hunks[0].is_deleted_file);
    }

    SUBCASE("multiple hunks") {
        Lines patch = {"@@ -1,2 +1,2 @@", "-old1", "+new1", "@@ -10,2 +10,2 @@", "-old2", "+new2"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 2);
        REQUIRE(hunks[1].start_original == 10);
        REQUIRE_FALSE(hunks[0].filename.has_value());
        REQUIRE_FALSE(hunks[1].filename.has_value());
    }

    SUBCASE("removed SQL comment stays in the body") {
        Lines patch = {"--- a/q.sql", "+++ b/q.sql", "@@ -1,3 +1,2 @@", " SELECT 1;", "--- old comment",
                       " SELECT 2;", "@@ -10,1 +9,1 @@", "-x", "+y"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 2);
        REQUIRE(hunks[0].match == Lines{"SELECT 1;", "-- old comment", "SELECT 2;"});
        REQUIRE(hunks[0].replace == Lines{"SELECT 1;", "SELECT 2;"});
        REQUIRE(hunks[1].filename == std::string("q.sql"));
    }

    SUBCASE("changed SQL comment stays in the body") {
        Lines patch = {"@@ -1,2 +1,2 @@", "--- old", "+++ new", " SELECT 1;"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].match == Lines{"-- old", "SELECT 1;"});
        REQUIRE(hunks[0].replace == Lines{"++ new", "SELECT 1;"});
        REQUIRE_FALSE(hunks[0].filename.has_value());
    }

    SUBCASE("lone --- in a hunk is a removed line") {
        Lines patch = {"@@ -1,2 +1,1 @@", "-old", "---"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].match == Lines{"old", "--"});
    }

    SUBCASE("deleted file header after a hunk") {
        Lines patch = {"--- a/x.py", "+++ b/x.py", "@@ -1 +1 @@", "-a", "+b", "--- a/gone.py", "+++ /dev/null"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 2);
        REQUIRE(hunks[0].match == Lines{"a"});
        REQUIRE(hunks[1].filename == std::string("gone.py"));
        REQUIRE(hunks[1].is_deleted_file);
    }

    SUBCASE("several files") {
        Lines patch = {
            "Here is the fix:",
            "--- a/src/one.py\t2024-01-01 10:00:00",
            "+++ b/src/one.py\t2024-01-01 10:05:00",
            "@@ -1 +1 @@",
            "-a",
            "+b",
            "--- two.py",
            "+++ two.py",
            "@@ -3,1 +3,1 @@",
            "-c",
            "+d",
        };
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 2);
        REQUIRE(hunks[0].filename == std::string("src/one.py"));
        REQUIRE(hunks[1].filename == std::string("two.py"));
        REQUIRE(hunks[0].match == Lines{"a"});
    }

    SUBCASE("--- without +++ names the file") {
        Lines patch = {"--- a/only_old.py", "@@ -1 +1 @@", "-x", "+y"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].filename == std::string("only_old.py"));
    }

    SUBCASE("new file") {
        Lines patch = {"--- /dev/null", "+++ b/pkg/new.py", "@@ -0,0 +1,2 @@", "+line one", "+line two"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].is_new_file);
        REQUIRE(hunks[0].filename == std::string("pkg/new.py"));
        REQUIRE(hunks[0].match.empty());
        REQUIRE(hunks[0].replace == Lines{"line one", "line two"});
    }

    SUBCASE("new empty file without hunks") {
        Lines patch = {"--- /dev/null", "+++ b/empty.txt", "--- a/other.py", "+++ b/other.py", "@@ -1 +1 @@",
                       "-p", "+q"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 2);
        REQUIRE(hunks[0].filename == std::string("empty.txt"));
        REQUIRE(hunks[0].is_new_file);
        REQUIRE(hunks[0].match_count() == 0);
        REQUIRE(hunks[0].replace_count() == 0);
        REQUIRE(hunks[1].filename == std::string("other.py"));
        REQUIRE_FALSE(hunks[1].is_new_file);
    }

    SUBCASE("new empty file at end of input") {
        Lines patch = {"--- /dev/null", "+++ b/empty.txt"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].is_new_file);
    }

    SUBCASE("deleted file") {
        Lines patch = {"--- a/gone.py", "+++ /dev/null", "@@ -1,2 +0,0 @@", "-a", "-b"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].is_deleted_file);
        REQUIRE(hunks[0].filename == std::string("gone.py"));
        REQUIRE(hunks[0].match == Lines{"a", "b"});
    }

    SUBCASE("git headers") {
        Lines patch = {
            "diff --git a/empty.cfg b/empty.cfg",
            "new file mode 100644",
            "index 0000000..e69de29",
            "diff --git a/x.py b/x.py",
            "index 83db48f..bf269f4 100644",
            "--- a/x.py",
            "+++ b/x.py",
            "@@ -1,1 +1,1 @@",
            "-1",
            "+2",
        };
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 2);
        REQUIRE(hunks[0].filename == std::string("empty.cfg"));
        REQUIRE(hunks[0].is_new_file);
        REQUIRE(hunks[1].filename == std::string("x.py"));
        REQUIRE(hunks[1].replace == Lines{"2"});
    }

    SUBCASE("removed line starting with dashes stays in the body") {
        Lines patch = {"@@ -1,2 +1,1 @@", " keep", "----- separator"};
        auto hunks = extract_hunks(patch);
        REQUIRE(hunks.size() == 1);
        REQUIRE(hunks[0].match == Lines{"keep", "---- separator"});
    }

    SUBCASE("parse_marker_path") {
        REQUIRE(parse_marker_path("--- a/x/y.py").path == std::string("x/y.py"));
        REQUIRE(parse_marker_path("+++ b/x/y.py\t(revision 12)").path == std::string("x/y.py"));
        REQUIRE(parse_marker_path("+++  spaced.py  ").path == std::string("spaced.py"));
        REQUIRE(parse_marker_path("--- /dev/null").is_null_device);
        REQUIRE_FALSE(parse_marker_path("---").path.has_value());
        REQUIRE_FALSE(parse_marker_path("--- ").path.has_value());
    }

    SUBCASE("state names") {
        REQUIRE(to_string(ExtractorState::kSeeking) == "seeking");
        REQUIRE(to_string(ExtractorState::kInFileHeader) == "in file header");
        REQUIRE(to_string(ExtractorState::kInHunk) == "in hunk");
    }

    SUBCASE("no hunks") {
        Lines text = {"nothing to see here"};
        REQUIRE(extract_hunks(text).empty());
    }
}
