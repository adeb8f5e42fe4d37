#include "processing/diff_classifier.hpp"

#include <doctest.h>

#include <vector>

using namespace fuzzpatch;

TEST_CASE("diff_classifier") {
    SUBCASE("counted headers") {
        std::vector<std::string> patch = {
            "--- a/file.py",
            "+++ b/file.py",
            "@@ -1,3 +1,3 @@",
            " line1",
            "-line2",
            "+line2_modified",
            " line3",
        };
        REQUIRE(is_unified_diff(patch));
        REQUIRE_FALSE(is_unified_diff_no_counts(patch));
    }

    SUBCASE("placeholder headers") {
        std::vector<std::string> patch = {"@@ ... @@", "-old line", "+new line"};
        REQUIRE(is_unified_diff(patch));
        REQUIRE(is_unified_diff_no_counts(patch));

        std::vector<std::string> bare = {"@@ @@"};
        REQUIRE(is_unified_diff_no_counts(bare));
    }

    SUBCASE("plain text and empty input") {
        std::vector<std::string> text = {"just some text", "without diff headers"};
        REQUIRE_FALSE(is_unified_diff(text));
        REQUIRE_FALSE(is_unified_diff_no_counts(text));

        std::vector<std::string> empty;
        REQUIRE_FALSE(is_unified_diff(empty));
        REQUIRE_FALSE(is_unified_diff_no_counts(empty));
    }

    SUBCASE("parse_hunk_header") {
        auto full = parse_hunk_header("@@ -12,4 +13,5 @@");
        REQUIRE(full.has_value());
        REQUIRE(full->start_original == 12);
        REQUIRE(full->count_original == 4);
        REQUIRE(full->start_new == 13);
        REQUIRE(full->count_new == 5);

        auto abbreviated = parse_hunk_header("@@ -3 +3 @@");
        REQUIRE(abbreviated.has_value());
        REQUIRE(abbreviated->start_original == 3);
        REQUIRE_FALSE(abbreviated->count_original.has_value());
        REQUIRE_FALSE(abbreviated->count_new.has_value());

        auto git = parse_hunk_header("@@ -7,6 +7,8 @@ def area(radius):");
        REQUIRE(git.has_value());
        REQUIRE(git->start_new == 7);
        REQUIRE(git->count_new == 8);

        REQUIRE_FALSE(parse_hunk_header("@@ ... @@").has_value());
        REQUIRE_FALSE(parse_hunk_header(" @@ -1,1 +1,1 @@").has_value());
        REQUIRE_FALSE(parse_hunk_header("@@ -1,1 @@").has_value());

        REQUIRE_FALSE(parse_hunk_header("@@ -9223372036854775807,6 +9223372036854775807,6 @@").has_value());
        REQUIRE_FALSE(parse_hunk_header("@@ -1,99999999999 +1,2 @@").has_value());
        REQUIRE(parse_hunk_header("@@ -2147483647,1 +2147483647,1 @@").has_value());
        std::vector<std::string> huge = {"@@ -99999999999999999999,1 +1,1 @@", "-a", "+b"};
        REQUIRE(is_unified_diff(huge));
    }

    SUBCASE("placeholder detection") {
        REQUIRE(is_placeholder_hunk_header("@@ ... @@"));
        REQUIRE(is_placeholder_hunk_header("@@ ... @@ class Foo:"));
        REQUIRE_FALSE(is_placeholder_hunk_header("@@ -1 +1 @@"));
        REQUIRE_FALSE(is_placeholder_hunk_header("@@ no closing marker"));
        REQUIRE_FALSE(is_placeholder_hunk_header("# @@ ... @@"));
    }
}
