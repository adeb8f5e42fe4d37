#include "processing/diff_hunk.hpp"

#include <doctest.h>

using namespace fuzzpatch;

using Lines = std::vector<std::string>;

TEST_CASE("diff_hunk") {
    SUBCASE("simple replacement") {
        Lines body = {" context_before", "-old_line", "+new_line", " context_after"};
        Hunk hunk("@@ -5,3 +5,3 @@", body);

        REQUIRE(hunk.start_original == 5);
        REQUIRE(hunk.count_original == 3);
        REQUIRE(hunk.start_new == 5);
        REQUIRE(hunk.match_count() == 3);
        REQUIRE(hunk.replace_count() == 3);
        REQUIRE(hunk.match == Lines{"context_before", "old_line", "context_after"});
        REQUIRE(hunk.replace == Lines{"context_before", "new_line", "context_after"});
        REQUIRE_FALSE(hunk.filename.has_value());
    }

    SUBCASE("addition and deletion counts") {
        Lines addition = {" context", "+new_line", " more_context"};
        Hunk added("@@ -5,2 +5,3 @@", addition);
        REQUIRE(added.match_count() == 2);
        REQUIRE(added.replace_count() == 3);

        Lines deletion = {" context", "-deleted_line", " more_context"};
        Hunk deleted("@@ -5,3 +5,2 @@", deletion);
        REQUIRE(deleted.match_count() == 3);
        REQUIRE(deleted.replace_count() == 2);
    }

    SUBCASE("empty hunk") {
        Lines body;
        Hunk hunk("@@ -5,0 +5,0 @@", body);
        REQUIRE(hunk.empty());
        REQUIRE(hunk.replace_count() == 0);
    }

    SUBCASE("placeholder header") {
        Lines body = {"-old", "+new"};
        Hunk hunk("@@ ... @@", body);
        REQUIRE_FALSE(hunk.start_original.has_value());
        REQUIRE_FALSE(hunk.start_new.has_value());
        REQUIRE(hunk.match == Lines{"old"});
    }

    SUBCASE("context line without leading space") {
        Lines body = {"context_line", "-old", "+new"};
        Hunk hunk("@@ -1,2 +1,2 @@", body);
        REQUIRE(hunk.match == Lines{"context_line", "old"});
        REQUIRE(hunk.replace == Lines{"context_line", "new"});
    }

    SUBCASE("empty lines and no-newline markers") {
        Lines body = {" a", "", "-b", "+B", "\\ No newline at end of file", "", ""};
        Hunk hunk("@@ -1,3 +1,3 @@", body);
        REQUIRE(hunk.match == Lines{"a", "", "b"});
        REQUIRE(hunk.replace == Lines{"a", "", "B"});
    }

    SUBCASE("excessive context is trimmed") {
        Lines body = {" ctx1", " ctx2", " ctx3", " ctx4", " ctx5", "-old", "+new",
                      " ctx6", " ctx7", " ctx8", " ctx9", " ctx10"};
        Hunk hunk("@@ -1,11 +1,11 @@", body);
        REQUIRE(hunk.start_original == 3);
        REQUIRE(hunk.start_new == 3);
        REQUIRE(hunk.match == Lines{"ctx3", "ctx4", "ctx5", "old", "ctx6", "ctx7", "ctx8"});
        REQUIRE(hunk.replace == Lines{"ctx3", "ctx4", "ctx5", "new", "ctx6", "ctx7", "ctx8"});
    }

    SUBCASE("identical -/+ pairs count as context") {
        Lines body = {"-a", "+a", "-b", "+b", " c", " d", "-e", "+E"};
        Hunk hunk("@@ -1,5 +1,5 @@", body);
        // match: a b c d e, replace: a b c d E
        REQUIRE(hunk.match == Lines{"b", "c", "d", "e"});
        REQUIRE(hunk.replace == Lines{"b", "c", "d", "E"});
    }

    SUBCASE("pure context hunk keeps three lines") {
        Lines body = {" 1", " 2", " 3", " 4", " 5"};
        Hunk hunk("@@ -1,5 +1,5 @@", body);
        REQUIRE(hunk.match == Lines{"3", "4", "5"});
        REQUIRE(hunk.replace == Lines{"3", "4", "5"});
    }

    SUBCASE("absurd start lines are dropped") {
        Lines body = {" 1", " 2", " 3", " 4", " 5", "-6", "+six"};
        Hunk hunk("@@ -9223372036854775807,6 +9223372036854775807,6 @@", body);
        REQUIRE_FALSE(hunk.start_original.has_value());
        REQUIRE_FALSE(hunk.start_new.has_value());
        REQUIRE(hunk.match == Lines{"3", "4", "5", "6"});

        Lines code = {"1", "2", "3", "4", "5", "6"};
        REQUIRE(hunk.match_code(code, 0) == 2);
    }

    SUBCASE("matches_code") {
        Lines body = {"-old_line", "+new_line"};
        Hunk hunk("@@ -1,1 +1,1 @@", body);

        Lines code = {"old_line", "other"};
        REQUIRE(hunk.matches_code(code, 0, 0));
        REQUIRE_FALSE(hunk.matches_code(code, 1, 0));
        REQUIRE_FALSE(hunk.matches_code(code, 2, 0));
        REQUIRE_FALSE(hunk.matches_code(code, -1, 0));
    }

    SUBCASE("matches_code with comment fuzziness") {
        Lines body = {"-code_line"};
        Hunk hunk("@@ -1,1 +1,1 @@", body);

        Lines code = {"code_line  # with comment"};
        REQUIRE_FALSE(hunk.matches_code(code, 0, 0));
        REQUIRE(hunk.matches_code(code, 0, 1));

        MatchOptions slashes;
        slashes.fuzziness = 1;
        slashes.comment_markers = {"//"};
        REQUIRE_FALSE(hunk.matches_code(code, 0, slashes));
    }

    SUBCASE("match_code finds the location") {
        Lines body = {"-line2", "-line3"};
        Hunk hunk("@@ -1,2 +1,2 @@", body);

        Lines code = {"line1", "line2", "line3", "line4"};
        REQUIRE(hunk.match_code(code, 0) == 1);

        Lines missing = {"line1", "line4"};
        REQUIRE_FALSE(hunk.match_code(missing, 0).has_value());

        Lines shorter = {"line2"};
        REQUIRE_FALSE(hunk.match_code(shorter, 0).has_value());
    }

    SUBCASE("match_code prefers the occurrence nearest the declared line") {
        Lines body = {"-x"};
        Hunk hunk("@@ -6,1 +6,1 @@", body);

        Lines code = {"x", "a", "b", "c", "d", "e", "f", "x", "g"};
        // Declared line 6 is index 5; index 7 is closer than index 0.
        REQUIRE(hunk.match_code(code, 0) == 7);

        MatchOptions exact;
        REQUIRE(hunk.match_code(code, 1, exact) == 0);
    }

    SUBCASE("match_code searches from the start without a declared line") {
        Lines body = {"-x"};
        Hunk hunk("@@ ... @@", body);

        Lines code = {"a", "x", "b", "x"};
        REQUIRE(hunk.match_code(code, 0) == 1);
    }

    SUBCASE("repr") {
        Lines body = {"-a", "+b"};
        Hunk hunk("@@ -2,1 +2,1 @@", body);
        hunk.filename = "main.py";
        REQUIRE(repr(hunk) == "Hunk(file=main.py, start_original=2, start_new=2, match_count=1, replace_count=1)");
    }
}
