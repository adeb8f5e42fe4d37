#include "processing/code_blocks.hpp"

#include <doctest.h>

using namespace fuzzpatch;

using Lines = std::vector<std::string>;

TEST_CASE("code_blocks") {
    SUBCASE("extract by language") {
        Lines response = {
            "Here is the updated code:",
            "```python",
            "def foo():",
            "    pass",
            "```",
            "And the patch:",
            "~~~diff",
            "@@ -1 +1 @@",
            "-a",
            "+b",
            "~~~",
            "````",
            "no language",
            "````",
        };
        auto blocks = extract_code_blocks(response);
        REQUIRE(blocks.size() == 3);
        REQUIRE(blocks[0].language == "python");
        REQUIRE(blocks[0].lines == Lines{"def foo():", "    pass"});
        REQUIRE(blocks[1].language == "diff");
        REQUIRE(blocks[1].lines.size() == 3);
        REQUIRE(blocks[2].language == "plaintext");

        const CodeBlock* diff = find_code_block(blocks, "diff");
        REQUIRE(diff != nullptr);
        REQUIRE(diff->lines[0] == "@@ -1 +1 @@");
        REQUIRE(find_code_block(blocks, "rust") == nullptr);
    }

    SUBCASE("fence must close with the same marker") {
        Lines response = {"````markdown", "```python", "x = 1", "```", "````"};
        auto blocks = extract_code_blocks(response);
        REQUIRE(blocks.size() == 1);
        REQUIRE(blocks[0].language == "markdown");
        REQUIRE(blocks[0].lines == Lines{"```python", "x = 1", "```"});
    }

    SUBCASE("unterminated block is dropped") {
        Lines response = {"```python", "x = 1"};
        REQUIRE(extract_code_blocks(response).empty());
    }

    SUBCASE("clean_code_block") {
        Lines backticks = {"```python", "def foo():", "    pass", "```"};
        REQUIRE(clean_code_block(backticks) == Lines{"def foo():", "    pass"});

        Lines tildes = {"~~~python", "def foo():", "    pass", "~~~"};
        REQUIRE(clean_code_block(tildes) == Lines{"def foo():", "    pass"});

        Lines plain = {"def foo():", "    pass"};
        REQUIRE(clean_code_block(plain) == plain);

        Lines blanks = {"line1", "", "", "", "line2"};
        REQUIRE(clean_code_block(blanks) == Lines{"line1", "", "", "line2"});

        Lines mixed = {"```", "code", "~~~"};
        REQUIRE(clean_code_block(mixed) == Lines{"code"});
    }

    SUBCASE("normalize_output") {
        Lines output = {"", "  ", "result: 42   ", "", "done\t", "", ""};
        REQUIRE(normalize_output(output) == Lines{"result: 42", "", "done"});

        Lines empty = {"", " "};
        REQUIRE(normalize_output(empty).empty());
    }

    SUBCASE("whole file from a response") {
        Lines response = {"Full file:", "```python", "", "def f():  ", "    return 1", "", "", "", "", "print(f())", "",
                          "```"};
        auto blocks = extract_code_blocks(response);
        REQUIRE(blocks.size() == 1);
        REQUIRE(code_block_file_lines(blocks[0]) ==
                Lines{"def f():", "    return 1", "", "", "print(f())"});
    }
}
