// kiln

#include <catch2/catch_test_macros.hpp>

#include "kiln/code_builder.hh"
#include "kiln/string_builder.hh"

#include "leak_alloc.hh"

using namespace kiln;

TEST_CASE("String builder", "[text]")
{
    test::LeakTestAllocator alloc;
    knStringBuilder text(alloc);

    CHECK(text.empty());
    CHECK(text.view() == "");

    SECTION("Append and format")
    {
        text.append("Sprite");
        text.append('_');
        text.format("{:03}", 7);
        CHECK(text.view() == "Sprite_007");
        CHECK(text.size() == 10);
    }

    SECTION("Growth keeps contents")
    {
        for (int index = 0; index != 100; ++index)
            text.append("0123456789");
        CHECK(text.size() == 1000);
        CHECK(text.view().substr(990) == "0123456789");
    }

    SECTION("Self append")
    {
        text.append("abc");
        text.append(text.view());
        CHECK(text.view() == "abcabc");
    }

    SECTION("Move")
    {
        text.append("moved");
        knStringBuilder other(std::move(text));
        CHECK(other.view() == "moved");
        CHECK(text.empty());
    }
}

TEST_CASE("Code builder", "[text]")
{
    test::LeakTestAllocator alloc;
    knCodeBuilder code(alloc);

    SECTION("Scopes indent")
    {
        code.writeLine("class A");
        code.openScope();
        code.line("int {} = {};", "x", 1);
        code.writeLine();
        code.closeScope();

        CHECK(code.view() == "class A\n{\n    int x = 1;\n\n}\n");
    }

    SECTION("Comments")
    {
        code.openScope();
        code.writeComment("first\n\nsecond");
        code.writeComment("");
        code.closeScope();

        CHECK(code.view() == "{\n    // first\n    //\n    // second\n}\n");
    }

    SECTION("Clear")
    {
        code.openScope();
        code.clear();
        code.writeLine("x");

        CHECK(code.view() == "x\n");
        CHECK(code.indent() == 0);
    }
}
