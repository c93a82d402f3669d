/*
 * test_script_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/interpreter/script_adapter.hpp"

using namespace warden::sandbox::interpreter;

TEST(ScriptAdapterTest, Declarations) {
    EXPECT_EQ(ScriptAdapter::adapt("val x = 1;"), "x = 1");
    EXPECT_EQ(ScriptAdapter::adapt("var count = 2"), "count = 2");
    EXPECT_EQ(ScriptAdapter::adapt("value = 3"), "value = 3");
}

TEST(ScriptAdapterTest, PrintlnAndLiterals) {
    EXPECT_EQ(ScriptAdapter::adapt("println(x)"), "print(x)");
    EXPECT_EQ(ScriptAdapter::adapt("flag = true or null"), "flag = True or None");
    EXPECT_EQ(ScriptAdapter::adapt("is_true = false"), "is_true = False");
}

TEST(ScriptAdapterTest, LineComments) {
    EXPECT_EQ(ScriptAdapter::adapt("// build step"), "# build step");
    EXPECT_EQ(ScriptAdapter::adapt("    // nested"), "    # nested");
    EXPECT_EQ(ScriptAdapter::adapt("x = 1  # keep true;"), "x = 1  # keep true;");
}

TEST(ScriptAdapterTest, StringsAreUntouched) {
    EXPECT_EQ(ScriptAdapter::adapt("println(\"true; // not a comment\")"),
              "print(\"true; // not a comment\")");
    EXPECT_EQ(ScriptAdapter::adapt("s = 'it\\'s null'"), "s = 'it\\'s null'");
}

TEST(ScriptAdapterTest, TripleQuotedSpansLines) {
    const std::string source = "s = \"\"\"\ntrue;\n\"\"\"\nok = true";
    EXPECT_EQ(ScriptAdapter::adapt(source), "s = \"\"\"\ntrue;\n\"\"\"\nok = True");
}

TEST(ScriptAdapterTest, IndentationAndMultipleLines) {
    const std::string source = "if ready:\n    var y = 2;\n    println(y)\n";
    EXPECT_EQ(ScriptAdapter::adapt(source), "if ready:\n    y = 2\n    print(y)\n");
}

TEST(ScriptAdapterTest, PythonPassesThrough) {
    const std::string source = "def f(a):\n    return a * 2\n\nf(21)";
    EXPECT_EQ(ScriptAdapter::adapt(source), source);
    EXPECT_EQ(ScriptAdapter::adapt(""), "");
}
