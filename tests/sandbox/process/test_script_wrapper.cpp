/*
 * test_script_wrapper.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "sandbox/process/script_wrapper.hpp"

#include <algorithm>

using namespace warden::sandbox;
using namespace warden::sandbox::process;
using namespace std::chrono_literals;

class ScriptWrapperTest : public ::testing::Test {
protected:
    static bool contains(const std::string& text, std::string_view needle) {
        return text.find(needle) != std::string::npos;
    }
};

TEST_F(ScriptWrapperTest, EmbedsSettings) {
    WrapperSettings settings{.deadline = 1500ms,
                             .memoryLimitMb = 64,
                             .strict = true,
                             .allowedEnvironment = {"PIPELINE_ID"}};
    auto text = ScriptWrapper::render("1 + 1", settings);

    EXPECT_TRUE(contains(text, "_DEADLINE_S = 1.500"));
    EXPECT_TRUE(contains(text, "_MEMORY_LIMIT_KB = 65536"));
    EXPECT_TRUE(contains(text, "_STRICT = True"));
    EXPECT_TRUE(contains(text, R"(_ALLOWED_ENV = frozenset(["PIPELINE_ID"]))"));
    EXPECT_TRUE(contains(text, R"(_SOURCE = "1 + 1")"));
}

TEST_F(ScriptWrapperTest, NoPlaceholdersRemain) {
    auto text = ScriptWrapper::render("print('x')", WrapperSettings{});
    EXPECT_FALSE(contains(text, "@SOURCE@"));
    EXPECT_FALSE(contains(text, "@VIOLATION_MARKER@"));
    EXPECT_FALSE(contains(text, "@ERROR_EXIT@"));
    EXPECT_FALSE(contains(text, "@RESULT_MARKER@"));
    EXPECT_TRUE(contains(text, "_STRICT = False"));
    EXPECT_TRUE(contains(text, "_MEMORY_LIMIT_KB = 0"));
}

TEST_F(ScriptWrapperTest, ScriptTextIsNotRescanned) {
    // A script containing placeholder syntax must survive verbatim
    auto text = ScriptWrapper::render("s = '@STRICT@'\n", WrapperSettings{});
    EXPECT_TRUE(contains(text, R"(_SOURCE = "s = '@STRICT@'\n")"));
}

TEST_F(ScriptWrapperTest, QuotesAreEscaped) {
    auto text = ScriptWrapper::render("x = \"a\\b\"", WrapperSettings{});
    EXPECT_TRUE(contains(text, R"(_SOURCE = "x = \"a\\b\"")"));
}

TEST_F(ScriptWrapperTest, MarkersAndExitCodes) {
    auto text = ScriptWrapper::render("pass", WrapperSettings{});
    EXPECT_TRUE(contains(text, std::string(kSecurityViolationMarker)));
    EXPECT_TRUE(contains(text, std::string(kScriptErrorMarker)));
    EXPECT_TRUE(contains(text, "\"\\n" + std::string(kResultMarker) + " \""));
    EXPECT_TRUE(contains(text, "_os._exit(1)"));
}

TEST_F(ScriptWrapperTest, DeniedEvents) {
    const auto& events = ScriptWrapper::deniedAuditEvents();
    for (const auto* event : {"os.system", "subprocess.Popen", "socket.connect"}) {
        EXPECT_NE(std::find(events.begin(), events.end(), event), events.end())
            << event;
    }
    EXPECT_EQ(std::find(events.begin(), events.end(), "open"), events.end());
}
