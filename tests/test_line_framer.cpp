//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_line_framer.cpp
// Purpose: GoogleTests for newline-delimited framing of child process output
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>
#include "toolgw/ContentFramer.h"

using namespace toolgw;

TEST(LineFramer, EncodeAppendsNewline) {
    auto framer = MakeLineFramer();
    EXPECT_EQ(framer->encode("{\"id\":\"a\"}"), "{\"id\":\"a\"}\n");
}

TEST(LineFramer, DecodesCompleteLinesAndKeepsPartialTail) {
    auto framer = MakeLineFramer();
    std::string buffer = "{\"id\":\"1\"}\n{\"id\":\"2\"}\n{\"id\":";
    auto first = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "{\"id\":\"1\"}");
    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "{\"id\":\"2\"}");
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, "{\"id\":");
    buffer += "\"3\"}\n";
    auto third = framer->tryDecode(buffer);
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(*third, "{\"id\":\"3\"}");
    EXPECT_TRUE(buffer.empty());
}

TEST(LineFramer, StripsCarriageReturnAndSkipsBlankLines) {
    auto framer = MakeLineFramer();
    std::string buffer = "\r\n   \n{\"id\":\"x\"}\r\n";
    auto line = framer->tryDecode(buffer);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "{\"id\":\"x\"}");
    EXPECT_TRUE(buffer.empty());
}

TEST(LineFramer, DecodeExReportsStatus) {
    auto framer = MakeLineFramer();
    auto incomplete = framer->tryDecodeEx("{\"id\"");
    EXPECT_EQ(incomplete.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(incomplete.bytesConsumed, 0u);

    auto blank = framer->tryDecodeEx("\nrest");
    EXPECT_EQ(blank.status, IContentFramer::DecodeStatus::Skipped);
    EXPECT_EQ(blank.bytesConsumed, 1u);

    auto ok = framer->tryDecodeEx("abc\nrest");
    EXPECT_EQ(ok.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ok.payload.has_value());
    EXPECT_EQ(*ok.payload, "abc");
    EXPECT_EQ(ok.bytesConsumed, 4u);
}

TEST(LineFramer, OversizedLineIsDroppedThroughItsTerminator) {
    auto framer = MakeLineFramer(8);
    std::string buffer = std::string(20, 'x');
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_TRUE(buffer.empty());
    // Remainder of the long line arrives, followed by a normal one
    buffer = "yyyy\nshort\n";
    auto line = framer->tryDecode(buffer);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "short");
}

TEST(LineFramer, OversizedCompleteLineIsSkipped) {
    auto framer = MakeLineFramer(4);
    std::string buffer = "toolong\nok\n";
    auto line = framer->tryDecode(buffer);
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "ok");
}
