#include <gtest/gtest.h>
#include <ssh/prompt_detector.hpp>

static std::vector<ShellEventType> types(const std::vector<ShellEvent>& events) {
    std::vector<ShellEventType> out;
    for (const auto& e : events) out.push_back(e.type);
    return out;
}

TEST(PromptDetector, PlainOutputIsForwardedUnchanged) {
    PromptDetector d;
    auto events = d.feed("hello\r\nworld");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, ShellEventType::DataChunk);
    EXPECT_EQ(events[0].data, "hello\r\nworld");
}

TEST(PromptDetector, TrailingPromptRaisesPromptEvent) {
    PromptDetector d;
    auto events = d.feed("file.txt\r\nuser@host:~$ ");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, ShellEventType::DataChunk);
    EXPECT_EQ(events[0].data, "file.txt\r\n");
    EXPECT_EQ(events[1].type, ShellEventType::Prompt);
}

TEST(PromptDetector, DollarInsideLineIsNotAPrompt) {
    PromptDetector d;
    auto events = d.feed("costs $ 5");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, ShellEventType::DataChunk);

    EXPECT_TRUE(PromptDetector::is_shell_prompt("$ "));
    EXPECT_FALSE(PromptDetector::is_shell_prompt("$"));
    EXPECT_FALSE(PromptDetector::is_shell_prompt("# "));
}

TEST(PromptDetector, PasswordPromptSwallowsNextLineBreak) {
    PromptDetector d;
    auto events = d.feed("[sudo] password for alice: ");
    EXPECT_EQ(types(events), std::vector<ShellEventType>{ShellEventType::PasswordRequested});
    EXPECT_TRUE(d.swallow_pending());

    // The newline echoed after the password is dropped once
    EXPECT_TRUE(d.feed("\r\n").empty());
    EXPECT_FALSE(d.swallow_pending());

    auto later = d.feed("\r\n");
    ASSERT_EQ(later.size(), 1u);
    EXPECT_EQ(later[0].data, "\r\n");
}

TEST(PromptDetector, PasswordPromptInsideLargerChunk) {
    PromptDetector d;
    auto events = d.feed("output\r\n[sudo] password for bob:\r\nroot\r\n$ ");
    EXPECT_EQ(types(events), (std::vector<ShellEventType>{
        ShellEventType::DataChunk,
        ShellEventType::PasswordRequested,
        ShellEventType::DataChunk,
        ShellEventType::Prompt,
    }));
    EXPECT_EQ(events[0].data, "output\r\n");
    EXPECT_EQ(events[2].data, "root\r\n");
}

TEST(PromptDetector, PasswordTextMustStartTheLine) {
    EXPECT_TRUE(PromptDetector::is_password_prompt("[sudo] password for alice:"));
    EXPECT_TRUE(PromptDetector::is_password_prompt("[sudo] password for"));
    EXPECT_FALSE(PromptDetector::is_password_prompt("echo [sudo] password for alice"));
    EXPECT_FALSE(PromptDetector::is_password_prompt("[sudo] password for alice:\n"));

    PromptDetector d;
    auto events = d.feed("echo [sudo] password for x");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, ShellEventType::DataChunk);
    EXPECT_FALSE(d.swallow_pending());
}

TEST(PromptDetector, SwallowedSeparatorCannotBeToldFromOutput) {
    PromptDetector d;
    d.feed("[sudo] password for alice: ");

    // A blank output line arriving next is lost with the echo
    auto events = d.feed("\r\nnext");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "next");
}

TEST(PromptDetector, SwallowOnlyMatchesTheExactSeparator) {
    PromptDetector d;
    d.feed("[sudo] password for alice: ");

    auto events = d.feed("text");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].data, "text");
    EXPECT_TRUE(d.swallow_pending());
}

TEST(PromptDetector, EmptyChunkProducesNothing) {
    PromptDetector d;
    EXPECT_TRUE(d.feed("").empty());
}
