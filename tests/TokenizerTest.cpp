#include <gtest/gtest.h>

#include <CausalLM/helpers/Tokenizer.hpp>

#include "FakeGraph.hpp"

#include <vector>

using namespace CausalLM;
using namespace CausalLM::Testing;

TEST(TokenizerTest, RendersSystemMessagesFirst)
{
  const std::vector<ChatMessage> chat{
      {.role = MessageRole::User, .content = "Hi"},
      {.role = MessageRole::System, .content = "Be brief."},
      {.role = MessageRole::Assistant, .content = "Hello!"},
      {.role = MessageRole::Tool, .content = "42"},
      {.role = MessageRole::User, .content = "Thanks"}};

  FakeTokenizer tok;
  EXPECT_EQ(
      tok.renderChat(chat),
      "System: Be brief.\n"
      "User: Hi\n"
      "Assistant: Hello!\n"
      "User: 42\n"
      "User: Thanks\n"
      "Assistant:");
}

TEST(TokenizerTest, EmptyConversationStillPromptsTheAssistant)
{
  FakeTokenizer tok;
  EXPECT_EQ(tok.renderChat({}), "Assistant:");
}

TEST(TokenizerTest, EncodesChatAsSingleSequence)
{
  const std::vector<ChatMessage> chat{{.content = "ok"}};

  FakeTokenizer tok;
  const auto enc = tok.encodeChat(chat);

  EXPECT_EQ(enc.renderedPrompt, "User: ok\nAssistant:");
  ASSERT_EQ(enc.inputIds.size(), 1u);
  ASSERT_EQ(enc.attentionMask.size(), 1u);
  EXPECT_EQ(enc.promptLength, enc.renderedPrompt.size());
  EXPECT_EQ(enc.inputIds[0].size(), enc.promptLength);
  EXPECT_EQ(enc.attentionMask[0], std::vector<int64_t>(enc.promptLength, 1));
  EXPECT_EQ(enc.inputIds[0].front(), int64_t('U'));
}

TEST(TokenizerTest, BatchDecode)
{
  FakeTokenizer tok;
  tok.pieces = {{1, "foo"}, {2, " bar"}};
  EXPECT_EQ(
      tok.batchDecode({{1, 2}, {}, {2}}),
      (std::vector<std::string>{"foo bar", "", " bar"}));
}

TEST(TokenizerTest, RoleNames)
{
  EXPECT_EQ(roleName(MessageRole::System), "system");
  EXPECT_EQ(roleName(MessageRole::Assistant), "assistant");
  EXPECT_EQ(roleName(MessageRole::Tool), "tool");
}
