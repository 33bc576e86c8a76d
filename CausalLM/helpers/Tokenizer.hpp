#pragma once

#include <ortx_tokenizer.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace CausalLM
{
enum class MessageRole
{
  System,
  User,
  Assistant,
  Tool
};

std::string_view roleName(MessageRole r) noexcept;

struct ChatMessage
{
  MessageRole role{MessageRole::User};
  std::string content;
  std::string name;
  std::string toolCallId;
};

struct EncodedChat
{
  std::vector<std::vector<int64_t>> inputIds;
  std::vector<std::vector<int64_t>> attentionMask;
  std::size_t promptLength{};
  std::string renderedPrompt;
};

/**
 * Text <-> token id conversion.
 *
 * Implementations throw CausalLM::Error(TokenizerError) on failure.
 */
class Tokenizer
{
public:
  virtual ~Tokenizer() = default;

  virtual std::vector<int64_t>
  encode(std::string_view text, bool addSpecialTokens) const = 0;
  virtual std::string decode(std::span<const int64_t> ids) const = 0;

  std::vector<std::string>
  batchDecode(const std::vector<std::vector<int64_t>>& batch) const;

  /**
   * Renders a conversation to a prompt. The default format is:
   *
   *   System: <system messages, in order>
   *   User: ...
   *   Assistant: ...
   *   Assistant:
   *
   * Tool and other non-assistant turns are rendered as "User".
   */
  virtual std::string renderChat(std::span<const ChatMessage> messages) const;

  EncodedChat encodeChat(std::span<const ChatMessage> messages) const;
};

/// Tokenizer backed by onnxruntime-extensions, loaded from a
/// directory holding tokenizer.json and tokenizer_config.json.
class OrtxTextTokenizer final : public Tokenizer
{
public:
  // Accepts either the directory or the path to tokenizer.json
  OrtxTextTokenizer(std::string_view tokenizerPath, int64_t bosTokenId = -1);
  ~OrtxTextTokenizer();

  OrtxTextTokenizer(const OrtxTextTokenizer&) = delete;
  OrtxTextTokenizer& operator=(const OrtxTextTokenizer&) = delete;

  std::vector<int64_t>
  encode(std::string_view text, bool addSpecialTokens) const override;
  std::string decode(std::span<const int64_t> ids) const override;

private:
  OrtxTokenizer* tokenizer{};
  int64_t bosTokenId{-1};
};
}
