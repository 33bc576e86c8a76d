#include "Tokenizer.hpp"

#include <CausalLM/helpers/Errors.hpp>

#include <ortx_utils.h>

#include <format>

namespace CausalLM
{
namespace
{
// Disposes an ortx object when leaving scope
template <typename T>
struct OrtxHandle
{
  T* ptr{};
  OrtxHandle() = default;
  OrtxHandle(const OrtxHandle&) = delete;
  OrtxHandle& operator=(const OrtxHandle&) = delete;
  ~OrtxHandle()
  {
    if (ptr)
      OrtxDispose((OrtxObject**)&ptr);
  }
};

[[noreturn]] void throwOrtx(const char* what)
{
  const char* msg = OrtxGetLastErrorMessage();
  throw Error(
      ErrorCode::TokenizerError,
      std::format("{}: {}", what, msg ? msg : "unknown error"));
}
}

std::string_view roleName(MessageRole r) noexcept
{
  switch (r)
  {
    case MessageRole::System:
      return "system";
    case MessageRole::User:
      return "user";
    case MessageRole::Assistant:
      return "assistant";
    case MessageRole::Tool:
      return "tool";
  }
  return "user";
}

std::vector<std::string>
Tokenizer::batchDecode(const std::vector<std::vector<int64_t>>& batch) const
{
  std::vector<std::string> res;
  res.reserve(batch.size());
  for (const auto& seq : batch)
    res.push_back(decode(seq));
  return res;
}

std::string Tokenizer::renderChat(std::span<const ChatMessage> messages) const
{
  std::string prompt;
  for (const auto& m : messages)
  {
    if (m.role == MessageRole::System)
    {
      prompt += "System: ";
      prompt += m.content;
      prompt += '\n';
    }
  }

  for (const auto& m : messages)
  {
    if (m.role == MessageRole::System)
      continue;

    prompt += m.role == MessageRole::Assistant ? "Assistant: " : "User: ";
    prompt += m.content;
    prompt += '\n';
  }

  prompt += "Assistant:";
  return prompt;
}

EncodedChat Tokenizer::encodeChat(std::span<const ChatMessage> messages) const
{
  EncodedChat res;
  res.renderedPrompt = renderChat(messages);

  auto ids = encode(res.renderedPrompt, true);
  res.promptLength = ids.size();
  res.attentionMask.emplace_back(ids.size(), 1);
  res.inputIds.push_back(std::move(ids));
  return res;
}

OrtxTextTokenizer::OrtxTextTokenizer(
    std::string_view tokenizerPath,
    int64_t bosTokenId)
    : bosTokenId{bosTokenId}
{
  if (tokenizerPath.ends_with("tokenizer.json"))
    tokenizerPath = tokenizerPath.substr(
        0, tokenizerPath.size() - std::string_view("tokenizer.json").size());

  extError_t result
      = OrtxCreateTokenizer(&tokenizer, std::string(tokenizerPath).c_str());
  if (result != kOrtxOK)
    throwOrtx("Failed to create tokenizer");
}

OrtxTextTokenizer::~OrtxTextTokenizer()
{
  if (tokenizer)
    OrtxDispose((OrtxObject**)&tokenizer);
}

std::vector<int64_t>
OrtxTextTokenizer::encode(std::string_view text, bool addSpecialTokens) const
{
  const std::string str(text);
  const char* inputs[] = {str.c_str()};

  OrtxHandle<OrtxTokenId2DArray> tokenIds;
  if (OrtxTokenize(tokenizer, inputs, 1, &tokenIds.ptr) != kOrtxOK)
    throwOrtx("Tokenization failed");

  std::size_t length = 0;
  const extTokenId_t* ids = nullptr;
  if (OrtxTokenId2DArrayGetItem(tokenIds.ptr, 0, &ids, &length) != kOrtxOK)
    throwOrtx("Tokenization failed");

  std::vector<int64_t> res(ids, ids + length);

  // ortx always runs the post-processor; undo the BOS it may add
  if (!addSpecialTokens && bosTokenId >= 0 && !res.empty()
      && res.front() == bosTokenId)
    res.erase(res.begin());

  return res;
}

std::string OrtxTextTokenizer::decode(std::span<const int64_t> tokens) const
{
  if (tokens.empty())
    return {};

  std::vector<extTokenId_t> ids(tokens.begin(), tokens.end());
  OrtxHandle<OrtxStringArray> texts;
  if (OrtxDetokenize1D(tokenizer, ids.data(), ids.size(), &texts.ptr)
      != kOrtxOK)
    throwOrtx("Detokenization failed");

  const char* text = nullptr;
  if (OrtxStringArrayGetItem(texts.ptr, 0, &text) != kOrtxOK || !text)
    throwOrtx("Detokenization failed");

  return std::string(text);
}
}
