#pragma once
#include <CausalLM/helpers/GenerationSession.hpp>
#include <CausalLM/helpers/IOSchema.hpp>
#include <CausalLM/helpers/ModelConfig.hpp>
#include <CausalLM/helpers/OnnxContext.hpp>
#include <CausalLM/helpers/Tokenizer.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace CausalLM
{
class AssetResolver;

struct PipelineOptions
{
  // "q4", "fp16", anything else selects onnx/model.onnx
  std::string dtype{"q4"};
  IOPreset preset{IOPreset::Auto};
  Options runtime;
};

struct CallOptions
{
  int maxNewTokens{32};
  bool doSample{false};
  float temperature{1.f};
  int topK{0};
  float topP{1.f};
  std::optional<uint32_t> seed;

  // Empty: the model's generation config stops, else the chat turn markers
  std::vector<std::string> stop;
  StreamCallback streamer;
};

struct GeneratedText
{
  // The conversation continuation, a single assistant message
  std::vector<ChatMessage> generatedText;
};

/**
 * messages -> prompt -> token ids -> generated ids -> text.
 */
class TextGenerationPipeline
{
public:
  TextGenerationPipeline(
      ModelConfig config,
      std::unique_ptr<Tokenizer> tokenizer,
      std::unique_ptr<GenerationSession> session);

  /// Fetches config, tokenizer and graph of a hub repository and loads them.
  static std::unique_ptr<TextGenerationPipeline> fromPretrained(
      std::string_view task,
      std::string_view modelId,
      AssetResolver& assets,
      const PipelineOptions& opts = {});

  std::vector<GeneratedText> operator()(
      std::span<const ChatMessage> messages,
      const CallOptions& options = {}) const;

  std::vector<std::string> stopSequencesFor(const CallOptions& options) const;

  const ModelConfig& config() const noexcept { return m_config; }
  const Tokenizer& tokenizer() const noexcept { return *m_tokenizer; }
  const GenerationSession& session() const noexcept { return *m_session; }

private:
  ModelConfig m_config;
  std::unique_ptr<Tokenizer> m_tokenizer;
  std::unique_ptr<GenerationSession> m_session;
};

std::string graphFileForDtype(std::string_view dtype);

/// Cuts the text at the first occurrence of each stop string in turn,
/// then trims surrounding whitespace.
std::string truncateAtStops(std::string_view text, std::span<const std::string> stops);
}
