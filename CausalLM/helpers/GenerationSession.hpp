#pragma once

#include <CausalLM/helpers/Graph.hpp>
#include <CausalLM/helpers/IOSchema.hpp>
#include <CausalLM/helpers/OnnxContext.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace CausalLM
{
class Tokenizer;
struct ModelConfig;

struct StepEvent
{
  int64_t tokenId{};
  std::string deltaText;
  std::string fullText;
  int step{};
  bool done{};
};

// Returning false stops generation after the current step.
using StreamCallback = std::function<bool(const StepEvent&)>;

struct GenerationOptions
{
  // Non-positive values are replaced by GenerationSession::defaultMaxNewTokens
  int maxNewTokens{128};
  bool doSample{false};
  std::vector<std::string> stopSequences;
  StreamCallback streamer;

  // Only used when doSample is set
  float temperature{1.f};
  int topK{0};
  float topP{1.f};
  std::optional<uint32_t> seed;
};

enum class StopReason
{
  EndOfSequence,
  StopString,
  MaxNewTokens,
  Cancelled
};

/// Per-call state of one sequence being generated.
struct SequenceState
{
  std::vector<int64_t> tokens;
  std::vector<int64_t> attentionMask;
  std::vector<int64_t> generated;
  std::string fullText;

  void append(int64_t tokenId)
  {
    tokens.push_back(tokenId);
    attentionMask.push_back(1);
    generated.push_back(tokenId);
  }
};

/**
 * Drives greedy or sampled autoregressive decoding on a loaded graph.
 *
 * Every step runs the graph on the whole sequence so far: optional
 * cache inputs are zero-filled with an empty past, whatever the preset.
 * All per-call state lives in the call, so generate() may be called
 * concurrently on one session when the engine supports concurrent runs.
 */
class GenerationSession
{
public:
  static constexpr int defaultMaxNewTokens = 128;

  GenerationSession(
      std::unique_ptr<Graph> graph,
      IOSchema schema,
      int64_t eosTokenId = -1);

  /// graphArtifactPaths[0] is the graph file, the other entries are
  /// external data files that must exist next to it.
  /// Loads onnxruntime through RuntimeBootstrap::ensure() if needed.
  static std::unique_ptr<GenerationSession> load(
      std::span<const std::string> graphArtifactPaths,
      IOSchema schema,
      int64_t eosTokenId,
      const Options& opts = {});

  static std::unique_ptr<GenerationSession> load(
      std::span<const std::string> graphArtifactPaths,
      IOPreset preset,
      const ModelConfig& config,
      const Options& opts = {});

  /// Returns the generated ids, without the prompt, for the single
  /// sequence of the batch.
  std::vector<std::vector<int64_t>> generate(
      const Tokenizer& tokenizer,
      const std::vector<std::vector<int64_t>>& inputIds,
      const std::vector<std::vector<int64_t>>& attentionMask,
      GenerationOptions options) const;

  const IOSchema& schema() const noexcept { return m_schema; }
  const Graph& graph() const noexcept { return *m_graph; }
  int64_t eosTokenId() const noexcept { return m_eosTokenId; }

private:
  StopReason decode(
      const Tokenizer& tokenizer,
      SequenceState& state,
      const GenerationOptions& options) const;

  std::vector<TensorPtr> assembleInputs(const SequenceState& state) const;
  std::vector<float> runStep(const SequenceState& state) const;
  int64_t selectToken(
      std::span<float> logits,
      const GenerationOptions& options,
      std::mt19937& rng) const;

  std::unique_ptr<Graph> m_graph;
  IOSchema m_schema;
  int64_t m_eosTokenId{-1};
};
}
