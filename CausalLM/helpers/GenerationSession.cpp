#include "GenerationSession.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QString>

#include <CausalLM/helpers/Debug.hpp>
#include <CausalLM/helpers/Errors.hpp>
#include <CausalLM/helpers/ModelConfig.hpp>
#include <CausalLM/helpers/Tokenizer.hpp>
#include <CausalLM/helpers/Utilities.hpp>

#include <array>
#include <format>
#include <numeric>

namespace CausalLM
{
namespace
{
const char* stopReasonName(StopReason r) noexcept
{
  switch (r)
  {
    case StopReason::EndOfSequence:
      return "end of sequence";
    case StopReason::StopString:
      return "stop string";
    case StopReason::MaxNewTokens:
      return "max new tokens";
    case StopReason::Cancelled:
      return "cancelled";
  }
  return "";
}

std::string formatShape(std::span<const int64_t> shape)
{
  std::string res = "[";
  for (std::size_t i = 0; i < shape.size(); ++i)
    res += (i ? ", " : "") + std::to_string(shape[i]);
  return res + "]";
}

std::unique_ptr<OrtGraph>
loadGraph(std::span<const std::string> paths, const Options& opts)
{
  if (paths.empty())
    throw Error(ErrorCode::InvalidInput, "no graph file given");

  const QFileInfo model{QString::fromStdString(paths[0])};
  for (const auto& extra : paths.subspan(1))
  {
    const QFileInfo data{QString::fromStdString(extra)};
    if (!data.exists())
      throw Error(
          ErrorCode::NotFound,
          std::format("external data file '{}' does not exist", extra));
    if (data.absolutePath() != model.absolutePath())
      qWarning() << "External data" << data.filePath()
                 << "is not next to the graph and may not be found";
  }

  return std::make_unique<OrtGraph>(paths[0], opts);
}
}

GenerationSession::GenerationSession(
    std::unique_ptr<Graph> graph,
    IOSchema schema,
    int64_t eosTokenId)
    : m_graph{std::move(graph)}
    , m_schema{std::move(schema)}
    , m_eosTokenId{eosTokenId}
{
  if (!m_graph)
    throw Error(ErrorCode::InvalidInput, "a generation session needs a graph");

  if (m_schema.inputInfo.empty())
    for (const auto& slot : m_graph->signature().inputs)
      m_schema.inputInfo.emplace(slot.name, slot);
}

std::unique_ptr<GenerationSession> GenerationSession::load(
    std::span<const std::string> graphArtifactPaths,
    IOSchema schema,
    int64_t eosTokenId,
    const Options& opts)
{
  return std::make_unique<GenerationSession>(
      loadGraph(graphArtifactPaths, opts), std::move(schema), eosTokenId);
}

std::unique_ptr<GenerationSession> GenerationSession::load(
    std::span<const std::string> graphArtifactPaths,
    IOPreset preset,
    const ModelConfig& config,
    const Options& opts)
{
  auto graph = loadGraph(graphArtifactPaths, opts);
  auto schema = resolveIOSchema(preset, &config, graph->signature());
  qDebug().noquote() << "Resolved" << preset << schema;
  return std::make_unique<GenerationSession>(
      std::move(graph), std::move(schema), config.eosTokenId);
}

std::vector<std::vector<int64_t>> GenerationSession::generate(
    const Tokenizer& tokenizer,
    const std::vector<std::vector<int64_t>>& inputIds,
    const std::vector<std::vector<int64_t>>& attentionMask,
    GenerationOptions options) const
{
  if (inputIds.size() != 1 || attentionMask.size() != 1)
    throw Error(
        ErrorCode::UnsupportedBatchSize,
        std::format(
            "only batch size 1 is supported, got {} sequences and {} masks",
            inputIds.size(),
            attentionMask.size()));

  if (inputIds[0].empty())
    throw Error(ErrorCode::InvalidInput, "the prompt has no tokens");
  if (inputIds[0].size() != attentionMask[0].size())
    throw Error(
        ErrorCode::InvalidInput,
        std::format(
            "attention mask has {} entries for {} tokens",
            attentionMask[0].size(),
            inputIds[0].size()));

  if (options.maxNewTokens <= 0)
    options.maxNewTokens = defaultMaxNewTokens;

  SequenceState state{.tokens = inputIds[0], .attentionMask = attentionMask[0]};
  state.generated.reserve(options.maxNewTokens);

  const StopReason reason = decode(tokenizer, state, options);
  qDebug() << "Generated" << state.generated.size()
           << "tokens, stopped on" << stopReasonName(reason);

  return {std::move(state.generated)};
}

StopReason GenerationSession::decode(
    const Tokenizer& tokenizer,
    SequenceState& state,
    const GenerationOptions& options) const
{
  std::mt19937 rng(options.seed ? *options.seed : std::random_device{}());

  for (int step = 0; step < options.maxNewTokens; ++step)
  {
    std::vector<float> logits = runStep(state);
    const int64_t nextToken = selectToken(logits, options, rng);
    state.append(nextToken);

    // Failing to render a token must not lose the generated ids
    std::string deltaText;
    try
    {
      deltaText = tokenizer.decode(std::span{&nextToken, 1});
    }
    catch (const std::exception& e)
    {
      qDebug() << "Could not decode token" << nextToken << ":" << e.what();
    }
    state.fullText += deltaText;

    bool stopHit = false;
    for (const auto& stop : options.stopSequences)
    {
      if (stop.empty())
        continue;
      if (auto idx = state.fullText.find(stop); idx != std::string::npos)
      {
        state.fullText.resize(idx);
        deltaText.clear();
        stopHit = true;
        break;
      }
    }

    const bool eosHit = m_eosTokenId >= 0 && nextToken == m_eosTokenId;

    bool cancelled = false;
    if (options.streamer)
    {
      const StepEvent ev{
          .tokenId = nextToken,
          .deltaText = std::move(deltaText),
          .fullText = state.fullText,
          .step = step,
          .done = eosHit || stopHit};
      cancelled = !options.streamer(ev);
    }

    if (eosHit)
      return StopReason::EndOfSequence;
    if (stopHit)
      return StopReason::StopString;
    if (cancelled)
      return StopReason::Cancelled;
  }
  return StopReason::MaxNewTokens;
}

std::vector<TensorPtr>
GenerationSession::assembleInputs(const SequenceState& state) const
{
  const auto length = static_cast<int64_t>(state.tokens.size());
  const std::array<int64_t, 2> sequenceShape{1, length};

  // Released on every exit path, including a failure on a later slot
  std::vector<TensorPtr> tensors;
  tensors.reserve(m_schema.inputNames.size());

  for (const auto& name : m_schema.inputNames)
  {
    if (name == "input_ids")
    {
      tensors.push_back(make_tensor(name, [&] {
        return m_graph->createInt64(state.tokens, sequenceShape);
      }));
    }
    else if (name == "attention_mask")
    {
      tensors.push_back(make_tensor(name, [&] {
        return m_graph->createInt64(state.attentionMask, sequenceShape);
      }));
    }
    else if (name == "position_ids")
    {
      std::vector<int64_t> positions(state.tokens.size());
      std::iota(positions.begin(), positions.end(), int64_t{0});
      tensors.push_back(make_tensor(name, [&] {
        return m_graph->createInt64(positions, sequenceShape);
      }));
    }
    else
    {
      const SlotInfo* slot = m_schema.findInput(name);
      if (!slot)
        throw Error(
            ErrorCode::TensorConstructionError,
            std::format("the graph declares no input named '{}'", name));

      const auto shape = zero_slot_shape(*slot, length);
      tensors.push_back(make_tensor(name, [&] {
        return m_graph->createZeros(slot->elementType, shape);
      }));
    }
  }
  return tensors;
}

std::vector<float> GenerationSession::runStep(const SequenceState& state) const
{
  std::vector<TensorPtr> inputs = assembleInputs(state);

  std::vector<const Tensor*> inputViews;
  inputViews.reserve(inputs.size());
  for (const auto& t : inputs)
    inputViews.push_back(t.get());

  std::vector<TensorPtr> outputs;
  try
  {
    outputs = m_graph->run(
        m_schema.inputNames, inputViews, m_schema.outputNames);
  }
  catch (const std::exception& e)
  {
    throw Error(ErrorCode::GraphExecutionError, e.what());
  }
  inputs.clear();

  if (outputs.size() != m_schema.outputNames.size())
    throw Error(
        ErrorCode::GraphExecutionError,
        std::format(
            "graph returned {} outputs, {} were requested",
            outputs.size(),
            m_schema.outputNames.size()));

  TensorPtr logits;
  for (std::size_t i = 0; i < outputs.size(); ++i)
  {
    if (m_schema.outputNames[i] == logitsOutputName)
      logits = std::move(outputs[i]);
    else
      outputs[i].reset();
  }

  if (!logits)
    throw Error(
        ErrorCode::MissingLogitsOutput, "the graph produced no 'logits' output");
  if (!isFloatingPoint(logits->elementType()))
    throw Error(
        ErrorCode::UnexpectedLogitsType, "'logits' is not a floating-point tensor");

  const auto shape = logits->shape();
  const auto length = static_cast<int64_t>(state.tokens.size());
  if (shape.size() != 3 || shape[0] < 1 || shape[1] < length || shape[2] <= 0)
    throw Error(
        ErrorCode::UnexpectedLogitsShape,
        std::format(
            "expected [1, {}, vocab] logits, got {}",
            length,
            formatShape(shape)));

  const auto vocabSize = static_cast<std::size_t>(shape[2]);
  std::vector<float> lastRow(vocabSize);
  logits->readFloats((length - 1) * vocabSize, lastRow);
  return lastRow;
}

int64_t GenerationSession::selectToken(
    std::span<float> logits,
    const GenerationOptions& options,
    std::mt19937& rng) const
{
  if (!options.doSample)
    return static_cast<int64_t>(argmax(logits));

  apply_temperature(logits, options.temperature);
  apply_top_k(logits, options.topK);
  apply_top_p(logits, options.topP);
  softmax(logits);

  std::uniform_real_distribution<float> dist(0.f, 1.f);
  return static_cast<int64_t>(sample_from_probabilities(logits, dist(rng)));
}
}
