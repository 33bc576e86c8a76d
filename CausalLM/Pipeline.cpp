#include "Pipeline.hpp"

#include <QDebug>
#include <QFile>
#include <QString>
#include <QStringList>

#include <CausalLM/helpers/AssetResolver.hpp>
#include <CausalLM/helpers/Errors.hpp>

#include <unistd.h>

#include <format>
#include <map>

namespace CausalLM
{
namespace
{
const std::vector<std::string>& defaultStopSequences()
{
  static const std::vector<std::string> stops{
      "\nUser:", "\nuser:", "\nAssistant:", "\nassistant:"};
  return stops;
}

// $MODEL_FILES replaces the list of auxiliary tokenizer files
std::vector<std::string> auxiliaryTokenizerFiles()
{
  std::vector<std::string> files{
      "tokenizer_config.json",
      "special_tokens_map.json",
      "vocab.json",
      "merges.txt"};

  const QStringList overrides
      = qEnvironmentVariable("MODEL_FILES").split(',', Qt::SkipEmptyParts);
  if (!overrides.isEmpty())
  {
    files.clear();
    for (const QString& f : overrides)
      if (!f.trimmed().isEmpty())
        files.push_back(f.trimmed().toStdString());
  }
  return files;
}

double residentMemoryMB()
{
  QFile statm{"/proc/self/statm"};
  if (!statm.open(QIODevice::ReadOnly))
    return 0.;

  const auto fields = statm.readAll().simplified().split(' ');
  if (fields.size() < 2)
    return 0.;

  bool ok = false;
  const qint64 pages = fields[1].toLongLong(&ok);
  if (!ok)
    return 0.;
  return double(pages * sysconf(_SC_PAGESIZE)) / (1024. * 1024.);
}

void logModelLoadInfo(
    std::string_view modelId,
    const std::vector<std::string>& files)
{
  QStringList list;
  for (const auto& f : files)
    list << QString::fromStdString(f);
  qDebug().noquote() << "Model loaded: repo="
                     << QString::fromUtf8(modelId.data(), modelId.size())
                     << "files=" << list.join(", ")
                     << "rss_mb=" << QString::number(residentMemoryMB(), 'f', 1);
}

// Optional files never fail a load, whatever the origin answers
std::map<std::string, std::string> fetchOptionalFiles(
    AssetResolver& assets,
    std::string_view modelId,
    std::span<const std::string> filenames)
try
{
  return assets.fetchOptional(modelId, filenames);
}
catch (const Error& e)
{
  qWarning() << "Skipping optional files of"
             << QString::fromUtf8(modelId.data(), modelId.size()) << ":"
             << e.what();
  return {};
}

std::string_view trimmed(std::string_view s) noexcept
{
  constexpr std::string_view ws = " \t\n\r\f\v";
  const auto begin = s.find_first_not_of(ws);
  if (begin == std::string_view::npos)
    return {};
  const auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}
}

std::string graphFileForDtype(std::string_view dtype)
{
  if (dtype == "q4")
    return "onnx/model_q4.onnx";
  if (dtype == "fp16")
    return "onnx/model_fp16.onnx";
  return "onnx/model.onnx";
}

std::string
truncateAtStops(std::string_view text, std::span<const std::string> stops)
{
  for (const auto& stop : stops)
  {
    if (stop.empty())
      continue;
    if (auto idx = text.find(stop); idx != std::string_view::npos)
      text = text.substr(0, idx);
  }
  return std::string(trimmed(text));
}

TextGenerationPipeline::TextGenerationPipeline(
    ModelConfig config,
    std::unique_ptr<Tokenizer> tokenizer,
    std::unique_ptr<GenerationSession> session)
    : m_config{std::move(config)}
    , m_tokenizer{std::move(tokenizer)}
    , m_session{std::move(session)}
{
  if (!m_tokenizer || !m_session)
    throw Error(
        ErrorCode::InvalidInput, "a pipeline needs a tokenizer and a session");
}

std::unique_ptr<TextGenerationPipeline> TextGenerationPipeline::fromPretrained(
    std::string_view task,
    std::string_view modelId,
    AssetResolver& assets,
    const PipelineOptions& opts)
{
  if (task != "text-generation")
    throw Error(
        ErrorCode::ConfigurationError,
        std::format("task '{}' is not implemented", task));

  std::vector<std::string> files;

  // 1. Configuration
  files.push_back(assets.fetch(modelId, "config.json"));
  ModelConfig config = ModelConfig::fromFile(QString::fromStdString(files.back()));

  const std::string generationConfig[] = {"generation_config.json"};
  for (const auto& [name, path] : fetchOptionalFiles(assets, modelId, generationConfig))
  {
    config.mergeGenerationConfigFile(QString::fromStdString(path));
    files.push_back(path);
  }

  // 2. Tokenizer
  files.push_back(assets.fetch(modelId, "tokenizer.json"));
  const std::string tokenizerPath = files.back();
  for (const auto& [name, path] :
       fetchOptionalFiles(assets, modelId, auxiliaryTokenizerFiles()))
    files.push_back(path);
  auto tokenizer
      = std::make_unique<OrtxTextTokenizer>(tokenizerPath, config.bosTokenId);

  // 3. Graph, with its external weights when the repository has them
  const std::string graphFile = graphFileForDtype(opts.dtype);
  std::vector<std::string> graphPaths{assets.fetch(modelId, graphFile)};
  const std::string dataFile[] = {graphFile + "_data"};
  for (const auto& [name, path] : fetchOptionalFiles(assets, modelId, dataFile))
    graphPaths.push_back(path);
  files.insert(files.end(), graphPaths.begin(), graphPaths.end());

  auto session
      = GenerationSession::load(graphPaths, opts.preset, config, opts.runtime);

  logModelLoadInfo(modelId, files);

  return std::make_unique<TextGenerationPipeline>(
      std::move(config), std::move(tokenizer), std::move(session));
}

std::vector<std::string>
TextGenerationPipeline::stopSequencesFor(const CallOptions& options) const
{
  std::vector<std::string> stops;
  for (const auto& s : options.stop)
    if (!s.empty())
      stops.push_back(s);

  if (stops.empty())
    stops = m_config.stopStrings;
  if (stops.empty())
    stops = defaultStopSequences();
  return stops;
}

std::vector<GeneratedText> TextGenerationPipeline::operator()(
    std::span<const ChatMessage> messages,
    const CallOptions& options) const
{
  const EncodedChat chat = m_tokenizer->encodeChat(messages);

  GenerationOptions genOpts{
      .maxNewTokens = options.maxNewTokens,
      .doSample = options.doSample,
      .stopSequences = stopSequencesFor(options),
      .streamer = options.streamer,
      .temperature = options.temperature,
      .topK = options.topK,
      .topP = options.topP,
      .seed = options.seed};

  const auto generated = m_session->generate(
      *m_tokenizer, chat.inputIds, chat.attentionMask, genOpts);

  const auto texts = m_tokenizer->batchDecode(generated);

  std::vector<GeneratedText> out;
  out.reserve(texts.size());
  for (const auto& text : texts)
  {
    out.push_back(GeneratedText{
        .generatedText = {ChatMessage{
            .role = MessageRole::Assistant,
            .content = truncateAtStops(text, genOpts.stopSequences)}}});
  }
  return out;
}
}
