#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>

#include <CausalLM/Pipeline.hpp>
#include <CausalLM/helpers/AssetResolver.hpp>
#include <CausalLM/helpers/Errors.hpp>

using namespace CausalLM;

static IOPreset parsePreset(const QString& s)
{
  if (s == "simple-causal")
    return IOPreset::SimpleCausal;
  if (s == "kv-cache")
    return IOPreset::KVCacheStyle;
  return IOPreset::Auto;
}

int main(int argc, char** argv)
{
  qputenv("QT_ASSUME_STDERR_HAS_CONSOLE", "1");
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("causal_lm_chat");

  QCommandLineParser parser;
  parser.setApplicationDescription("Chat with an ONNX causal language model");
  parser.addHelpOption();
  parser.addPositionalArgument("prompt", "The user message");
  QCommandLineOption model(
      "model", "Hub repository of the model", "repo",
      qEnvironmentVariable("MODEL_ID", "onnx-community/SmolLM-135M-ONNX"));
  QCommandLineOption dtype("dtype", "q4, fp16 or fp32", "dtype", "q4");
  QCommandLineOption preset(
      "preset", "auto, simple-causal or kv-cache", "preset", "auto");
  QCommandLineOption system(
      "system", "System message", "text", "You are a helpful assistant.");
  QCommandLineOption maxNewTokens(
      "max-new-tokens", "Generation length limit", "n", "64");
  QCommandLineOption sample("sample", "Sample instead of greedy decoding");
  QCommandLineOption temperature(
      "temperature", "Sampling temperature", "t", "1.0");
  QCommandLineOption provider(
      "provider", "Execution provider", "name", "default");
  QCommandLineOption cacheDir(
      "cache-dir", "Model cache directory", "dir",
      qEnvironmentVariable("CACHE_DIR", "models"));
  QCommandLineOption offline("offline", "Only use cached files");
  parser.addOptions(
      {model, dtype, preset, system, maxNewTokens, sample, temperature,
       provider, cacheDir, offline});
  parser.process(app);

  const QStringList args = parser.positionalArguments();
  const QString prompt = args.isEmpty()
                             ? "What is the third planet in our solar system?"
                             : args.join(' ');

  QTextStream out(stdout);
  try
  {
    HubSettings hub = HubSettings::fromEnvironment();
    hub.cacheRoot = parser.value(cacheDir);
    hub.offline = hub.offline || parser.isSet(offline);
    HubAssetResolver assets{hub};

    PipelineOptions opts;
    opts.dtype = parser.value(dtype).toStdString();
    opts.preset = parsePreset(parser.value(preset));
    opts.runtime.provider = parser.value(provider).toStdString();

    auto generator = TextGenerationPipeline::fromPretrained(
        "text-generation", parser.value(model).toStdString(), assets, opts);

    const std::vector<ChatMessage> messages{
        {.role = MessageRole::System,
         .content = parser.value(system).toStdString()},
        {.role = MessageRole::User, .content = prompt.toStdString()}};

    CallOptions call;
    call.maxNewTokens = parser.value(maxNewTokens).toInt();
    call.doSample = parser.isSet(sample);
    call.temperature = parser.value(temperature).toFloat();
    call.streamer = [&out](const StepEvent& ev) {
      out << QString::fromStdString(ev.deltaText);
      out.flush();
      return !ev.done;
    };

    const auto res = (*generator)(messages, call);
    out << "\n---\n"
        << QString::fromStdString(res.front().generatedText.back().content)
        << "\n";
    return 0;
  }
  catch (const Error& e)
  {
    qCritical() << e.what();
    return 1;
  }
}
