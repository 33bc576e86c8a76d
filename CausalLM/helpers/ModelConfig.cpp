#include "ModelConfig.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <CausalLM/helpers/Errors.hpp>

#include <optional>

namespace CausalLM
{
namespace
{
QJsonObject parseObject(const QByteArray& json, const char* what)
{
  QJsonParseError err;
  const auto doc = QJsonDocument::fromJson(json, &err);
  if (err.error != QJsonParseError::NoError)
    throw Error(
        ErrorCode::ConfigurationError,
        std::string(what) + ": " + err.errorString().toStdString());
  if (!doc.isObject())
    throw Error(
        ErrorCode::ConfigurationError,
        std::string(what) + ": top-level value is not an object");
  return doc.object();
}

// HF configs sometimes list several eos ids, the first one is used.
std::optional<int64_t> tokenId(const QJsonValue& v)
{
  if (v.isDouble())
    return static_cast<int64_t>(v.toDouble());
  if (v.isArray())
  {
    const auto arr = v.toArray();
    if (!arr.isEmpty() && arr.first().isDouble())
      return static_cast<int64_t>(arr.first().toDouble());
  }
  return std::nullopt;
}

QByteArray readAll(const QString& path)
{
  QFile f{path};
  if (!f.open(QIODevice::ReadOnly))
    throw Error(
        ErrorCode::ConfigurationError,
        "cannot open " + path.toStdString() + ": "
            + f.errorString().toStdString());
  return f.readAll();
}
}

ModelConfig ModelConfig::fromJson(const QByteArray& configJson)
{
  const QJsonObject raw = parseObject(configJson, "config.json");

  ModelConfig cfg;
  cfg.modelType = raw.value("model_type").toString().toStdString();
  cfg.vocabSize = raw.value("vocab_size").toInt(0);
  cfg.eosTokenId = tokenId(raw.value("eos_token_id")).value_or(-1);
  cfg.bosTokenId = tokenId(raw.value("bos_token_id")).value_or(-1);
  cfg.padTokenId = tokenId(raw.value("pad_token_id")).value_or(-1);
  cfg.numHiddenLayers = raw.value("num_hidden_layers").toInt(0);
  cfg.numAttentionHeads = raw.value("num_attention_heads").toInt(0);
  cfg.numKeyValueHeads = raw.value("num_key_value_heads").toInt(0);
  cfg.hiddenSize = raw.value("hidden_size").toInt(0);
  cfg.convLCache = raw.contains("conv_L_cache")
                       ? raw.value("conv_L_cache").toInt(0)
                       : raw.value("conv_l_cache").toInt(0);

  for (const auto& v : raw.value("layer_types").toArray())
    cfg.layerTypes.push_back(v.toString().toStdString());

  if (cfg.modelType.empty())
    throw Error(
        ErrorCode::ConfigurationError, "model_type missing in config.json");

  return cfg;
}

ModelConfig ModelConfig::fromFile(const QString& configPath)
{
  return fromJson(readAll(configPath));
}

void ModelConfig::mergeGenerationConfig(const QByteArray& generationJson)
try
{
  const QJsonObject gen = parseObject(generationJson, "generation_config.json");

  if (auto id = tokenId(gen.value("eos_token_id")))
    eosTokenId = *id;
  if (auto id = tokenId(gen.value("bos_token_id")))
    bosTokenId = *id;
  if (auto id = tokenId(gen.value("pad_token_id")))
    padTokenId = *id;

  const QJsonValue stop = gen.value("stop");
  if (stop.isString())
  {
    if (!stop.toString().isEmpty())
      stopStrings = {stop.toString().toStdString()};
  }
  else if (stop.isArray())
  {
    stopStrings.clear();
    for (const auto& s : stop.toArray())
      if (s.isString() && !s.toString().isEmpty())
        stopStrings.push_back(s.toString().toStdString());
  }
}
catch (const Error& e)
{
  qWarning() << "Ignoring generation config:" << e.what();
}

void ModelConfig::mergeGenerationConfigFile(const QString& path)
try
{
  mergeGenerationConfig(readAll(path));
}
catch (const Error& e)
{
  qWarning() << "Ignoring generation config:" << e.what();
}
}
