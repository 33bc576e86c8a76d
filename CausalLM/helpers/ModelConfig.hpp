#pragma once

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <string>
#include <vector>

namespace CausalLM
{
/**
 * Model metadata read from a Hugging Face style config.json,
 * optionally merged with generation_config.json.
 *
 * Token ids are -1 when the files do not provide them.
 */
struct ModelConfig
{
  std::string modelType;
  int vocabSize{};
  int64_t eosTokenId{-1};
  int64_t bosTokenId{-1};
  int64_t padTokenId{-1};
  int numHiddenLayers{};
  int numAttentionHeads{};
  int numKeyValueHeads{};
  int hiddenSize{};
  int convLCache{};
  std::vector<std::string> layerTypes;

  // Default stop strings from generation_config.json
  std::vector<std::string> stopStrings;

  static ModelConfig fromJson(const QByteArray& configJson);
  static ModelConfig fromFile(const QString& configPath);

  // Unlike fromJson, failures here are logged and ignored.
  void mergeGenerationConfig(const QByteArray& generationJson);
  void mergeGenerationConfigFile(const QString& path);
};
}
