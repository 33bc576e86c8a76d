#include "IOSchema.hpp"

#include <QDebug>

#include <CausalLM/helpers/Errors.hpp>
#include <CausalLM/helpers/ModelConfig.hpp>
#include <CausalLM/helpers/OnnxContext.hpp>

#include <algorithm>
#include <format>

namespace CausalLM
{
namespace
{
bool isCoreInput(std::string_view name) noexcept
{
  return name == "input_ids" || name == "attention_mask"
         || name == "position_ids";
}

void attachInputInfo(IOSchema& schema, const GraphSignature& signature)
{
  for (const auto& slot : signature.inputs)
    schema.inputInfo.emplace(slot.name, slot);
}
}

const SlotInfo* IOSchema::findInput(std::string_view name) const
{
  auto it = inputInfo.find(std::string(name));
  return it != inputInfo.end() ? &it->second : nullptr;
}

IOSchema simpleCausalSchema()
{
  IOSchema schema;
  schema.inputNames = {"input_ids", "attention_mask"};
  schema.outputNames = {std::string(logitsOutputName)};
  return schema;
}

IOSchema kvCacheSchema(const ModelConfig* config)
{
  if (!config)
    throw Error(
        ErrorCode::ConfigurationError,
        "a model configuration is required for the KV-cache preset");

  IOSchema schema;
  schema.inputNames = {"input_ids", "attention_mask", "position_ids"};

  for (std::size_t layer = 0; layer < config->layerTypes.size(); ++layer)
  {
    const std::string& type = config->layerTypes[layer];
    if (type == "full_attention")
    {
      schema.inputNames.push_back(std::format("past_key_values.{}.key", layer));
      schema.inputNames.push_back(
          std::format("past_key_values.{}.value", layer));
    }
    else if (type == "conv")
    {
      schema.inputNames.push_back(std::format("past_conv.{}", layer));
    }
    else
    {
      throw Error(
          ErrorCode::UnsupportedLayerType,
          std::format("layer {} has unsupported type '{}'", layer, type));
    }
  }

  schema.outputNames = {std::string(logitsOutputName)};
  for (const auto& name : schema.inputNames)
  {
    if (!isCoreInput(name))
      schema.outputNames.push_back("present." + name);
  }
  return schema;
}

IOSchema introspectedSchema(const GraphSignature& signature)
{
  IOSchema schema;
  for (const auto& slot : signature.inputs)
    schema.inputNames.push_back(slot.name);
  for (const auto& slot : signature.outputs)
    schema.outputNames.push_back(slot.name);
  return schema;
}

IOSchema resolveIOSchema(
    IOPreset preset,
    const ModelConfig* config,
    const GraphSignature& signature)
{
  IOSchema schema;
  switch (preset)
  {
    case IOPreset::SimpleCausal:
      schema = simpleCausalSchema();
      break;
    case IOPreset::KVCacheStyle:
      schema = kvCacheSchema(config);
      break;
    case IOPreset::Auto:
    default:
      schema = introspectedSchema(signature);
      break;
  }

  attachInputInfo(schema, signature);

  if (std::ranges::count(schema.outputNames, logitsOutputName) != 1)
    qWarning() << "Graph outputs do not contain exactly one 'logits' slot";

  return schema;
}

IOSchema resolveIOSchema(
    IOPreset preset,
    const ModelConfig* config,
    const std::string& graphPath)
{
  if (preset == IOPreset::Auto)
    return resolveIOSchema(preset, config, readGraphSignature(graphPath));

  // Static presets do not need the graph: without it, optional inputs
  // simply have no declared shape to zero-fill from.
  GraphSignature signature;
  try
  {
    signature = readGraphSignature(graphPath);
  }
  catch (const Error& e)
  {
    qWarning() << "Resolving preset without graph information:" << e.what();
  }
  return resolveIOSchema(preset, config, signature);
}
}
