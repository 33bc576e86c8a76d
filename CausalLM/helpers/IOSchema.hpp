#pragma once

#include <CausalLM/helpers/Graph.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace CausalLM
{
struct ModelConfig;

enum class IOPreset
{
  // Use the names the graph declares
  Auto,
  // input_ids, attention_mask -> logits
  SimpleCausal,
  // input_ids, attention_mask, position_ids, past_* -> logits, present.*
  KVCacheStyle
};

inline constexpr std::string_view logitsOutputName = "logits";

/**
 * The ordered input and output slot names a graph is driven with,
 * plus the declared type and shape of every input the graph knows about.
 * Resolved once when a model is loaded and never modified afterwards.
 */
struct IOSchema
{
  std::vector<std::string> inputNames;
  std::vector<std::string> outputNames;
  std::unordered_map<std::string, SlotInfo> inputInfo;

  const SlotInfo* findInput(std::string_view name) const;
};

IOSchema simpleCausalSchema();

// Fails with UnsupportedLayerType, or ConfigurationError if config is null.
IOSchema kvCacheSchema(const ModelConfig* config);

IOSchema introspectedSchema(const GraphSignature& signature);

/**
 * Resolves the schema for a preset. Declared input information is
 * always taken from the graph signature so that optional inputs can
 * be zero-filled with the right type and rank.
 */
IOSchema resolveIOSchema(
    IOPreset preset,
    const ModelConfig* config,
    const GraphSignature& signature);

/// Same as above, reading the signature from the graph file on disk.
/// Only the Auto preset fails with GraphIntrospectionError when the file
/// cannot be read.
IOSchema resolveIOSchema(
    IOPreset preset,
    const ModelConfig* config,
    const std::string& graphPath);
}
