#pragma once

#include <CausalLM/helpers/Errors.hpp>
#include <CausalLM/helpers/Graph.hpp>

#include <cstdint>
#include <exception>
#include <format>
#include <span>
#include <string_view>
#include <vector>

namespace CausalLM
{

inline int64_t calculate_product(std::span<const int64_t> v)
{
  int64_t total = 1;
  for (auto& i : v)
    total *= i;
  return total;
}

/// Index of the largest value, lowest index on ties. 0 for an empty row.
std::size_t argmax(std::span<const float> xs) noexcept;

/// In-place, numerically stable softmax.
void softmax(std::span<float> xs) noexcept;

/// Picks an index from a normalized distribution given a uniform draw in [0, 1).
/// Returns the last non-zero entry if rounding leaves the cumulative sum
/// below the draw.
std::size_t sample_from_probabilities(std::span<const float> probs, float r) noexcept;

void apply_temperature(std::span<float> logits, float temperature) noexcept;
void apply_top_k(std::span<float> logits, int k);
void apply_top_p(std::span<float> logits, float p);

// Names such as "past_key_values.0.key" or "past_conv.3"
bool is_cache_slot(std::string_view name) noexcept;

/**
 * Concrete shape for a zero-filled optional input.
 *
 * Dynamic dimensions are resolved as: leading dimension -> 1 (batch),
 * any dimension of a cache slot -> 0 (empty cache), trailing dimension
 * of a non-cache slot -> the current sequence length, anything else -> 1.
 */
std::vector<int64_t> zero_slot_shape(const SlotInfo& slot, int64_t sequenceLength);

/// Runs a tensor factory, turning engine failures into TensorConstructionError.
template <typename F>
TensorPtr make_tensor(std::string_view slot, F&& factory)
{
  TensorPtr t;
  try
  {
    t = factory();
  }
  catch (const Error&)
  {
    throw;
  }
  catch (const std::exception& e)
  {
    throw Error(
        ErrorCode::TensorConstructionError,
        std::format("cannot create tensor '{}': {}", slot, e.what()));
  }

  if (!t)
    throw Error(
        ErrorCode::TensorConstructionError,
        std::format("engine returned no tensor for '{}'", slot));
  return t;
}
}
