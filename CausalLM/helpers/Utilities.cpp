#include "Utilities.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace CausalLM
{

std::size_t argmax(std::span<const float> xs) noexcept
{
  std::size_t maxIdx = 0;
  for (std::size_t i = 1; i < xs.size(); ++i)
  {
    if (xs[i] > xs[maxIdx])
      maxIdx = i;
  }
  return maxIdx;
}

void softmax(std::span<float> xs) noexcept
{
  if (xs.empty())
    return;

  const float maxVal = *std::max_element(xs.begin(), xs.end());

  float sum = 0.f;
  for (float& x : xs)
  {
    x = std::exp(x - maxVal);
    sum += x;
  }
  if (!(sum > 0.f))
    return;

  const float inv = 1.f / sum;
  for (float& x : xs)
    x *= inv;
}

std::size_t sample_from_probabilities(std::span<const float> probs, float r) noexcept
{
  if (probs.empty())
    return 0;

  float acc = 0.f;
  for (std::size_t i = 0; i < probs.size(); ++i)
  {
    acc += probs[i];
    if (r < acc)
      return i;
  }

  // Rounding left the sum below the draw: never pick a filtered-out entry
  for (std::size_t i = probs.size(); i-- > 0;)
  {
    if (probs[i] > 0.f)
      return i;
  }
  return probs.size() - 1;
}

void apply_temperature(std::span<float> logits, float temperature) noexcept
{
  if (temperature <= 0.f || temperature == 1.f)
    return;

  for (float& logit : logits)
    logit /= temperature;
}

void apply_top_k(std::span<float> logits, int k)
{
  if (k <= 0 || std::size_t(k) >= logits.size())
    return;

  std::vector<std::pair<float, std::size_t>> indexed;
  indexed.reserve(logits.size());
  for (std::size_t i = 0; i < logits.size(); ++i)
    indexed.emplace_back(logits[i], i);

  std::partial_sort(
      indexed.begin(), indexed.begin() + k, indexed.end(),
      [](const auto& a, const auto& b) { return a.first > b.first; });

  for (std::size_t i = k; i < indexed.size(); ++i)
    logits[indexed[i].second] = -std::numeric_limits<float>::infinity();
}

void apply_top_p(std::span<float> logits, float p)
{
  if (p <= 0.f || p >= 1.f || logits.empty())
    return;

  std::vector<float> probs(logits.begin(), logits.end());
  softmax(probs);

  std::vector<std::pair<float, std::size_t>> indexed;
  indexed.reserve(probs.size());
  for (std::size_t i = 0; i < probs.size(); ++i)
    indexed.emplace_back(probs[i], i);

  std::sort(indexed.begin(), indexed.end(),
      [](const auto& a, const auto& b) { return a.first > b.first; });

  // Keep the smallest prefix whose mass exceeds p
  std::size_t cutoff = indexed.size();
  float cumSum = 0.f;
  for (std::size_t i = 0; i < indexed.size(); ++i)
  {
    cumSum += indexed[i].first;
    if (cumSum > p)
    {
      cutoff = i + 1;
      break;
    }
  }

  for (std::size_t i = cutoff; i < indexed.size(); ++i)
    logits[indexed[i].second] = -std::numeric_limits<float>::infinity();
}

bool is_cache_slot(std::string_view name) noexcept
{
  return name.find("past") != std::string_view::npos
         || name.find("cache") != std::string_view::npos;
}

std::vector<int64_t> zero_slot_shape(const SlotInfo& slot, int64_t sequenceLength)
{
  const bool isCache = is_cache_slot(slot.name);
  const std::size_t rank = slot.shape.size();

  std::vector<int64_t> shape(rank);
  for (std::size_t i = 0; i < rank; ++i)
  {
    const int64_t d = slot.shape[i];
    if (d > 0)
    {
      shape[i] = d;
      continue;
    }

    if (i == 0)
      shape[i] = 1;
    else if (isCache)
      shape[i] = 0;
    else
      shape[i] = 1;

    if (!isCache && i == rank - 1 && sequenceLength > 0)
      shape[i] = sequenceLength;
  }
  return shape;
}
}
