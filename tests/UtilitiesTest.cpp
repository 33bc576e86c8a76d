#include <gtest/gtest.h>

#include <CausalLM/helpers/Utilities.hpp>

#include "FakeGraph.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

using namespace CausalLM;

TEST(UtilitiesTest, ArgmaxPicksLargest)
{
  const std::vector<float> row{0.1f, 2.5f, -1.f, 0.7f};
  EXPECT_EQ(argmax(row), 1u);
}

TEST(UtilitiesTest, ArgmaxTiesResolveToLowestIndex)
{
  const std::vector<float> row{1.f, 3.f, 0.f, 3.f, 3.f};
  EXPECT_EQ(argmax(row), 1u);
  EXPECT_EQ(argmax(row), 1u);
}

TEST(UtilitiesTest, ArgmaxOfEmptyRowIsZero)
{
  EXPECT_EQ(argmax(std::span<const float>{}), 0u);
}

TEST(UtilitiesTest, SoftmaxNormalizes)
{
  std::vector<float> row{1.f, 2.f, 3.f, 1000.f};
  softmax(row);
  EXPECT_NEAR(std::accumulate(row.begin(), row.end(), 0.f), 1.f, 1e-5f);
  EXPECT_GT(row[3], 0.99f);
  EXPECT_LT(row[0], row[1]);
  EXPECT_LT(row[1], row[2]);
}

TEST(UtilitiesTest, SampleFollowsCumulativeDistribution)
{
  const std::vector<float> probs{0.25f, 0.5f, 0.25f};
  EXPECT_EQ(sample_from_probabilities(probs, 0.f), 0u);
  EXPECT_EQ(sample_from_probabilities(probs, 0.24f), 0u);
  EXPECT_EQ(sample_from_probabilities(probs, 0.26f), 1u);
  EXPECT_EQ(sample_from_probabilities(probs, 0.74f), 1u);
  EXPECT_EQ(sample_from_probabilities(probs, 0.76f), 2u);
  EXPECT_EQ(sample_from_probabilities(probs, 0.9999999f), 2u);
  EXPECT_EQ(sample_from_probabilities(std::span<const float>{}, 0.5f), 0u);
}

TEST(UtilitiesTest, SampleNeverPicksMaskedEntryNearOne)
{
  std::vector<float> row(1000);
  for (std::size_t i = 0; i < row.size(); ++i)
    row[i] = float(row.size() - i) * 0.01f;
  apply_top_k(row, 10);
  softmax(row);
  ASSERT_EQ(row.back(), 0.f);

  const float r = std::nextafter(1.f, 0.f);
  const auto idx = sample_from_probabilities(row, r);
  EXPECT_LT(idx, 10u);
  EXPECT_GT(row[idx], 0.f);

  // Short sums must fall back to the last entry that can be sampled
  const std::vector<float> shortSum{0.2f, 0.3f, 0.f, 0.f};
  EXPECT_EQ(sample_from_probabilities(shortSum, 0.9f), 1u);
}

TEST(UtilitiesTest, TopKMasksEverythingElse)
{
  std::vector<float> row{0.f, 5.f, 1.f, 4.f, 2.f};
  apply_top_k(row, 2);
  EXPECT_EQ(row[1], 5.f);
  EXPECT_EQ(row[3], 4.f);
  EXPECT_TRUE(std::isinf(row[0]) && row[0] < 0);
  EXPECT_TRUE(std::isinf(row[2]) && row[2] < 0);
  EXPECT_TRUE(std::isinf(row[4]) && row[4] < 0);

  std::vector<float> untouched{1.f, 2.f};
  apply_top_k(untouched, 0);
  apply_top_k(untouched, 2);
  EXPECT_EQ(untouched, (std::vector<float>{1.f, 2.f}));
}

TEST(UtilitiesTest, TopPKeepsSmallestSufficientPrefix)
{
  std::vector<float> row{std::log(0.6f), std::log(0.3f), std::log(0.1f)};
  apply_top_p(row, 0.8f);
  EXPECT_FALSE(std::isinf(row[0]));
  EXPECT_FALSE(std::isinf(row[1]));
  EXPECT_TRUE(std::isinf(row[2]));
}

TEST(UtilitiesTest, TemperatureScalesLogits)
{
  std::vector<float> row{2.f, 4.f};
  apply_temperature(row, 2.f);
  EXPECT_EQ(row, (std::vector<float>{1.f, 2.f}));
  apply_temperature(row, 0.f);
  EXPECT_EQ(row, (std::vector<float>{1.f, 2.f}));
}

TEST(UtilitiesTest, CacheSlotNames)
{
  EXPECT_TRUE(is_cache_slot("past_key_values.0.key"));
  EXPECT_TRUE(is_cache_slot("past_conv.3"));
  EXPECT_TRUE(is_cache_slot("cache_position"));
  EXPECT_FALSE(is_cache_slot("token_type_ids"));
}

TEST(UtilitiesTest, ZeroSlotShapeForCacheInputs)
{
  const SlotInfo key{"past_key_values.0.key", ElementType::Float32, {-1, 8, -1, 64}};
  EXPECT_EQ(zero_slot_shape(key, 12), (std::vector<int64_t>{1, 8, 0, 64}));

  const SlotInfo conv{"past_conv.1", ElementType::Float32, {-1, 1024, 3}};
  EXPECT_EQ(zero_slot_shape(conv, 12), (std::vector<int64_t>{1, 1024, 3}));
}

TEST(UtilitiesTest, ZeroSlotShapeForSequenceInputs)
{
  const SlotInfo types{"token_type_ids", ElementType::Int64, {-1, -1}};
  EXPECT_EQ(zero_slot_shape(types, 7), (std::vector<int64_t>{1, 7}));

  const SlotInfo middle{"extra", ElementType::Float32, {-1, -1, 4}};
  EXPECT_EQ(zero_slot_shape(middle, 7), (std::vector<int64_t>{1, 1, 4}));
}

TEST(UtilitiesTest, MakeTensorWrapsEngineFailures)
{
  try
  {
    make_tensor("past_conv.0", []() -> TensorPtr {
      throw std::runtime_error("allocation failed");
    });
    FAIL() << "expected an exception";
  }
  catch (const Error& e)
  {
    EXPECT_EQ(e.code(), ErrorCode::TensorConstructionError);
    EXPECT_NE(std::string(e.what()).find("past_conv.0"), std::string::npos);
  }

  EXPECT_THROW(
      make_tensor("input_ids", [] { return TensorPtr{}; }), Error);
}

TEST(UtilitiesTest, MakeTensorBuildsTypedTensors)
{
  Testing::FakeGraph graph{Testing::simpleSignature(), Testing::constantModel(0)};

  const std::vector<float> values{0.5f, 1.5f, 2.5f, 3.5f};
  const std::vector<int64_t> shape{1, 2, 2};
  {
    auto t = make_tensor("hidden", [&] {
      return graph.createFloat32(values, shape);
    });
    EXPECT_EQ(t->elementType(), ElementType::Float32);
    EXPECT_EQ(t->shape(), shape);
    EXPECT_EQ(calculate_product(t->shape()), 4);

    std::vector<float> row(2);
    t->readFloats(2, row);
    EXPECT_EQ(row, (std::vector<float>{2.5f, 3.5f}));
    EXPECT_EQ(graph.counters->alive(), 1);
  }
  EXPECT_EQ(graph.counters->alive(), 0);
}
