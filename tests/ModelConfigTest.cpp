#include <gtest/gtest.h>

#include <CausalLM/helpers/Errors.hpp>
#include <CausalLM/helpers/ModelConfig.hpp>

#include <QFile>
#include <QTemporaryDir>

using namespace CausalLM;

TEST(ModelConfigTest, ReadsHybridConfig)
{
  const auto cfg = ModelConfig::fromJson(R"({
    "model_type": "lfm2",
    "vocab_size": 65536,
    "eos_token_id": 7,
    "bos_token_id": 1,
    "pad_token_id": 0,
    "num_hidden_layers": 3,
    "num_attention_heads": 32,
    "num_key_value_heads": 8,
    "hidden_size": 1024,
    "conv_L_cache": 3,
    "layer_types": ["conv", "full_attention", "conv"]
  })");

  EXPECT_EQ(cfg.modelType, "lfm2");
  EXPECT_EQ(cfg.vocabSize, 65536);
  EXPECT_EQ(cfg.eosTokenId, 7);
  EXPECT_EQ(cfg.bosTokenId, 1);
  EXPECT_EQ(cfg.padTokenId, 0);
  EXPECT_EQ(cfg.numHiddenLayers, 3);
  EXPECT_EQ(cfg.numAttentionHeads, 32);
  EXPECT_EQ(cfg.numKeyValueHeads, 8);
  EXPECT_EQ(cfg.hiddenSize, 1024);
  EXPECT_EQ(cfg.convLCache, 3);
  EXPECT_EQ(
      cfg.layerTypes,
      (std::vector<std::string>{"conv", "full_attention", "conv"}));
}

TEST(ModelConfigTest, MissingFieldsKeepDefaults)
{
  const auto cfg
      = ModelConfig::fromJson(R"({"model_type": "llama", "conv_l_cache": 4})");
  EXPECT_EQ(cfg.eosTokenId, -1);
  EXPECT_EQ(cfg.bosTokenId, -1);
  EXPECT_EQ(cfg.convLCache, 4);
  EXPECT_TRUE(cfg.layerTypes.empty());
  EXPECT_TRUE(cfg.stopStrings.empty());
}

TEST(ModelConfigTest, FirstOfSeveralEosIds)
{
  const auto cfg = ModelConfig::fromJson(
      R"({"model_type": "llama", "eos_token_id": [128001, 128009]})");
  EXPECT_EQ(cfg.eosTokenId, 128001);
}

TEST(ModelConfigTest, RejectsMalformedConfig)
{
  for (const char* json : {"{", "[1, 2]", R"({"vocab_size": 10})"})
  {
    try
    {
      ModelConfig::fromJson(json);
      ADD_FAILURE() << "accepted " << json;
    }
    catch (const Error& e)
    {
      EXPECT_EQ(e.code(), ErrorCode::ConfigurationError);
    }
  }
}

TEST(ModelConfigTest, MissingFileIsConfigurationError)
{
  try
  {
    ModelConfig::fromFile("/nonexistent/config.json");
    FAIL() << "expected ConfigurationError";
  }
  catch (const Error& e)
  {
    EXPECT_EQ(e.code(), ErrorCode::ConfigurationError);
  }
}

TEST(ModelConfigTest, GenerationConfigOverrides)
{
  auto cfg = ModelConfig::fromJson(R"({"model_type": "qwen2", "eos_token_id": 2})");
  cfg.mergeGenerationConfig(
      R"({"eos_token_id": [151645, 151643], "stop": ["<|im_end|>", ""]})");

  EXPECT_EQ(cfg.eosTokenId, 151645);
  EXPECT_EQ(cfg.stopStrings, (std::vector<std::string>{"<|im_end|>"}));

  cfg.mergeGenerationConfig(R"({"stop": "</s>"})");
  EXPECT_EQ(cfg.stopStrings, (std::vector<std::string>{"</s>"}));
}

TEST(ModelConfigTest, BrokenGenerationConfigIsIgnored)
{
  auto cfg = ModelConfig::fromJson(R"({"model_type": "qwen2", "eos_token_id": 2})");
  cfg.mergeGenerationConfig("not json");
  cfg.mergeGenerationConfigFile("/nonexistent/generation_config.json");
  EXPECT_EQ(cfg.eosTokenId, 2);
}

TEST(ModelConfigTest, ReadsFromDisk)
{
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());

  QFile f{dir.filePath("config.json")};
  ASSERT_TRUE(f.open(QIODevice::WriteOnly));
  f.write(R"({"model_type": "gpt2", "eos_token_id": 50256})");
  f.close();

  const auto cfg = ModelConfig::fromFile(f.fileName());
  EXPECT_EQ(cfg.modelType, "gpt2");
  EXPECT_EQ(cfg.eosTokenId, 50256);
}
