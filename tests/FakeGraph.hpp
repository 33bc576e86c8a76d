#pragma once

#include <CausalLM/helpers/Graph.hpp>
#include <CausalLM/helpers/Tokenizer.hpp>

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace CausalLM::Testing
{
struct TensorCounters
{
  int created{};
  int released{};
  int alive() const noexcept { return created - released; }
};

class FakeTensor final : public Tensor
{
public:
  FakeTensor(
      std::shared_ptr<TensorCounters> c,
      ElementType type,
      std::vector<int64_t> shape)
      : counters{std::move(c)}
      , type{type}
      , dims{std::move(shape)}
  {
    ++counters->created;
  }

  ~FakeTensor() override { ++counters->released; }

  ElementType elementType() const override { return type; }
  std::vector<int64_t> shape() const override { return dims; }
  void readFloats(std::size_t offset, std::span<float> out) const override
  {
    if (offset + out.size() > floats.size())
      throw std::out_of_range("read past the end");
    std::copy_n(floats.begin() + offset, out.size(), out.begin());
  }

  std::shared_ptr<TensorCounters> counters;
  ElementType type;
  std::vector<int64_t> dims;
  std::vector<int64_t> ints;
  std::vector<float> floats;
};

struct RunRecord
{
  std::vector<std::string> inputNames;
  std::vector<std::vector<int64_t>> shapes;
  std::vector<ElementType> types;
  std::vector<std::vector<int64_t>> ints;
  int aliveDuringRun{};
};

/**
 * Stands in for the execution engine. The "model" maps the token
 * sequence to the logits row of the last position.
 */
class FakeGraph final : public Graph
{
public:
  using Model = std::function<std::vector<float>(const std::vector<int64_t>&)>;

  FakeGraph(GraphSignature sig, Model model)
      : counters{std::make_shared<TensorCounters>()}
      , sig{std::move(sig)}
      , model{std::move(model)}
  {
  }

  const GraphSignature& signature() const override { return sig; }

  TensorPtr createInt64(
      std::span<const int64_t> data,
      std::span<const int64_t> shape) const override
  {
    maybeFail();
    auto t = std::make_unique<FakeTensor>(
        counters, ElementType::Int64,
        std::vector<int64_t>(shape.begin(), shape.end()));
    t->ints.assign(data.begin(), data.end());
    return t;
  }

  TensorPtr createFloat32(
      std::span<const float> data,
      std::span<const int64_t> shape) const override
  {
    maybeFail();
    auto t = std::make_unique<FakeTensor>(
        counters, ElementType::Float32,
        std::vector<int64_t>(shape.begin(), shape.end()));
    t->floats.assign(data.begin(), data.end());
    return t;
  }

  TensorPtr
  createZeros(ElementType type, std::span<const int64_t> shape) const override
  {
    maybeFail();
    return std::make_unique<FakeTensor>(
        counters, type, std::vector<int64_t>(shape.begin(), shape.end()));
  }

  std::vector<TensorPtr> run(
      std::span<const std::string> inputNames,
      std::span<const Tensor* const> inputs,
      std::span<const std::string> outputNames) const override
  {
    RunRecord rec;
    rec.aliveDuringRun = counters->alive();
    std::vector<int64_t> tokens;
    for (std::size_t i = 0; i < inputs.size(); ++i)
    {
      auto t = static_cast<const FakeTensor*>(inputs[i]);
      rec.inputNames.push_back(inputNames[i]);
      rec.shapes.push_back(t->dims);
      rec.types.push_back(t->type);
      rec.ints.push_back(t->ints);
      if (inputNames[i] == "input_ids")
        tokens = t->ints;
    }
    runs.push_back(rec);

    if (failRun)
      throw std::runtime_error("engine failure");

    const std::vector<float> row = model(tokens);
    const auto length = static_cast<int64_t>(tokens.size());
    const auto vocab = static_cast<int64_t>(row.size());

    std::vector<TensorPtr> outputs;
    for (const auto& name : outputNames)
    {
      if (name == "logits" && dropLogits)
        continue;
      if (name == "logits")
      {
        std::vector<int64_t> shape{1, length, vocab};
        if (flatLogits)
          shape = {length * vocab};
        auto t = std::make_unique<FakeTensor>(counters, logitsType, shape);
        t->floats.assign(length * vocab, 0.f);
        std::copy(row.begin(), row.end(), t->floats.end() - vocab);
        outputs.push_back(std::move(t));
      }
      else
      {
        outputs.push_back(std::make_unique<FakeTensor>(
            counters, ElementType::Float32, std::vector<int64_t>{1}));
      }
    }
    return outputs;
  }

  std::shared_ptr<TensorCounters> counters;
  mutable std::vector<RunRecord> runs;

  // Failure injection
  int failOnCreate{-1};
  bool failRun{false};
  bool dropLogits{false};
  bool flatLogits{false};
  ElementType logitsType{ElementType::Float32};

private:
  void maybeFail() const
  {
    if (failOnCreate >= 0 && counters->created == failOnCreate)
      throw std::runtime_error("out of memory");
  }

  GraphSignature sig;
  Model model;
};

inline GraphSignature simpleSignature()
{
  return GraphSignature{
      .inputs
      = {{"input_ids", ElementType::Int64, {-1, -1}},
         {"attention_mask", ElementType::Int64, {-1, -1}}},
      .outputs = {{"logits", ElementType::Float32, {-1, -1, -1}}}};
}

/// Always predicts `token` out of a vocabulary of `vocab` entries.
inline FakeGraph::Model constantModel(int64_t token, int64_t vocab = 8)
{
  return [=](const std::vector<int64_t>&) {
    std::vector<float> row(vocab, 0.f);
    row[token] = 1.f;
    return row;
  };
}

/// Predicts the tokens of `script` in order, then `fallback`.
inline FakeGraph::Model scriptedModel(
    std::size_t promptLength,
    std::vector<int64_t> script,
    int64_t fallback = 0,
    int64_t vocab = 16)
{
  return [=](const std::vector<int64_t>& tokens) {
    const std::size_t step = tokens.size() - promptLength;
    const int64_t next = step < script.size() ? script[step] : fallback;
    std::vector<float> row(vocab, 0.f);
    row[next] = 1.f;
    return row;
  };
}

/// Table-driven tokenizer: each id decodes to its table entry, each
/// byte of encoded text becomes one id.
class FakeTokenizer final : public Tokenizer
{
public:
  std::map<int64_t, std::string> pieces;
  std::vector<int64_t> failingIds;

  std::vector<int64_t> encode(std::string_view text, bool) const override
  {
    std::vector<int64_t> ids;
    for (unsigned char c : text)
      ids.push_back(c);
    return ids;
  }

  std::string decode(std::span<const int64_t> ids) const override
  {
    std::string res;
    for (auto id : ids)
    {
      if (std::find(failingIds.begin(), failingIds.end(), id)
          != failingIds.end())
        throw std::runtime_error("cannot decode");
      auto it = pieces.find(id);
      res += it != pieces.end() ? it->second : "";
    }
    return res;
  }
};
}
