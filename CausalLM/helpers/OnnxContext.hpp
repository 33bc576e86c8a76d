#pragma once
#include <CausalLM/helpers/Graph.hpp>

#include <onnxruntime_cxx_api.h>

#include <string>

namespace CausalLM
{
struct Options
{
  // "default" picks the best available provider, then "cuda", "coreml", "cpu"
  std::string provider = "default";
  int device_id = 0;
  // 0 lets onnxruntime decide
  int intra_op_threads = 0;
};

Ort::SessionOptions create_session_options(const Options& opts);

// The process-wide onnxruntime environment, created on first use.
Ort::Env& ort_environment();

ElementType toElementType(ONNXTensorElementDataType t) noexcept;

/// Reads declared inputs and outputs of a graph file.
/// Throws GraphIntrospectionError when the file cannot be loaded, and
/// RuntimeUnavailable when onnxruntime itself cannot be loaded.
GraphSignature readGraphSignature(const std::string& modelPath);

class OrtTensor final : public Tensor
{
public:
  explicit OrtTensor(Ort::Value v) noexcept
      : value{std::move(v)}
  {
  }

  ElementType elementType() const override;
  std::vector<int64_t> shape() const override;
  void readFloats(std::size_t offset, std::span<float> out) const override;

  Ort::Value value;
};

/**
 * Graph backed by an onnxruntime session.
 *
 * External weight files ("model.onnx_data") are found by onnxruntime
 * next to the model file, they only need to be present on disk.
 */
class OrtGraph final : public Graph
{
public:
  explicit OrtGraph(const std::string& modelPath, const Options& opts = {});

  const GraphSignature& signature() const override { return m_signature; }

  TensorPtr createInt64(
      std::span<const int64_t> data,
      std::span<const int64_t> shape) const override;
  TensorPtr createFloat32(
      std::span<const float> data,
      std::span<const int64_t> shape) const override;
  TensorPtr
  createZeros(ElementType type, std::span<const int64_t> shape) const override;

  std::vector<TensorPtr> run(
      std::span<const std::string> inputNames,
      std::span<const Tensor* const> inputs,
      std::span<const std::string> outputNames) const override;

private:
  Ort::SessionOptions session_options;
  Ort::Session session;
  Ort::AllocatorWithDefaultOptions allocator;

  GraphSignature m_signature;
};
}
