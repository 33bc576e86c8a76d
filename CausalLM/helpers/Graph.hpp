#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace CausalLM
{
enum class ElementType
{
  Float32,
  Float16,
  Int64,
  Int32,
  Other
};

constexpr bool isFloatingPoint(ElementType t) noexcept
{
  return t == ElementType::Float32 || t == ElementType::Float16;
}

// Name, element type and declared dimensions of a graph input or output.
// Negative dimensions are dynamic.
struct SlotInfo
{
  std::string name;
  ElementType elementType{ElementType::Other};
  std::vector<int64_t> shape;
};

struct GraphSignature
{
  std::vector<SlotInfo> inputs;
  std::vector<SlotInfo> outputs;
};

/**
 * A typed, shaped buffer owned by the execution engine.
 * Destroying the object releases the underlying engine value.
 */
class Tensor
{
public:
  virtual ~Tensor() = default;

  virtual ElementType elementType() const = 0;
  virtual std::vector<int64_t> shape() const = 0;

  // Copies out.size() floating-point values starting at element `offset`,
  // converting from the stored precision. Only valid on floating-point tensors.
  virtual void readFloats(std::size_t offset, std::span<float> out) const = 0;
};

using TensorPtr = std::unique_ptr<Tensor>;

/**
 * A loaded, immutable computation graph.
 *
 * Tensor factories copy the caller's data, so the source buffers may be
 * modified or freed as soon as they return. run() is const and may be called
 * from several threads when the engine allows it.
 */
class Graph
{
public:
  virtual ~Graph() = default;

  virtual const GraphSignature& signature() const = 0;

  virtual TensorPtr createInt64(
      std::span<const int64_t> data,
      std::span<const int64_t> shape) const
      = 0;
  virtual TensorPtr createFloat32(
      std::span<const float> data,
      std::span<const int64_t> shape) const
      = 0;
  virtual TensorPtr
  createZeros(ElementType type, std::span<const int64_t> shape) const
      = 0;

  // Returns one tensor per requested output name, in the same order.
  virtual std::vector<TensorPtr> run(
      std::span<const std::string> inputNames,
      std::span<const Tensor* const> inputs,
      std::span<const std::string> outputNames) const
      = 0;
};
}
