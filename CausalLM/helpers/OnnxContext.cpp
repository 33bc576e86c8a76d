#include "OnnxContext.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QString>

#include <CausalLM/helpers/Debug.hpp>
#include <CausalLM/helpers/Errors.hpp>
#include <CausalLM/helpers/RuntimeBootstrap.hpp>
#include <CausalLM/helpers/Utilities.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <format>

namespace CausalLM
{
namespace
{
std::basic_string<ORTCHAR_T> toOrtPath(const std::string& path)
{
#if defined(_WIN32)
  return QString::fromStdString(path).toStdWString();
#else
  return path;
#endif
}

std::vector<std::string> available_providers()
{
  auto p = Ort::GetAvailableProviders();
  for (std::string& s : p)
  {
    if (s.ends_with("ExecutionProvider"))
      s.resize(s.size() - strlen("ExecutionProvider"));
    for (char& c : s)
      c = std::tolower(c);
  }
  return p;
}

void append_cuda(Ort::SessionOptions& session_options, int device_id)
{
  const OrtApi& api = Ort::GetApi();
  OrtCUDAProviderOptionsV2* cuda_options = nullptr;
  Ort::ThrowOnError(api.CreateCUDAProviderOptions(&cuda_options));

  const std::string device = std::to_string(std::max(device_id, 0));
  const char* keys[] = {"device_id", "arena_extend_strategy"};
  const char* values[] = {device.c_str(), "kSameAsRequested"};

  OrtStatus* status
      = api.UpdateCUDAProviderOptions(cuda_options, keys, values, 2);
  if (!status)
    status = api.SessionOptionsAppendExecutionProvider_CUDA_V2(
        session_options, cuda_options);
  api.ReleaseCUDAProviderOptions(cuda_options);
  Ort::ThrowOnError(status);
}

SlotInfo slot_info(std::string name, const Ort::TypeInfo& type)
{
  SlotInfo slot{.name = std::move(name)};
  if (type.GetONNXType() == ONNX_TYPE_TENSOR)
  {
    auto tensor = type.GetTensorTypeAndShapeInfo();
    slot.elementType = toElementType(tensor.GetElementType());
    slot.shape = tensor.GetShape();
  }
  return slot;
}

GraphSignature read_signature(const Ort::Session& session)
{
  Ort::AllocatorWithDefaultOptions allocator;
  GraphSignature signature;

  for (std::size_t i = 0; i < session.GetInputCount(); i++)
  {
    std::string name = session.GetInputNameAllocated(i, allocator).get();
    signature.inputs.push_back(
        slot_info(std::move(name), session.GetInputTypeInfo(i)));
  }

  for (std::size_t i = 0; i < session.GetOutputCount(); i++)
  {
    std::string name = session.GetOutputNameAllocated(i, allocator).get();
    signature.outputs.push_back(
        slot_info(std::move(name), session.GetOutputTypeInfo(i)));
  }
  return signature;
}

std::size_t element_size(ElementType t) noexcept
{
  switch (t)
  {
    case ElementType::Float16:
      return 2;
    case ElementType::Int64:
      return 8;
    case ElementType::Float32:
    case ElementType::Int32:
    case ElementType::Other:
      break;
  }
  return 4;
}

ONNXTensorElementDataType to_onnx(ElementType t) noexcept
{
  switch (t)
  {
    case ElementType::Float16:
      return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16;
    case ElementType::Int64:
      return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64;
    case ElementType::Int32:
      return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32;
    case ElementType::Float32:
    case ElementType::Other:
      break;
  }
  return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT;
}

void check_graph_file(const std::string& modelPath)
{
  if (modelPath.empty() || !QFileInfo::exists(QString::fromStdString(modelPath)))
    throw Error(
        ErrorCode::GraphIntrospectionError,
        std::format("graph file '{}' does not exist", modelPath));
}

void check_count(std::size_t count, std::span<const int64_t> shape)
{
  if (std::ranges::any_of(shape, [](int64_t d) { return d < 0; })
      || int64_t(count) != calculate_product(shape))
    throw Error(
        ErrorCode::TensorConstructionError,
        std::format(
            "{} values do not fill a tensor of {} elements",
            count,
            calculate_product(shape)));
}
}

Ort::Env& ort_environment()
{
  static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "causal_lm");
  return env;
}

Ort::SessionOptions create_session_options(const Options& opts)
try
{
  Ort::SessionOptions session_options;
  if (opts.intra_op_threads > 0)
    session_options.SetIntraOpNumThreads(opts.intra_op_threads);

  const auto p = available_providers();
  for (const auto& s : p)
    qDebug() << "Available provider: " << s.c_str();

  auto has = [&](std::string_view name) {
    return std::ranges::find(p, name) != p.end();
  };

  std::string requested_provider = opts.provider;
  if (requested_provider == "default")
  {
    if (has("cuda"))
      requested_provider = "cuda";
#if defined(__APPLE__)
    else if (has("coreml"))
      requested_provider = "coreml";
#endif
    else
      requested_provider = "cpu";
  }

  if (requested_provider == "cuda" && has("cuda"))
  {
    append_cuda(session_options, opts.device_id);
  }
#if defined(__APPLE__)
  else if (requested_provider == "coreml" && has("coreml"))
  {
    std::unordered_map<std::string, std::string> options;
    options["MLComputeUnits"] = "ALL";
    options["RequireStaticInputShapes"] = "0";
    session_options.AppendExecutionProvider("CoreML", options);
  }
#endif
  else if (requested_provider != "cpu")
  {
    qWarning() << "Execution provider" << requested_provider.c_str()
               << "is not available, using CPU";
  }

  return session_options;
}
catch (const Ort::Exception& e)
{
  qWarning() << "Onnxruntime: falling back to CPU: " << e.what();
  return create_session_options(Options{
      .provider = "cpu",
      .device_id = 0,
      .intra_op_threads = opts.intra_op_threads});
}

ElementType toElementType(ONNXTensorElementDataType t) noexcept
{
  switch (t)
  {
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
      return ElementType::Float32;
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
      return ElementType::Float16;
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
      return ElementType::Int64;
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
      return ElementType::Int32;
    default:
      return ElementType::Other;
  }
}

GraphSignature readGraphSignature(const std::string& modelPath)
{
  check_graph_file(modelPath);
  RuntimeBootstrap::ensure();

  try
  {
    Ort::SessionOptions options;
    Ort::Session session(
        ort_environment(), toOrtPath(modelPath).c_str(), options);
    return read_signature(session);
  }
  catch (const Ort::Exception& e)
  {
    throw Error(
        ErrorCode::GraphIntrospectionError,
        std::format("cannot read '{}': {}", modelPath, e.what()));
  }
}

ElementType OrtTensor::elementType() const
{
  if (!value.IsTensor())
    return ElementType::Other;
  return toElementType(value.GetTensorTypeAndShapeInfo().GetElementType());
}

std::vector<int64_t> OrtTensor::shape() const
{
  if (!value.IsTensor())
    return {};
  return value.GetTensorTypeAndShapeInfo().GetShape();
}

void OrtTensor::readFloats(std::size_t offset, std::span<float> out) const
{
  const auto info = value.GetTensorTypeAndShapeInfo();
  if (offset + out.size() > info.GetElementCount())
    throw std::out_of_range("tensor read past the end of its data");

  switch (info.GetElementType())
  {
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
    {
      const float* data = value.GetTensorData<float>() + offset;
      std::copy_n(data, out.size(), out.begin());
      break;
    }
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
    {
      const Ort::Float16_t* data
          = value.GetTensorData<Ort::Float16_t>() + offset;
      for (std::size_t i = 0; i < out.size(); ++i)
        out[i] = data[i].ToFloat();
      break;
    }
    default:
      throw std::logic_error("tensor does not hold floating-point values");
  }
}

namespace
{
// The runtime must be usable before any onnxruntime object is created
Ort::SessionOptions
prepare_session_options(const std::string& modelPath, const Options& opts)
{
  check_graph_file(modelPath);
  RuntimeBootstrap::ensure();
  return create_session_options(opts);
}
}

OrtGraph::OrtGraph(const std::string& modelPath, const Options& opts)
    : session_options(prepare_session_options(modelPath, opts))
    , session{nullptr}
{
  try
  {
    session = Ort::Session(
        ort_environment(), toOrtPath(modelPath).c_str(), session_options);
    m_signature = read_signature(session);
  }
  catch (const Ort::Exception& e)
  {
    throw Error(
        ErrorCode::GraphIntrospectionError,
        std::format("cannot load '{}': {}", modelPath, e.what()));
  }

  qDebug() << "Loaded graph" << modelPath.c_str() << "with"
           << m_signature.inputs.size() << "inputs and"
           << m_signature.outputs.size() << "outputs";
}

TensorPtr OrtGraph::createInt64(
    std::span<const int64_t> data,
    std::span<const int64_t> shape) const
{
  check_count(data.size(), shape);
  auto value = Ort::Value::CreateTensor<int64_t>(
      allocator, shape.data(), shape.size());
  std::copy(data.begin(), data.end(), value.GetTensorMutableData<int64_t>());
  return std::make_unique<OrtTensor>(std::move(value));
}

TensorPtr OrtGraph::createFloat32(
    std::span<const float> data,
    std::span<const int64_t> shape) const
{
  check_count(data.size(), shape);
  auto value = Ort::Value::CreateTensor<float>(
      allocator, shape.data(), shape.size());
  std::copy(data.begin(), data.end(), value.GetTensorMutableData<float>());
  return std::make_unique<OrtTensor>(std::move(value));
}

TensorPtr
OrtGraph::createZeros(ElementType type, std::span<const int64_t> shape) const
{
  const int64_t count = calculate_product(shape);
  check_count(std::size_t(std::max<int64_t>(count, 0)), shape);

  auto value = Ort::Value::CreateTensor(
      allocator, shape.data(), shape.size(), to_onnx(type));
  if (count > 0)
    std::memset(
        value.GetTensorMutableRawData(), 0, count * element_size(type));
  return std::make_unique<OrtTensor>(std::move(value));
}

std::vector<TensorPtr> OrtGraph::run(
    std::span<const std::string> inputNames,
    std::span<const Tensor* const> inputs,
    std::span<const std::string> outputNames) const
{
  if (inputNames.size() != inputs.size())
    throw std::invalid_argument("input names and values differ in count");

  std::vector<const char*> input_names_char;
  std::vector<const OrtValue*> input_values;
  input_names_char.reserve(inputs.size());
  input_values.reserve(inputs.size());
  for (std::size_t i = 0; i < inputs.size(); i++)
  {
    auto t = dynamic_cast<const OrtTensor*>(inputs[i]);
    if (!t)
      throw std::invalid_argument(
          "input '" + inputNames[i] + "' was not created by this graph");
    input_names_char.push_back(inputNames[i].c_str());
    input_values.push_back(t->value);
  }

  std::vector<const char*> output_names_char;
  output_names_char.reserve(outputNames.size());
  for (const auto& name : outputNames)
    output_names_char.push_back(name.c_str());

  std::vector<OrtValue*> output_values(outputNames.size(), nullptr);
  Ort::ThrowOnError(Ort::GetApi().Run(
      session,
      nullptr,
      input_names_char.data(),
      input_values.data(),
      input_values.size(),
      output_names_char.data(),
      output_names_char.size(),
      output_values.data()));

  std::vector<TensorPtr> outputs;
  outputs.reserve(output_values.size());
  for (OrtValue* v : output_values)
    outputs.push_back(
        v ? std::make_unique<OrtTensor>(Ort::Value{v}) : TensorPtr{});
  return outputs;
}
}
