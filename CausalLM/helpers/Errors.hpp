#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace CausalLM
{
enum class ErrorCode
{
  ConfigurationError,
  UnsupportedLayerType,
  GraphIntrospectionError,
  UnsupportedBatchSize,
  GraphExecutionError,
  MissingLogitsOutput,
  UnexpectedLogitsType,
  UnexpectedLogitsShape,
  TensorConstructionError,
  InvalidInput,
  TokenizerError,
  NotFound,
  AssetRetrievalError,
  RuntimeUnavailable,
};

constexpr std::string_view errorCodeName(ErrorCode c) noexcept
{
  switch (c)
  {
    case ErrorCode::ConfigurationError:
      return "ConfigurationError";
    case ErrorCode::UnsupportedLayerType:
      return "UnsupportedLayerType";
    case ErrorCode::GraphIntrospectionError:
      return "GraphIntrospectionError";
    case ErrorCode::UnsupportedBatchSize:
      return "UnsupportedBatchSize";
    case ErrorCode::GraphExecutionError:
      return "GraphExecutionError";
    case ErrorCode::MissingLogitsOutput:
      return "MissingLogitsOutput";
    case ErrorCode::UnexpectedLogitsType:
      return "UnexpectedLogitsType";
    case ErrorCode::UnexpectedLogitsShape:
      return "UnexpectedLogitsShape";
    case ErrorCode::TensorConstructionError:
      return "TensorConstructionError";
    case ErrorCode::InvalidInput:
      return "InvalidInput";
    case ErrorCode::TokenizerError:
      return "TokenizerError";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AssetRetrievalError:
      return "AssetRetrievalError";
    case ErrorCode::RuntimeUnavailable:
      return "RuntimeUnavailable";
  }
  return "Unknown";
}

/// Every failure of the library is reported as a CausalLM::Error.
/// what() is prefixed with the error code name.
class Error : public std::runtime_error
{
public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(
          std::string(errorCodeName(code)) + ": " + message)
      , m_code{code}
  {
  }

  ErrorCode code() const noexcept { return m_code; }

private:
  ErrorCode m_code;
};
}
