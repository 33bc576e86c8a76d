#pragma once

#include <string>
#include <vector>

namespace CausalLM
{
/**
 * Makes sure the onnxruntime shared library can be used before any
 * graph is loaded.
 *
 * When the library is linked normally, ensure() only reports where it
 * was loaded from. With CAUSAL_LM_ORT_MANUAL_INIT the library is opened
 * at runtime from $ONNXRUNTIME_SHARED_LIBRARY_PATH or from the
 * candidate paths, and the onnxruntime C++ API is initialized from it.
 */
class RuntimeBootstrap
{
public:
  // Throws RuntimeUnavailable
  static std::string ensure();

  static std::vector<std::string> candidatePaths();
};
}
