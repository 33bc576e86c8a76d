#include "RuntimeBootstrap.hpp"

#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>

#include <CausalLM/helpers/Errors.hpp>
#include <CausalLM/helpers/OnnxContext.hpp>

#include <dlfcn.h>

#include <mutex>

namespace CausalLM
{
namespace
{
#if !defined(CAUSAL_LM_ORT_MANUAL_INIT)
std::string locate_linked_runtime()
{
  Dl_info info{};
  if (dladdr(reinterpret_cast<void*>(&OrtGetApiBase), &info) == 0
      || !info.dli_fname)
    throw Error(
        ErrorCode::RuntimeUnavailable,
        "cannot locate the linked onnxruntime library");
  return info.dli_fname;
}
#else
std::string load_runtime()
{
  std::vector<std::string> paths;
  if (qEnvironmentVariableIsSet("ONNXRUNTIME_SHARED_LIBRARY_PATH"))
    paths.push_back(
        qEnvironmentVariable("ONNXRUNTIME_SHARED_LIBRARY_PATH").toStdString());
  else
    paths = RuntimeBootstrap::candidatePaths();

  for (const auto& path : paths)
  {
    void* lib = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!lib)
      continue;

    auto get_api_base = reinterpret_cast<decltype(&::OrtGetApiBase)>(
        dlsym(lib, "OrtGetApiBase"));
    if (!get_api_base)
    {
      dlclose(lib);
      continue;
    }

    const OrtApi* api = get_api_base()->GetApi(ORT_API_VERSION);
    if (!api)
    {
      qWarning() << path.c_str() << "does not provide API version"
                 << ORT_API_VERSION;
      dlclose(lib);
      continue;
    }

    // The library stays loaded for the lifetime of the process
    Ort::InitApi(api);
    return path;
  }

  throw Error(
      ErrorCode::RuntimeUnavailable, "could not load libonnxruntime");
}
#endif
}

std::vector<std::string> RuntimeBootstrap::candidatePaths()
{
#if defined(__APPLE__)
  const char* lib = "libonnxruntime.dylib";
#else
  const char* lib = "libonnxruntime.so.1";
#endif
  std::vector<std::string> paths{lib, std::string("lib/") + lib};
  if (QCoreApplication::instance())
  {
    const std::string exe
        = QCoreApplication::applicationDirPath().toStdString();
    paths.push_back(exe + "/" + lib);
    paths.push_back(exe + "/../lib/" + lib);
  }
  return paths;
}

std::string RuntimeBootstrap::ensure()
{
  static std::mutex mutex;
  static std::string loaded;
  std::lock_guard lock{mutex};
  if (!loaded.empty())
    return loaded;

  if (qEnvironmentVariableIsSet("ONNXRUNTIME_SHARED_LIBRARY_PATH")
      && !QFileInfo::exists(
          qEnvironmentVariable("ONNXRUNTIME_SHARED_LIBRARY_PATH")))
    throw Error(
        ErrorCode::RuntimeUnavailable,
        "ONNXRUNTIME_SHARED_LIBRARY_PATH points to a missing file");

#if defined(CAUSAL_LM_ORT_MANUAL_INIT)
  loaded = load_runtime();
#else
  loaded = locate_linked_runtime();
#endif

  qDebug() << "Using onnxruntime" << Ort::GetVersionString().c_str() << "from"
           << loaded.c_str();
  return loaded;
}
}
