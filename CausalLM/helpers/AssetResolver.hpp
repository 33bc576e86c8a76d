#pragma once

#include <QString>

#include <map>
#include <span>
#include <string>
#include <string_view>

namespace CausalLM
{
/**
 * Resolves model files of a repository to local paths.
 *
 * Once a file is present locally, resolving it again must not touch
 * the origin.
 */
class AssetResolver
{
public:
  virtual ~AssetResolver() = default;

  // Throws NotFound when the origin does not have the file.
  virtual std::string
  fetch(std::string_view repoId, std::string_view filename) = 0;

  // Files the origin reports as absent are left out of the result.
  virtual std::map<std::string, std::string> fetchOptional(
      std::string_view repoId,
      std::span<const std::string> filenames)
      = 0;
};

struct HubSettings
{
  QString cacheRoot{"models"};
  QString endpoint{"https://huggingface.co"};
  bool offline{false};
  int transferTimeoutMs{60000};

  // $CACHE_DIR, $HF_ENDPOINT, $HF_HUB_OFFLINE
  static HubSettings fromEnvironment();
};

/// Downloads from a Hugging Face compatible hub into
/// <cacheRoot>/<repoId>/<filename>.
/// Downloading requires a QCoreApplication instance.
class HubAssetResolver final : public AssetResolver
{
public:
  explicit HubAssetResolver(HubSettings settings = HubSettings::fromEnvironment());

  std::string fetch(std::string_view repoId, std::string_view filename) override;
  std::map<std::string, std::string> fetchOptional(
      std::string_view repoId,
      std::span<const std::string> filenames) override;

  QString localPath(std::string_view repoId, std::string_view filename) const;

  const HubSettings& settings() const noexcept { return m_settings; }

private:
  // false when the origin answers 404
  bool download(std::string_view repoId, std::string_view filename, const QString& dest);

  HubSettings m_settings;
};
}
