#include "AssetResolver.hpp"

#include <QDebug>
#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSaveFile>
#include <QUrl>

#include <CausalLM/helpers/Errors.hpp>

#include <format>
#include <memory>

namespace CausalLM
{
namespace
{
QString toQString(std::string_view s)
{
  return QString::fromUtf8(s.data(), qsizetype(s.size()));
}
}

HubSettings HubSettings::fromEnvironment()
{
  HubSettings s;
  if (qEnvironmentVariableIsSet("CACHE_DIR"))
    s.cacheRoot = qEnvironmentVariable("CACHE_DIR");
  if (qEnvironmentVariableIsSet("HF_ENDPOINT"))
    s.endpoint = qEnvironmentVariable("HF_ENDPOINT");
  s.offline = qEnvironmentVariableIntValue("HF_HUB_OFFLINE") != 0;
  return s;
}

HubAssetResolver::HubAssetResolver(HubSettings settings)
    : m_settings{std::move(settings)}
{
}

QString HubAssetResolver::localPath(
    std::string_view repoId,
    std::string_view filename) const
{
  return QDir::cleanPath(
      m_settings.cacheRoot + '/' + toQString(repoId) + '/' + toQString(filename));
}

std::string
HubAssetResolver::fetch(std::string_view repoId, std::string_view filename)
{
  const QString path = localPath(repoId, filename);
  if (QFileInfo::exists(path))
    return path.toStdString();

  if (!download(repoId, filename, path))
    throw Error(
        ErrorCode::NotFound,
        std::format("{} not found in {}", filename, repoId));
  return path.toStdString();
}

std::map<std::string, std::string> HubAssetResolver::fetchOptional(
    std::string_view repoId,
    std::span<const std::string> filenames)
{
  std::map<std::string, std::string> res;
  for (const auto& name : filenames)
  {
    if (name.empty())
      continue;

    const QString path = localPath(repoId, name);
    if (QFileInfo::exists(path) || download(repoId, name, path))
      res[name] = path.toStdString();
  }
  return res;
}

bool HubAssetResolver::download(
    std::string_view repoId,
    std::string_view filename,
    const QString& dest)
{
  if (m_settings.offline)
  {
    qDebug() << "Offline: not downloading" << dest;
    return false;
  }

  if (!QDir().mkpath(QFileInfo(dest).absolutePath()))
    throw Error(
        ErrorCode::AssetRetrievalError,
        "cannot create cache directory for " + dest.toStdString());

  const QUrl url{
      m_settings.endpoint + '/' + toQString(repoId) + "/resolve/main/"
      + toQString(filename)};

  QSaveFile file{dest};
  if (!file.open(QIODevice::WriteOnly))
    throw Error(
        ErrorCode::AssetRetrievalError,
        std::format(
            "cannot write {}: {}",
            dest.toStdString(),
            file.errorString().toStdString()));

  QNetworkAccessManager nam;
  QNetworkRequest req{url};
  req.setAttribute(
      QNetworkRequest::RedirectPolicyAttribute,
      QNetworkRequest::NoLessSafeRedirectPolicy);
  req.setTransferTimeout(m_settings.transferTimeoutMs);

  qDebug() << "Downloading" << url.toString();
  std::unique_ptr<QNetworkReply> reply{nam.get(req)};

  auto status = [&] {
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
  };

  // Redirect bodies are skipped, only the final 200 response is written
  QObject::connect(reply.get(), &QNetworkReply::readyRead, [&] {
    if (status() == 200)
      file.write(reply->readAll());
  });

  QEventLoop loop;
  QObject::connect(
      reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
  if (!reply->isFinished())
    loop.exec();

  const int code = status();
  if (code == 404)
  {
    file.cancelWriting();
    return false;
  }

  if (reply->error() != QNetworkReply::NoError || code != 200)
  {
    file.cancelWriting();
    throw Error(
        ErrorCode::AssetRetrievalError,
        std::format(
            "GET {} failed with status {}: {}",
            url.toString().toStdString(),
            code,
            reply->errorString().toStdString()));
  }

  file.write(reply->readAll());
  if (!file.commit())
    throw Error(
        ErrorCode::AssetRetrievalError,
        std::format(
            "cannot write {}: {}",
            dest.toStdString(),
            file.errorString().toStdString()));
  return true;
}
}
