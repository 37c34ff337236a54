#include "hub_uploader.hpp"

#include <arrow/status.h>
#include <arrow/result.h>
#include <fmt/format.h>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <folly/dynamic.h>
#include <folly/io/async/EventBase.h>
#include <folly/json.h>
#include <folly/ssl/OpenSSLHash.h>
#include <glog/logging.h>
#include <proxygen/lib/utils/Base64.h>

#include <array>
#include <cerrno>

using folly::dynamic;
using folly::ssl::OpenSSLHash;
using proxygen::Base64;
using Status = arrow::Status;
template <class T> using Result = arrow::Result<T>;

static constexpr size_t kSampleBytes = 512;
static constexpr size_t kErrorExcerpt = 256;
static constexpr const char* kLfsMediaType = "application/vnd.git-lfs+json";

static Result<dynamic> ParseReply(const HttpRequest& request,
                                  const HttpResponse& response)
{
  try {
    return folly::parseJson(response.body);
  } catch (const folly::json::parse_error& e) {
    return Status::IOError(request.method, ' ', request.url,
                           ": reply is not JSON");
  }
}

static std::string RepoPrefix(const std::string& repo_type) {
  if (repo_type == "model")
    return "";
  return repo_type + "s/";
}

HubUploader::HubUploader(HttpTransport* transport, folly::EventBase* evb,
                         HubTarget target)
  : transport_(transport)
  , evb_(evb)
  , target_(std::move(target))
{
}

std::string HubUploader::ApiUrl(const std::string& op) const {
  return fmt::format("{}/api/{}{}/{}/{}", target_.endpoint,
                     RepoPrefix(target_.repo_type), target_.repo_id, op,
                     folly::uriEscape<std::string>(target_.revision));
}

Status HubUploader::Upload(const std::string& local_path,
                           const std::string& path_in_repo,
                           const std::string& summary)
{
  if (target_.token.empty())
    return Status::Invalid("no hub token, set HF_TOKEN");
  if (target_.repo_id.empty())
    return Status::Invalid("no hub repository configured");

  std::string contents;
  if (!folly::readFile(local_path.c_str(), contents))
    return Status::IOError("cannot read ", local_path, ": ",
                           folly::errnoStr(errno));

  std::array<uint8_t, 32> digest;
  OpenSSLHash::sha256(folly::range(digest),
                      folly::ByteRange(folly::StringPiece(contents)));
  std::string oid = folly::hexlify(
      folly::ByteRange(digest.data(), digest.size()));

  ARROW_ASSIGN_OR_RAISE(std::string mode, Preupload(path_in_repo, contents));
  const bool lfs = mode == "lfs";
  if (lfs)
    ARROW_RETURN_NOT_OK(UploadLfs(contents, oid));

  std::string message = summary.empty()
    ? fmt::format("Upload {}", path_in_repo) : summary;
  ARROW_RETURN_NOT_OK(Commit(path_in_repo, contents, lfs, oid, message));

  LOG(INFO) << "uploaded " << local_path << " to " << target_.repo_id << ':'
            << path_in_repo << " (" << contents.size() << " bytes, "
            << mode << ")";
  return Status::OK();
}

Result<std::string> HubUploader::Preupload(const std::string& path_in_repo,
                                           const std::string& contents)
{
  folly::StringPiece sample(contents);
  sample = sample.subpiece(0, kSampleBytes);

  HttpRequest req;
  req.method = "POST";
  req.url = ApiUrl("preupload");
  req.headers.emplace_back("Content-Type", "application/json");
  req.body = folly::toJson(dynamic::object
    ("files", dynamic::array(dynamic::object
      ("path", path_in_repo)
      ("size", static_cast<int64_t>(contents.size()))
      ("sample", Base64::encode(folly::ByteRange(sample))))));

  ARROW_ASSIGN_OR_RAISE(HttpResponse resp, Call(req));
  ARROW_ASSIGN_OR_RAISE(dynamic reply, ParseReply(req, resp));

  const dynamic* files = reply.get_ptr("files");
  if (files && files->isArray()) {
    for (const dynamic& file : *files) {
      if (file.getDefault("path", "").asString() != path_in_repo)
        continue;
      if (file.getDefault("shouldIgnore", false).asBool())
        return Status::Invalid(path_in_repo, " is ignored by the repository");
      dynamic mode = file.getDefault("uploadMode", "regular");
      if (!mode.isString())
        break;
      return mode.getString();
    }
  }
  return Status::IOError("preupload reply does not mention ", path_in_repo);
}

Status HubUploader::UploadLfs(const std::string& contents,
                              const std::string& oid)
{
  const int64_t size = static_cast<int64_t>(contents.size());

  HttpRequest batch;
  batch.method = "POST";
  batch.url = fmt::format("{}/{}{}.git/info/lfs/objects/batch",
                          target_.endpoint, RepoPrefix(target_.repo_type),
                          target_.repo_id);
  batch.headers.emplace_back("Accept", kLfsMediaType);
  batch.headers.emplace_back("Content-Type", kLfsMediaType);
  batch.body = folly::toJson(dynamic::object
    ("operation", "upload")
    ("transfers", dynamic::array("basic"))
    ("objects", dynamic::array(dynamic::object("oid", oid)("size", size)))
    ("hash_algo", "sha256"));

  ARROW_ASSIGN_OR_RAISE(HttpResponse resp, Call(batch));
  ARROW_ASSIGN_OR_RAISE(dynamic reply, ParseReply(batch, resp));

  const dynamic* objects = reply.get_ptr("objects");
  if (!objects || !objects->isArray() || objects->empty())
    return Status::IOError("LFS batch reply has no objects");
  const dynamic& object = (*objects)[0];

  if (const dynamic* error = object.get_ptr("error")) {
    return Status::IOError("LFS batch rejected ", oid, ": ",
                           folly::toJson(*error));
  }

  const dynamic* actions = object.get_ptr("actions");
  const dynamic* upload = actions ? actions->get_ptr("upload") : nullptr;
  if (!upload) {
    LOG(INFO) << "LFS object " << oid << " already stored";
    return Status::OK();
  }

  dynamic upload_header = upload->getDefault("header", dynamic::object);
  if (upload_header.get_ptr("chunk_size"))
    return Status::NotImplemented("multipart LFS upload requested for ", oid);

  HttpRequest put;
  put.method = "PUT";
  put.url = upload->getDefault("href", "").asString();
  if (put.url.empty())
    return Status::IOError("LFS upload action without href");
  for (const auto& kv : upload_header.items())
    put.headers.emplace_back(kv.first.asString(), kv.second.asString());
  put.body = contents;
  ARROW_RETURN_NOT_OK(Call(std::move(put), /*authorize=*/false).status());

  const dynamic* verify = actions->get_ptr("verify");
  if (!verify)
    return Status::OK();

  HttpRequest check;
  check.method = "POST";
  check.url = verify->getDefault("href", "").asString();
  check.headers.emplace_back("Content-Type", kLfsMediaType);
  dynamic verify_header = verify->getDefault("header", dynamic::object);
  for (const auto& kv : verify_header.items())
    check.headers.emplace_back(kv.first.asString(), kv.second.asString());
  check.body = folly::toJson(dynamic::object("oid", oid)("size", size));
  return Call(std::move(check)).status();
}

Status HubUploader::Commit(const std::string& path_in_repo,
                           const std::string& contents, bool lfs,
                           const std::string& oid, const std::string& summary)
{
  dynamic header = dynamic::object
    ("key", "header")
    ("value", dynamic::object("summary", summary)("description", ""));

  dynamic file = lfs
    ? dynamic(dynamic::object
        ("key", "lfsFile")
        ("value", dynamic::object
          ("path", path_in_repo)
          ("algo", "sha256")
          ("oid", oid)
          ("size", static_cast<int64_t>(contents.size()))))
    : dynamic(dynamic::object
        ("key", "file")
        ("value", dynamic::object
          ("content", Base64::encode(folly::ByteRange(
              folly::StringPiece(contents))))
          ("path", path_in_repo)
          ("encoding", "base64")));

  HttpRequest req;
  req.method = "POST";
  req.url = ApiUrl("commit");
  req.headers.emplace_back("Content-Type", "application/x-ndjson");
  req.body = folly::toJson(header) + '\n' + folly::toJson(file) + '\n';

  ARROW_ASSIGN_OR_RAISE(HttpResponse resp, Call(req));
  auto reply = ParseReply(req, resp);
  if (reply.ok() && reply->isObject()) {
    LOG(INFO) << "commit: " << reply->getDefault("commitUrl", "?").asString();
  }
  return Status::OK();
}

Result<HttpResponse> HubUploader::Call(HttpRequest request, bool authorize) {
  if (authorize)
    request.headers.emplace_back("Authorization", "Bearer " + target_.token);

  const std::string what = request.method + ' ' + request.url;
  VLOG(1) << what;

  folly::Try<HttpResponse> result =
    transport_->send(std::move(request)).via(evb_).getTryVia(evb_);
  if (result.hasException())
    return Status::IOError(what, ": ", result.exception().what().toStdString());

  HttpResponse& resp = result.value();
  if (!resp.ok()) {
    folly::StringPiece excerpt(resp.body);
    return Status::IOError(what, ": HTTP ", resp.status, ": ",
                           excerpt.subpiece(0, kErrorExcerpt).str());
  }
  return std::move(resp);
}
