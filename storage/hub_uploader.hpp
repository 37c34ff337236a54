#ifndef GEOHARVEST_HUB_UPLOADER_H_
#define GEOHARVEST_HUB_UPLOADER_H_

#include "harvest/HttpTransport.h"

#include <arrow/type_fwd.h>

#include <string>

namespace folly {
  class EventBase;
}

struct HubTarget {
  std::string endpoint = "https://huggingface.co";
  std::string repo_id;
  std::string repo_type = "dataset";
  std::string revision = "main";
  std::string token;
};

/**
 * Uploads single files into a dataset hub repository.
 *
 * The hub decides per file whether it is committed inline (base64 in the
 * commit payload) or stored through its LFS batch API first and committed
 * by its SHA-256. Calls block, driving `evb` until each request completes.
 */
class HubUploader {
 public:
  HubUploader(HttpTransport* transport, folly::EventBase* evb,
              HubTarget target);

  arrow::Status Upload(const std::string& local_path,
                       const std::string& path_in_repo,
                       const std::string& summary = "");

 private:
  arrow::Result<std::string> Preupload(const std::string& path_in_repo,
                                       const std::string& contents);
  arrow::Status UploadLfs(const std::string& contents, const std::string& oid);
  arrow::Status Commit(const std::string& path_in_repo,
                       const std::string& contents, bool lfs,
                       const std::string& oid, const std::string& summary);
  arrow::Result<HttpResponse> Call(HttpRequest request, bool authorize = true);

  std::string ApiUrl(const std::string& op) const;

  HttpTransport* transport_;
  folly::EventBase* evb_;
  HubTarget target_;
};

#endif // GEOHARVEST_HUB_UPLOADER_H_
