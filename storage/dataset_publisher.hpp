#ifndef GEOHARVEST_DATASET_PUBLISHER_H_
#define GEOHARVEST_DATASET_PUBLISHER_H_

#include "harvest/RecordSink.h"
#include "geoparquet_writer.hpp"

#include <string>

class HubUploader;

struct PublishOptions {
  std::string output_dir = ".";
  /* Location of the file inside the dataset repository */
  std::string repo_dir = "chunks";
  GeoParquetOptions parquet;
};

/**
 * Export collaborator of the address pipeline: writes the records as a
 * GeoParquet file and hands it to the hub uploader, when one is given.
 */
class DatasetPublisher final : public RecordSink {
 public:
  DatasetPublisher(PublishOptions options, HubUploader* uploader);

  /** Throws `runtime_error` if the file cannot be built, written or
    * uploaded. */
  void publish(const RecordSet& records,
               const std::string& chunkName) override;

  /** Where the last published file was written. */
  const std::string& lastPath() const { return last_path_; }

 private:
  PublishOptions options_;
  HubUploader* uploader_;
  std::string last_path_;
};

/** `dir/name` without doubling the separator. */
std::string JoinPath(const std::string& dir, const std::string& name);

#endif // GEOHARVEST_DATASET_PUBLISHER_H_
