#include "dataset_publisher.hpp"
#include "geo_table.hpp"
#include "hub_uploader.hpp"

#include <arrow/api.h>
#include <glog/logging.h>

#include <stdexcept>

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty())
    return name;
  if (dir.back() == '/')
    return dir + name;
  return dir + '/' + name;
}

DatasetPublisher::DatasetPublisher(PublishOptions options,
                                   HubUploader* uploader)
  : options_(std::move(options))
  , uploader_(uploader)
{
}

static void ThrowIfFailed(const arrow::Status& st, const char* step) {
  if (!st.ok())
    throw std::runtime_error(std::string(step) + ": " + st.ToString());
}

void DatasetPublisher::publish(const RecordSet& records,
                               const std::string& chunkName)
{
  const std::string file_name = chunkName + ".parquet";
  const std::string path = JoinPath(options_.output_dir, file_name);

  auto table = MakeAddressTable(records);
  ThrowIfFailed(table.status(), "build table");
  LOG(INFO) << chunkName << ": " << (*table)->num_rows() << " rows, "
            << (*table)->num_columns() << " columns";

  ThrowIfFailed(WriteGeoParquet(**table, path, options_.parquet), "write");
  last_path_ = path;

  if (!uploader_) {
    LOG(INFO) << "upload disabled, keeping " << path;
    return;
  }
  ThrowIfFailed(uploader_->Upload(path, JoinPath(options_.repo_dir, file_name),
                                  "Upload " + file_name),
                "upload");
}
