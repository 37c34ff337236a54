#ifndef GEOHARVEST_CMD_H_
#define GEOHARVEST_CMD_H_

#include <arrow/type_fwd.h>

#include <memory>
#include <string>
#include <vector>

namespace boost::program_options {
  class options_description;
  class variables_map;
}

struct CmdDescription {
  const char *name;
  const char *args;
  const char *abstract;
  const char *help;
};

template <class CmdType>
struct CmdOps {
  static void BindOptions(boost::program_options::options_description& description,
                          typename CmdType::Options& options);
  static arrow::Status StoreArgs(const boost::program_options::variables_map& vm,
                                 const std::vector<std::string>& args,
                                 typename CmdType::Options& options);
};

/* Commands are complete types only inside their own translation unit,
 * so they are deleted there too. */
template <class CmdType>
struct CmdDeleter {
  void operator()(CmdType* cmd) const;
};

template <class CmdType>
using CmdPtr = std::unique_ptr<CmdType, CmdDeleter<CmdType>>;

#endif // GEOHARVEST_CMD_H_
