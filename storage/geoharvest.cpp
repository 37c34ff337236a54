#include "cmd_addresses.hpp"
#include "cmd_stops.hpp"

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <glog/logging.h>
#include <parquet/arrow/reader.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>

#include <folly/experimental/NestedCommandLineApp.h>

#include <clocale>
#include <functional>
#include <iostream>
#include <memory>

namespace po = boost::program_options;

arrow::Status Metadata(const po::variables_map& options,
                       const std::vector<std::string> &args)
{
  if (args.size() != 1u)
    throw folly::ProgramExit(1, "parquet file path expected");

  ARROW_ASSIGN_OR_RAISE(auto file, arrow::io::ReadableFile
                        ::Open(args[0]));
  parquet::arrow::FileReaderBuilder builder;
  ARROW_RETURN_NOT_OK(builder.Open(file));
  std::unique_ptr<parquet::arrow::FileReader> reader;
  ARROW_RETURN_NOT_OK(builder.Build(&reader));

  auto metadata = reader->parquet_reader()->metadata();
  std::cout << "#rows: " << metadata->num_rows() << '\n';
  std::cout << "#row groups: " << metadata->num_row_groups() << "\n\n";

  std::shared_ptr<arrow::Schema> schema;
  ARROW_RETURN_NOT_OK(reader->GetSchema(&schema));
  std::cout << schema->ToString(/*show_metadata=*/false) << std::endl;
  if (auto kv = metadata->key_value_metadata())
    std::cout << kv->ToString() << std::endl;
  return arrow::Status::OK();
}

template <class Entrypoint>
folly::NestedCommandLineApp::Command ArrowCommand(const Entrypoint &entrypoint)
{
  return [&](const po::variables_map& options, const std::vector<std::string> &args)
  {
    arrow::Status st = entrypoint(options, args);
    if (!st.ok())
      throw folly::ProgramExit(1, st.message());
  };
}

template <class CommandType>
struct CommandRegistar {
  void operator()(const po::variables_map& kwargs,
                  const std::vector<std::string>& args)
  {
    status = CmdOps<CommandType>::StoreArgs(kwargs, args, options);
    if (!status.ok())
      throw folly::ProgramExit(1, status.message());

    auto command = CommandType::Make();

    status = command->Init(options);
    if (!status.ok())
      throw folly::ProgramExit(1, std::string("Init: ") + status.message());

    status = command->Run();
    if (!status.ok()) {
      ARROW_WARN_NOT_OK(command->Finish(true), "Finish");
      /* Cancelled: the run went fine but there was nothing to export */
      throw folly::ProgramExit(status.IsCancelled() ? 3 : 2,
                               std::string("Run: ") + status.message());
    }

    status = command->Finish(false);
    if (!status.ok())
      throw folly::ProgramExit(2, std::string("Finish: ") + status.message());
  }

  void Register(folly::NestedCommandLineApp& app) {
    CmdOps<CommandType>::BindOptions(
        app.addCommand(
            CommandType::description.name,
            CommandType::description.args,
            CommandType::description.abstract,
            CommandType::description.help,
            std::ref(*this)),
        options);
  }

  static CommandRegistar<CommandType> instance;
  typename CommandType::Options options;
  arrow::Status status;
};

template<> CommandRegistar<CmdAddresses> CommandRegistar<CmdAddresses>::instance{};
template<> CommandRegistar<CmdStops> CommandRegistar<CmdStops>::instance{};

int main(int argc, const char* argv[]) {
  setlocale(LC_ALL, "C");
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  FLAGS_logtostderr = 1;

  folly::NestedCommandLineApp app{argv[0], "1.0", "", "", nullptr};
  app.addGFlags(folly::ProgramOptionsStyle::GNU);

  CommandRegistar<CmdAddresses>::instance.Register(app);
  CommandRegistar<CmdStops>::instance.Register(app);

  app.addCommand(
    "metadata", "parquet_file_path",
    "Print row count, schema and key-value metadata of a parquet file",
    "",
    ArrowCommand(Metadata));

  return app.run(argc, argv);
}
