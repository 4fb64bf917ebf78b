#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <sanidate/execution/configuration_error.hpp>
#include <sanidate/execution/engine.hpp>
#include <sanidate/storage/document_lookup.hpp>
#include <sanidate/storage/rocksdb/storage.hpp>
#include <sanidate/tools/command_line.hpp>
#include <string>
#include <vector>

namespace {

using storage_t =
    sanidate::storage::storage<sanidate::storage::rocksdb_storage_tag>;

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "sanidate", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto fields = std::vector<std::string>{};
  auto constraints = std::vector<std::string>{};
  auto documents = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Sanidate"};
  description.add_options()("help,h", "Show the help message")(
      "field,f",
      boost::program_options::value<std::vector<std::string>>(&fields)
          ->composing(),
      "Record field as name=value (repeatable)")(
      "constraint,c",
      boost::program_options::value<std::vector<std::string>>(&constraints)
          ->composing(),
      "Constraint as field=name[:arg...] (repeatable, in chain order)")(
      "exclude-empty", "Omit fields whose sanidized value is empty")(
      "documents,d", boost::program_options::value<std::string>(&documents),
      "RocksDB path backing isDocument/isNotDocument")(
      "log-file", boost::program_options::value<std::string>(&log_file),
      "Also write log lines to this file")("verbose,v",
                                           "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return sanidate::tools::kExitUsage;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return sanidate::tools::kExitSucceeded;
  }

  configure_logging(log_file, vm.contains("verbose"));

  auto store = std::optional<storage_t>{};
  if (!documents.empty()) {
    store = sanidate::storage::make_storage<
        sanidate::storage::rocksdb_storage_tag>(documents);
  }
  auto resolver = sanidate::tools::collection_resolver_t{};
  if (store) {
    resolver = [&store](const std::string& collection) {
      return sanidate::storage::make_document_lookup(*store, collection);
    };
  }

  auto exit = sanidate::tools::kExitSucceeded;
  try {
    auto record = sanidate::tools::make_record(fields);
    auto schema = sanidate::tools::make_schema(constraints, resolver);

    auto engine = sanidate::execution::engine{};
    auto result =
        engine.check(record, schema, vm.contains("exclude-empty")).get();
    std::cout << sanidate::tools::format_result(result);
    exit = sanidate::tools::exit_code(result);
  } catch (const sanidate::tools::usage_error& ex) {
    spdlog::error("{}", ex.what());
    std::cerr << ex.what() << std::endl;
    exit = sanidate::tools::kExitUsage;
  } catch (const sanidate::execution::configuration_error& ex) {
    spdlog::error("Invalid schema: {}", ex.what());
    std::cerr << ex.what() << std::endl;
    exit = sanidate::tools::kExitUsage;
  }

  spdlog::shutdown();
  return exit;
}
