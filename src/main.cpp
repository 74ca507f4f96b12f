#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <consign/encoding/scale/encoder.hpp>
#include <consign/node/command.hpp>
#include <consign/processor/processor.hpp>
#include <consign/storage/rocksdb/storage.hpp>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
  auto data_dir = std::string{};
  auto log_file = std::string{};
  auto max_bundles = std::size_t{};
  auto confirmed = std::vector<std::string>{};
  auto outpoints = std::vector<std::string>{};
  auto request = consign::node::command_request{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"consignd <command> [argument]"};
  description.add_options()("help,h", "Show the help message")(
      "data-dir,d",
      boost::program_options::value<std::string>(&data_dir)
          ->default_value("consign.db"),
      "Stash directory")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)
          ->default_value("consignd.log"),
      "Log file")("verbose,v", "Enable verbose output")(
      "force,f", "Merge consignments with unconfirmed witness transactions")(
      "confirmed-txid,c",
      boost::program_options::value<std::vector<std::string>>(&confirmed),
      "Witness txid known to be mined (repeatable)")(
      "max-bundles",
      boost::program_options::value<std::size_t>(&max_bundles)
          ->default_value(consign::model::kMaxAnchoredBundles),
      "Upper bound of anchored bundles per composed consignment")(
      "type,t",
      boost::program_options::value<std::vector<uint16_t>>(&request.types),
      "Transition type to disclose (repeatable)")(
      "outpoint,o",
      boost::program_options::value<std::vector<std::string>>(&outpoints),
      "Outpoint txid:vout to disclose (repeatable, default all)")(
      "output",
      boost::program_options::value<std::string>(&request.output),
      "File the composed consignment is written to")(
      "command", boost::program_options::value<std::string>(&request.command),
      "register | contracts | state | source | transfer")(
      "argument", boost::program_options::value<std::string>(&request.argument),
      "Consignment file or contract id");

  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1).add("argument", 1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(description)
            .positional(positional)
            .run(),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help") || request.command.empty()) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "consignd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  request.force = vm.contains("force");
  for (const auto& txid : confirmed) {
    auto parsed = consign::model::try_make_hash32(txid);
    if (!parsed) {
      spdlog::error("Invalid confirmed txid '{}'", txid);
      spdlog::shutdown();
      return 1;
    }
    request.confirmed_txids.push_back(*parsed);
  }
  for (const auto& outpoint : outpoints) {
    auto parsed = consign::node::parse_outpoint(outpoint);
    if (!parsed) {
      spdlog::error("Invalid outpoint '{}', expected txid:vout", outpoint);
      spdlog::shutdown();
      return 1;
    }
    request.outpoints.push_back(*parsed);
  }

  auto encoder = consign::encoding::scale_encoder_t{};
  auto storage =
      consign::storage::make_storage<consign::storage::rocksdb_storage_tag>(
          data_dir);
  auto processor =
      consign::processor::processor<consign::storage::rocksdb_storage_tag>{
          encoder, storage, consign::validation::validate_structure,
          consign::processor::processor_options{.max_anchored_bundles =
                                                    max_bundles}};

  auto exit_code = consign::node::run_command(processor, request, std::cout);

  spdlog::shutdown();
  return exit_code;
}
