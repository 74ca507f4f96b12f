#include <consign/encoding/scale/encoder.hpp>
#include <consign/model/identity.hpp>
#include <consign/node/command.hpp>
#include <consign/storage/memory/storage.hpp>
#include <consign/storage/rocksdb/storage.hpp>
#include <consign/validation/chain_access.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <iterator>

using namespace consign::model;

namespace consign::node {

namespace {

std::optional<contract_id_t> parse_contract_id(const std::string_view value,
                                               std::ostream& out) {
  auto contract_id = try_make_hash32(value);
  if (!contract_id) {
    out << "invalid contract id '" << value << "'\n";
  }
  return contract_id;
}

int report_compose(const compose_result_t& result,
                   const std::string& output,
                   std::ostream& out) {
  if (result.code != 0 || !result.consignment) {
    out << "error " << result.code << " (" << result.codespace
        << "): " << result.log << " " << result.info << "\n";
    return 1;
  }
  const auto& consignment = *result.consignment;
  out << to_string(consignment.purpose) << " consignment "
      << to_hex(make_consignment_id(consignment)) << ": "
      << consignment.endpoints.size() << " endpoint(s), "
      << consignment.anchored_bundles.size() << " anchored bundle(s), "
      << consignment.state_extensions.size() << " extension(s)\n";
  if (output.empty()) {
    return 0;
  }
  auto error = std::string{};
  if (!write_consignment(output, consignment, error)) {
    out << error << "\n";
    return 1;
  }
  out << "written to " << output << "\n";
  return 0;
}

}  // namespace

std::optional<outpoint_t> parse_outpoint(const std::string_view value) {
  auto separator = value.rfind(':');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto txid = try_make_hash32(value.substr(0, separator));
  if (!txid) {
    return std::nullopt;
  }
  auto vout_text = value.substr(separator + 1);
  auto vout = uint32_t{};
  auto [end, code] = std::from_chars(
      vout_text.data(), vout_text.data() + vout_text.size(), vout);
  if (code != std::errc{} || end != vout_text.data() + vout_text.size() ||
      vout_text.empty()) {
    return std::nullopt;
  }
  return outpoint_t{.txid = *txid, .vout = vout};
}

std::optional<consignment_t> read_consignment(const std::filesystem::path& path,
                                              std::string& error) {
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    error = "cannot open " + path.string();
    return std::nullopt;
  }
  auto bytes = bytes_t{std::istreambuf_iterator<char>{file},
                       std::istreambuf_iterator<char>{}};
  auto encoder = consign::encoding::scale_encoder_t{};
  auto consignment = encoder.try_decode<consignment_t>(make_bytes_view(bytes));
  if (!consignment) {
    error = "malformed consignment in " + path.string();
  }
  return consignment;
}

bool write_consignment(const std::filesystem::path& path,
                       const consignment_t& consignment,
                       std::string& error) {
  auto encoder = consign::encoding::scale_encoder_t{};
  auto bytes = encoder.encode(consignment);
  auto file = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!file) {
    error = "cannot create " + path.string();
    return false;
  }
  file.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  if (!file) {
    error = "failed writing " + path.string();
    return false;
  }
  return true;
}

void print_contract_state(std::ostream& out, const contract_state_t& state) {
  out << "contract " << to_hex(state.contract_id) << "\n"
      << "  schema " << to_hex(state.schema_id) << "\n"
      << "  nodes  " << state.nodes.size() << "\n";
  for (const auto& entry : unspent(state)) {
    out << "  " << to_hex(entry.origin.node_id) << ":" << entry.origin.output
        << " type " << entry.assignment_type << " ";
    std::visit(overloaded{[&](const fungible_state_t& value) {
                            out << "amount " << value.amount;
                          },
                          [&](const data_state_t& value) {
                            out << "data " << to_hex(make_bytes_view(value.data));
                          }},
               entry.state);
    if (entry.seal.has_value()) {
      out << " at " << to_hex(entry.seal->txid) << ":" << entry.seal->vout;
    } else {
      out << " at concealed seal";
    }
    out << "\n";
  }
}

template <typename Library>
int run_command(consign::processor::processor<Library>& processor,
                const command_request& request,
                std::ostream& out) {
  spdlog::debug("Running command '{}'", request.command);

  if (request.command == "register") {
    auto error = std::string{};
    auto consignment = read_consignment(request.argument, error);
    if (!consignment) {
      out << error << "\n";
      return 1;
    }
    auto chain =
        consign::validation::offline_chain_access{request.confirmed_txids};
    auto result = processor.process_consignment(*consignment, chain,
                                                request.force);
    out << "contract " << to_hex(result.contract_id) << ": "
        << to_string(result.status.validity()) << "\n";
    for (const auto& failure : result.status.failures) {
      out << "  failure: " << failure << "\n";
    }
    for (const auto& warning : result.status.warnings) {
      out << "  warning: " << warning << "\n";
    }
    for (const auto& txid : result.status.unresolved_txids) {
      out << "  unresolved: " << to_hex(txid) << "\n";
    }
    if (result.code != 0) {
      out << "error " << result.code << " (" << result.codespace
          << "): " << result.log << " " << result.info << "\n";
      return 1;
    }
    if (!result.stored) {
      out << "not registered\n";
      return 2;
    }
    out << "registered\n";
    return 0;
  }

  if (request.command == "contracts") {
    for (const auto& contract_id : processor.list_contracts()) {
      out << to_hex(contract_id) << "\n";
    }
    return 0;
  }

  if (request.command == "state" || request.command == "source" ||
      request.command == "transfer") {
    auto contract_id = parse_contract_id(request.argument, out);
    if (!contract_id) {
      return 1;
    }
    if (request.command == "state") {
      auto state = processor.contract_state(*contract_id);
      if (!state) {
        out << "unknown contract " << request.argument << "\n";
        return 1;
      }
      print_contract_state(out, *state);
      return 0;
    }
    if (request.command == "source") {
      return report_compose(processor.export_contract(*contract_id),
                            request.output, out);
    }
    if (request.types.empty()) {
      out << "transfer needs at least one transition type\n";
      return 1;
    }
    auto selection = outpoint_selection_t{select_all_t{}};
    if (!request.outpoints.empty()) {
      selection = request.outpoints;
    }
    return report_compose(
        processor.compose_consignment(*contract_id, request.types, selection),
        request.output, out);
  }

  out << "unknown command '" << request.command << "'\n";
  return 1;
}

template int run_command<consign::storage::rocksdb_storage_tag>(
    consign::processor::processor<consign::storage::rocksdb_storage_tag>&,
    const command_request&,
    std::ostream&);
template int run_command<consign::storage::memory_storage_tag>(
    consign::processor::processor<consign::storage::memory_storage_tag>&,
    const command_request&,
    std::ostream&);

}  // namespace consign::node
