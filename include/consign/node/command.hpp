#pragma once

#include <consign/model/consignment.hpp>
#include <consign/model/contract_state.hpp>
#include <consign/model/outpoint.hpp>
#include <consign/processor/processor.hpp>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace consign::node {

/// Operator request, as parsed from the command line.
struct command_request final {
  // register | contracts | state | source | transfer
  std::string command;
  // Consignment file for `register`, contract id for the contract commands.
  std::string argument;
  bool force{};
  std::vector<consign::model::txid_t> confirmed_txids;
  std::vector<consign::model::transition_type_t> types;
  std::vector<consign::model::outpoint_t> outpoints;
  std::string output;
};

/// Parse `<txid hex>:<vout>`.
std::optional<consign::model::outpoint_t> parse_outpoint(
    std::string_view value);

std::optional<consign::model::consignment_t> read_consignment(
    const std::filesystem::path& path,
    std::string& error);

bool write_consignment(const std::filesystem::path& path,
                       const consign::model::consignment_t& consignment,
                       std::string& error);

/// Human readable summary of a contract's folded state.
void print_contract_state(std::ostream& out,
                          const consign::model::contract_state_t& state);

/// Execute `request` against the stash. Returns the process exit code.
template <typename Library>
int run_command(consign::processor::processor<Library>& processor,
                const command_request& request,
                std::ostream& out);

}  // namespace consign::node
