#pragma once

#include <consign/model/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

// Stash consistency faults. Each one means a bug or tampered storage and is
// never fixed by retrying; the enclosing ingest or compose is aborted.
namespace consign::model {

enum class stash_error_code : uint32_t {
  genesis_absent = 1,
  schema_absent = 2,
  transition_absent = 3,
  transition_txid_absent = 4,
  anchor_absent = 5,
  bundle_absent = 6,
  unrelated_anchor = 7,
  bundle_reveal = 8,
  oversized_bundle = 9,
  merge_conflict = 10,
};

inline constexpr auto kStashErrorMappings = std::array{
    std::pair<std::string_view, stash_error_code>{
        "contract is unknown", stash_error_code::genesis_absent},
    std::pair<std::string_view, stash_error_code>{
        "schema is unknown", stash_error_code::schema_absent},
    std::pair<std::string_view, stash_error_code>{
        "transition is absent", stash_error_code::transition_absent},
    std::pair<std::string_view, stash_error_code>{
        "witness txid is not known for transition",
        stash_error_code::transition_txid_absent},
    std::pair<std::string_view, stash_error_code>{
        "anchor is absent", stash_error_code::anchor_absent},
    std::pair<std::string_view, stash_error_code>{
        "bundle data is absent", stash_error_code::bundle_absent},
    std::pair<std::string_view, stash_error_code>{
        "the anchor is not related to the contract",
        stash_error_code::unrelated_anchor},
    std::pair<std::string_view, stash_error_code>{
        "bundle reveal error", stash_error_code::bundle_reveal},
    std::pair<std::string_view, stash_error_code>{
        "the resulting bundle set exceeds consensus restrictions",
        stash_error_code::oversized_bundle},
    std::pair<std::string_view, stash_error_code>{
        "stored data conflicts with incoming data",
        stash_error_code::merge_conflict}};

inline constexpr std::string_view to_string(const stash_error_code value) {
  return to_string(value, kStashErrorMappings).value_or("unknown");
}

struct stash_error_t final {
  stash_error_code code{};
  // Offending id or detail, for operators.
  std::string info;
};

}  // namespace consign::model
