#include <consign/model/identity.hpp>
#include <consign/node/command.hpp>
#include <consign/testing/stash_fixture.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>

using namespace consign::testing;
using consign::model::to_hex;

namespace {

class command : public stash_fixture {
 protected:
  void SetUp() override {
    path_ = make_db_path("consign_command");
    std::filesystem::create_directories(path_);
  }

  void TearDown() override { remove_path(path_); }

  std::string file(const std::string_view name) const {
    return (std::filesystem::path{path_} / name).string();
  }

  int run(consign::node::command_request request) {
    out_.str(std::string{});
    return consign::node::run_command(processor_, request, out_);
  }

  std::string path_;
  std::ostringstream out_;
  chain_contract contract_;
};

}  // namespace

TEST(parse_outpoint, accepts_txid_and_vout) {
  auto txid = make_hash(3);
  auto outpoint = consign::node::parse_outpoint(to_hex(txid) + ":17");
  ASSERT_TRUE(outpoint.has_value());
  EXPECT_EQ(outpoint->txid, txid);
  EXPECT_EQ(outpoint->vout, 17u);
}

TEST(parse_outpoint, rejects_malformed_values) {
  auto txid = to_hex(make_hash(3));
  EXPECT_FALSE(consign::node::parse_outpoint(txid).has_value());
  EXPECT_FALSE(consign::node::parse_outpoint(txid + ":").has_value());
  EXPECT_FALSE(consign::node::parse_outpoint(txid + ":1x").has_value());
  EXPECT_FALSE(consign::node::parse_outpoint(txid + ":-1").has_value());
  EXPECT_FALSE(consign::node::parse_outpoint("abcd:1").has_value());
}

TEST_F(command, consignment_file_round_trip) {
  auto error = std::string{};
  auto consignment = contract_.consignment();
  ASSERT_TRUE(consign::node::write_consignment(file("chain.consignment"),
                                               consignment, error))
      << error;
  auto loaded = consign::node::read_consignment(file("chain.consignment"),
                                                error);
  ASSERT_TRUE(loaded.has_value()) << error;
  EXPECT_EQ(*loaded, consignment);
}

TEST_F(command, unreadable_consignment_files_are_reported) {
  auto error = std::string{};
  EXPECT_FALSE(
      consign::node::read_consignment(file("missing"), error).has_value());
  EXPECT_NE(error.find("cannot open"), std::string::npos);

  {
    auto garbage = std::ofstream{file("garbage"), std::ios::binary};
    garbage << "not a consignment";
  }
  EXPECT_FALSE(
      consign::node::read_consignment(file("garbage"), error).has_value());
  EXPECT_NE(error.find("malformed consignment"), std::string::npos);
}

TEST_F(command, register_then_transfer) {
  auto error = std::string{};
  ASSERT_TRUE(consign::node::write_consignment(
      file("in.consignment"), contract_.consignment(), error));

  EXPECT_EQ(run({.command = "register",
                 .argument = file("in.consignment"),
                 .confirmed_txids = {contract_.x1}}),
            2);
  EXPECT_NE(out_.str().find("unresolved: " + to_hex(contract_.x2)),
            std::string::npos);
  EXPECT_NE(out_.str().find("not registered"), std::string::npos);
  EXPECT_TRUE(processor_.list_contracts().empty());

  EXPECT_EQ(run({.command = "register",
                 .argument = file("in.consignment"),
                 .confirmed_txids = {contract_.x1, contract_.x2}}),
            0);
  EXPECT_NE(out_.str().find("registered"), std::string::npos);

  EXPECT_EQ(run({.command = "contracts"}), 0);
  EXPECT_EQ(out_.str(), to_hex(contract_.contract_id) + "\n");

  EXPECT_EQ(run({.command = "state",
                 .argument = to_hex(contract_.contract_id)}),
            0);
  EXPECT_NE(out_.str().find("amount 400"), std::string::npos);
  EXPECT_NE(out_.str().find("amount 600"), std::string::npos);

  auto destination = consign::model::outpoint_t{.txid = make_hash(40),
                                                 .vout = 3};
  EXPECT_EQ(run({.command = "transfer",
                 .argument = to_hex(contract_.contract_id),
                 .types = {kTransferType},
                 .outpoints = {destination},
                 .output = file("out.consignment")}),
            0);
  EXPECT_NE(out_.str().find("1 endpoint(s), 2 anchored bundle(s)"),
            std::string::npos);
  auto transfer = consign::node::read_consignment(file("out.consignment"),
                                                  error);
  ASSERT_TRUE(transfer.has_value()) << error;
  EXPECT_EQ(transfer->purpose, consign::model::consignment_purpose::transfer);

  EXPECT_EQ(run({.command = "source",
                 .argument = to_hex(contract_.contract_id)}),
            0);
  EXPECT_NE(out_.str().find("contract consignment"), std::string::npos);
  EXPECT_NE(out_.str().find("3 endpoint(s)"), std::string::npos);
}

TEST_F(command, forced_register_accepts_unresolved_witnesses) {
  auto error = std::string{};
  ASSERT_TRUE(consign::node::write_consignment(
      file("in.consignment"), contract_.consignment(), error));
  EXPECT_EQ(run({.command = "register",
                 .argument = file("in.consignment"),
                 .force = true}),
            0);
  EXPECT_EQ(processor_.list_contracts().size(), 1u);
}

TEST_F(command, bad_requests_fail) {
  EXPECT_EQ(run({.command = "state", .argument = "xyz"}), 1);
  EXPECT_NE(out_.str().find("invalid contract id"), std::string::npos);

  EXPECT_EQ(run({.command = "state",
                 .argument = to_hex(contract_.contract_id)}),
            1);
  EXPECT_NE(out_.str().find("unknown contract"), std::string::npos);

  EXPECT_EQ(run({.command = "source",
                 .argument = to_hex(contract_.contract_id)}),
            1);
  EXPECT_NE(out_.str().find("contract is unknown"), std::string::npos);

  EXPECT_EQ(run({.command = "register", .argument = file("missing")}), 1);
  EXPECT_EQ(run({.command = "mint"}), 1);
  EXPECT_NE(out_.str().find("unknown command 'mint'"), std::string::npos);
}
