#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>

#include <lockbox/rpc/server.hpp>
#include <lockbox/schema/lock_error_code.hpp>
#include <lockbox/testing/execution_harness.hpp>

#include <memory>
#include <string>
#include <tuple>

using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

/// Custody service served over an in-process channel.
struct rpc_harness final {
  explicit rpc_harness(std::string_view name)
      : execution{name}, listener{*execution.engine} {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener);
    server = builder.BuildAndStart();
    channel = server->InProcessChannel(grpc::ChannelArguments{});
    stub = lockbox::v1::Custody::NewStub(channel);
  }

  ~rpc_harness() { server->Shutdown(); }

  execution_harness execution;
  lockbox::rpc::listener listener;
  std::unique_ptr<grpc::Server> server;
  std::shared_ptr<grpc::Channel> channel;
  std::unique_ptr<lockbox::v1::Custody::Stub> stub;
};

std::string as_string(const bytes_t& bytes) {
  return make_string(bytes);
}

}  // namespace

TEST(rpc_listener, submit_applies_requests_and_reports_events) {
  auto harness = rpc_harness{"lockbox_rpc_submit"};
  harness.execution.ledger.set_asset_info(make_nft_info(kNft));
  auto tx = make_transaction(1, make_ed25519_signer(1),
                             associate_asset_t{.asset_type = kNft});

  auto request = lockbox::v1::SubmitRequest{};
  request.set_tx(as_string(encode_transaction(tx)));
  auto response = lockbox::v1::SubmitResponse{};
  auto context = grpc::ClientContext{};
  auto status = harness.stub->Submit(&context, request, &response);

  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.code(), 0u);
  EXPECT_EQ(response.codespace(), "lockbox.associate");
  ASSERT_EQ(response.events_size(), 1);
  EXPECT_EQ(response.events(0).type(), "asset_associated");
  ASSERT_EQ(response.events(0).attributes_size(), 1);
  EXPECT_EQ(response.events(0).attributes(0).key(), "asset_type");
  EXPECT_TRUE(response.events(0).attributes(0).index());
  EXPECT_TRUE(harness.execution.engine->is_associated(kNft));
}

TEST(rpc_listener, check_reports_envelope_errors_without_applying) {
  auto harness = rpc_harness{"lockbox_rpc_check"};
  auto request = lockbox::v1::SubmitRequest{};
  request.set_tx("not a transaction");
  auto response = lockbox::v1::SubmitResponse{};
  auto context = grpc::ClientContext{};

  ASSERT_TRUE(harness.stub->Check(&context, request, &response).ok());
  EXPECT_EQ(response.code(),
            static_cast<uint32_t>(lock_error_code::invalid_transaction));
  EXPECT_EQ(response.log(), "invalid_transaction");
  EXPECT_EQ(response.codespace(), "lockbox.check");
  EXPECT_EQ(harness.execution.engine->info().last_sequence, 0u);
}

TEST(rpc_listener, query_and_info_expose_engine_state) {
  auto harness = rpc_harness{"lockbox_rpc_query"};
  harness.execution.prepare_unit(kNft, 8);
  ASSERT_TRUE(harness.execution.create(kNft, 8, 600).ok());

  auto query = lockbox::v1::QueryRequest{};
  query.set_path("/state/lock");
  query.set_data(as_string(
      harness.execution.encoder.encode(std::tuple{kNft, serial_number_t{8}})));
  auto query_response = lockbox::v1::QueryResponse{};
  auto query_context = grpc::ClientContext{};
  ASSERT_TRUE(
      harness.stub->Query(&query_context, query, &query_response).ok());
  EXPECT_EQ(query_response.code(), 0u);
  auto record = harness.execution.encoder.decode<lock_record_t>(
      make_bytes(query_response.value()));
  EXPECT_EQ(record.duration, 600u);
  EXPECT_EQ(record.beneficiary, kBeneficiary);

  auto info_response = lockbox::v1::InfoResponse{};
  auto info_context = grpc::ClientContext{};
  ASSERT_TRUE(harness.stub
                  ->Info(&info_context, lockbox::v1::InfoRequest{},
                         &info_response)
                  .ok());
  const auto info = harness.execution.engine->info();
  EXPECT_EQ(info_response.sequence(), info.last_sequence);
  EXPECT_EQ(info_response.data(), "lockbox-custody");
  EXPECT_EQ(info_response.app_version(), 1u);
  EXPECT_EQ(info_response.state_root(),
            make_string(bytes_view_t{info.state_root}));
}
