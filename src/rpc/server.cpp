#include <spdlog/spdlog.h>
#include <lockbox/rpc/server.hpp>

using namespace lockbox::rpc;
using namespace lockbox::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void populate_submit_response(const operation_result_t& source,
                              lockbox::v1::SubmitResponse* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out_attribute = out->add_attributes();
      out_attribute->set_key(attribute.key);
      out_attribute->set_value(attribute.value);
      out_attribute->set_index(attribute.index);
    }
  }
}

}  // namespace

listener::listener(lockbox::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Submit(
    grpc::CallbackServerContext* context,
    const lockbox::v1::SubmitRequest* request,
    lockbox::v1::SubmitResponse* response) {
  auto tx = make_bytes(request->tx());
  auto result = execution_engine_.submit_transaction(make_bytes_view(tx));
  populate_submit_response(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Check(
    grpc::CallbackServerContext* context,
    const lockbox::v1::SubmitRequest* request,
    lockbox::v1::SubmitResponse* response) {
  auto tx = make_bytes(request->tx());
  auto result = execution_engine_.check_transaction(make_bytes_view(tx));
  populate_submit_response(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const lockbox::v1::QueryRequest* request,
    lockbox::v1::QueryResponse* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(), make_bytes_view(data));
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_sequence(query.sequence);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const lockbox::v1::InfoRequest* /*request*/,
    lockbox::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_sequence(info.last_sequence);
  response->set_state_root(make_string(bytes_view_t{info.state_root}));
  return finish_ok(context);
}
