#include <synod/node/main.hpp>

#include <synod/node/service.hpp>

#include <whirl/node/rpc/server.hpp>
#include <whirl/node/runtime/shortcuts.hpp>

#include <await/futures/util/never.hpp>

namespace synod::node {

namespace rt = whirl::node::rt;

void NodeMain() {
  rt::PrintLine("Starting at {}", rt::WallTimeNow());

  // Open local database

  auto db_path = rt::Config()->GetString("db.path");
  rt::Database()->Open(db_path);

  // Start RPC server

  auto rpc_port = rt::Config()->GetInt<uint16_t>("rpc.port");
  auto rpc_server = whirl::node::rpc::MakeServer(rpc_port);

  rpc_server->RegisterService("Synod", std::make_shared<Synod>());

  rpc_server->Start();

  // Serving ...

  await::futures::BlockForever();
}

}  // namespace synod::node
