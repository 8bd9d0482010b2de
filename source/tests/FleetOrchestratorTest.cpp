#include "FleetOrchestrator.hpp"
#include "MockQbitServer.hpp"
#include "TestUtils.hpp"

#include <catch2/catch.hpp>

namespace fs = std::filesystem;

TEST_CASE("Unreachable server does not hold back a healthy one", "[fleet]")
{
  boost::asio::io_context ioc;
  boost::asio::thread_pool disk{ 2 };
  MockQbitServer healthy(ioc.get_executor());
  test::TempDir tmp;

  test::write_file(tmp / "src/A", "payload");

  healthy.respond(http::verb::get, "/api/v2/app/version", 200);
  healthy.respond(http::verb::get, "/api/v2/torrents/info?filter=completed", 200, test::torrent_list({ { (tmp / "src").string(), "A", "c", "h1" } }));
  healthy.respond(http::verb::delete_, "/api/v2/torrents/delete?hashes=h1", 200);

  ServerProfile down;
  down.url = "http://127.0.0.1:1";
  down.categories["c"] = (tmp / "other").string();

  ServerProfile up;
  up.url = healthy.url();
  up.categories["c"] = (tmp / "dest").string();

  FleetOrchestrator fleet(ServerReconciler(disk.get_executor(), std::chrono::seconds(5)));
  auto result = test::run_until_complete(ioc, fleet.run_cycle({ down, up }));

  REQUIRE(result.servers_processed == 2);
  REQUIRE(result.servers_online == 1);
  REQUIRE(result.relocated == 1);

  REQUIRE(result.errors.size() == 1);
  REQUIRE(result.errors[0].server == down.url);
  REQUIRE(result.errors[0].error.kind == ErrorKind::Transport);

  REQUIRE(test::read_file(tmp / "dest/A") == "payload");
  REQUIRE_FALSE(fs::exists(tmp / "src/A"));
  REQUIRE(healthy.count(http::verb::delete_, "/api/v2/torrents/delete?hashes=h1") == 1);
}

TEST_CASE("Empty fleet completes an empty cycle", "[fleet]")
{
  boost::asio::io_context ioc;
  boost::asio::thread_pool disk{ 1 };

  FleetOrchestrator fleet(ServerReconciler(disk.get_executor()));
  auto result = test::run_until_complete(ioc, fleet.run_cycle({}));

  REQUIRE(result.servers_processed == 0);
  REQUIRE(result.servers_online == 0);
  REQUIRE(result.errors.empty());
}

TEST_CASE("Errors from every server are collected", "[fleet]")
{
  boost::asio::io_context ioc;
  boost::asio::thread_pool disk{ 1 };
  MockQbitServer first(ioc.get_executor());
  MockQbitServer second(ioc.get_executor());

  first.respond(http::verb::get, "/api/v2/app/version", 401);
  second.respond(http::verb::get, "/api/v2/app/version", 200);
  second.respond(http::verb::get, "/api/v2/torrents/info?filter=completed", 200, "not json");

  ServerProfile a;
  a.url = first.url();
  ServerProfile b;
  b.url = second.url();

  FleetOrchestrator fleet(ServerReconciler(disk.get_executor(), std::chrono::seconds(5)));
  auto result = test::run_until_complete(ioc, fleet.run_cycle({ a, b }));

  REQUIRE(result.servers_processed == 2);
  REQUIRE(result.servers_online == 1);
  REQUIRE(result.errors.size() == 2);
  REQUIRE(result.errors[0].server == a.url);
  REQUIRE(result.errors[0].error.kind == ErrorKind::Transport);
  REQUIRE(result.errors[1].server == b.url);
  REQUIRE(result.errors[1].error.kind == ErrorKind::Decode);
}
