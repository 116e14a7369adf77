//
// main.cpp: bingo host server using WebSocket++
//

#include <cstdio>
#include <memory>
#include <print>

#include "core/GameHost.hpp"
#include "core/GameStore.hpp"
#include "net/ChatGateway.hpp"
#include "net/Router.hpp"
#include "net/ServerConfig.hpp"
#include "store/FileStorage.hpp"

int main(int argc, char** argv)
{
    using namespace bingo;

    net::ServerConfig const sc = net::ParseArgs(argc, argv);

    std::print("[bingod] starting on port {} | state {} | {} admin(s)\n",
               sc.port, sc.state_path.string(), sc.game.admins.size());
    if (sc.game.admins.empty())
    {
        std::print(stderr, "[bingod] no --admin given, nobody can start or call a game\n");
    }

    auto storage = std::make_shared<store::FileStorage>(sc.state_path);
    auto game_store = std::make_shared<core::GameStore>(storage);
    game_store->Load();

    auto gateway = std::make_shared<net::ChatGateway>();
    core::GameHost host(sc.game, game_store, gateway);
    net::Router router(host);

    gateway->SetRequestHandler([&router](net::Request const& req)
    {
        return router.Handle(req);
    });

    try
    {
        gateway->Listen(sc.port);
        std::print("[bingod] Bingo host running...\n");
        gateway->Run();
    }
    catch (websocketpp::exception const& e)
    {
        std::print(stderr, "[bingod] network failure: {}\n", e.what());
        return 1;
    }

    return 0;
}
