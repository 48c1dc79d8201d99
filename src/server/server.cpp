#include "minimcp/server/server.hpp"

#include "minimcp/log.hpp"

namespace minimcp::server
{

Server::Server(ServerInfo info, Json capabilities)
    : info_(std::move(info)), capabilities_(std::move(capabilities)),
      dispatcher_(registry_,
                  [](const std::exception& e) { log::logger()->error("[MCP Error] {}", e.what()); })
{
    registry_.register_handler("get_server_info",
                               [this](const Json&) -> Json
                               {
                                   return Json{{"name", info_.name},
                                               {"version", info_.version},
                                               {"capabilities", capabilities_}};
                               });
}

bool Server::run(std::istream& in, std::ostream& out)
{
    if (loop_)
        return false;

    StdioServerWrapper loop(mcp::make_line_handler(dispatcher_), in, out);
    struct ActiveLoop
    {
        StdioServerWrapper*& slot;
        ~ActiveLoop()
        {
            slot = nullptr;
        }
    } active{loop_};
    loop_ = &loop;

    log::logger()->info("{} {} starting", info_.name, info_.version);
    loop.run();
    log::logger()->info("{} stopped", info_.name);
    return true;
}

void Server::stop()
{
    if (loop_)
        loop_->stop();
}

} // namespace minimcp::server
