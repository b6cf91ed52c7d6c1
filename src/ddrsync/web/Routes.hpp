#pragma once

#include <ddrsync/web/ControlServer.hpp>

namespace httplib {
class Server;
}

namespace DS::Web {

// /health, /events, /singular/*, /api/singular/fields/{app},
// /{app}/{key}/in|out|set|timecontrol
void register_control_routes(httplib::Server& server, ServerContext& context);

// /tricaster/sync/*, /tricaster/timer/*, /tricaster/auto-sync*,
// /config/tricaster/timer-sync
void register_sync_routes(httplib::Server& server, ServerContext& context);

// /tricaster/test|ddr|tally|dictionary|shortcut and the shortcut aliases
void register_device_routes(httplib::Server& server, ServerContext& context);

} // namespace DS::Web
