#pragma once
#include <string>

namespace sdi {

class Intelligence;

// Start a blocking HTTP server over the intelligence core. A background
// thread polls the folder monitors every pollIntervalMs; requests and polls
// are serialized on one mutex.
// apiKey: if empty, auth is disabled.
void run_http_server(Intelligence& intel,
                     int port,
                     const std::string& apiKey,
                     int pollIntervalMs);

} // namespace sdi
