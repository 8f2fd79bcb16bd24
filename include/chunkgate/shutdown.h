#pragma once

namespace chunkgate {

// Blocks SIGINT and SIGTERM in every thread started afterwards and quits the
// drogon event loop on the first one received. Call before app().run().
void installShutdownHandlers();

}  // namespace chunkgate
