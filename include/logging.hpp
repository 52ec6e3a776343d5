#pragma once

/**
 * Route the default spdlog logger to stderr.
 *
 * @param verbose Include debug messages (request details)
 * @param quiet Only errors; wins over verbose
 */
void initLogging(bool verbose, bool quiet);
