#pragma once

// Single source of truth for the FleetNet server version.
// Sent to clients in handshake_ack unless the config overrides it.
#define FLEETNET_VERSION_MAJOR  1
#define FLEETNET_VERSION_MINOR  0
#define FLEETNET_VERSION_PATCH  0
#define FLEETNET_VERSION_STRING "1.0.0"
