// include/telemetrydeck/telemetrydeck.hpp
// Umbrella header for the TelemetryDeck C++ client.

#pragma once

#include "client.hpp"
#include "config.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "http.hpp"
#include "parameters.hpp"
#include "params.hpp"
#include "signal.hpp"
#include "signals.hpp"
#include "version.hpp"
