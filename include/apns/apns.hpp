// include/apns/apns.hpp
// Umbrella header for the apns connection library.

#pragma once

#include "close_result.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "payload.hpp"
#include "socket_stream.hpp"
#include "stream.hpp"
#include "types.hpp"
