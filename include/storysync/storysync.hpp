#pragma once

#include "storysync/client.hpp"
#include "storysync/config.hpp"
#include "storysync/error.hpp"
#include "storysync/handler.hpp"
#include "storysync/http.hpp"
#include "storysync/log.hpp"
#include "storysync/pairing.hpp"
#include "storysync/preview.hpp"
#include "storysync/protocol.hpp"
#include "storysync/server.hpp"
#include "storysync/session.hpp"
#include "storysync/transport.hpp"
