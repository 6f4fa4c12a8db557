#pragma once

#include "tether/client.hpp"
#include "tether/config.hpp"
#include "tether/errors.hpp"
#include "tether/format.hpp"
#include "tether/framer.hpp"
#include "tether/log.hpp"
#include "tether/message.hpp"
#include "tether/protocol.hpp"
#include "tether/transport.hpp"
#include "tether/utils.hpp"
