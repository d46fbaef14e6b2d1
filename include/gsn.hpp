/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn.hpp
 * @brief Umbrella header of the gossip broadcast node library.
 *
 * Pulls in the whole public API: the thread and queue primitives, the
 * transport and codec, the store, topology and dissemination engine, the node
 * itself and the process runtime. Prefer including the specific headers in
 * library code.
 */

#ifndef GSN_HPP_
#define GSN_HPP_

#include "gsn-async.hpp"
#include "gsn-buffer.hpp"
#include "gsn-config.hpp"
#include "gsn-debug.hpp"
#include "gsn-dissemination.hpp"
#include "gsn-io.hpp"
#include "gsn-message-pb-util.hpp"
#include "gsn-node.hpp"
#include "gsn-pipe.hpp"
#include "gsn-proc.hpp"
#include "gsn-runtime.hpp"
#include "gsn-singleton.hpp"
#include "gsn-stdio.hpp"
#include "gsn-store.hpp"
#include "gsn-timer.hpp"
#include "gsn-topology.hpp"
#include "gsn-util.hpp"

#endif // GSN_HPP_
