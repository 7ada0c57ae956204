/**
 * @file upersist.hpp
 * @date 17 Oct 2026
 * @addtogroup Cpp
 *
 * @brief Umbrella header for the durability layer of embedded document collections.
 */

#pragma once
#include "upersist/cpp/types.hpp"
#include "upersist/cpp/status.hpp"
#include "upersist/cpp/log.hpp"
#include "upersist/cpp/config.hpp"
#include "upersist/cpp/engine.hpp"
#include "upersist/cpp/collection.hpp"
#include "upersist/cpp/store_connector.hpp"
#include "upersist/cpp/transaction_runner.hpp"
#include "upersist/cpp/operations.hpp"
#include "upersist/cpp/persistence.hpp"
