/**
 * @file jose.hpp
 * @brief Umbrella header for the JOSE object model
 */

#pragma once

#include "algorithm.hpp"
#include "base64url.hpp"
#include "crypto.hpp"
#include "error.hpp"
#include "header.hpp"
#include "jose_object.hpp"
#include "json_utils.hpp"
#include "jwk.hpp"
#include "jwk_set.hpp"
#include "logging.hpp"
#include "payload.hpp"
#include "secure_vector.hpp"
