// include/onboard/onboard.hpp
// Umbrella header.

#pragma once

#include "amenity.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "error.hpp"
#include "events.hpp"
#include "image.hpp"
#include "loader.hpp"
#include "payload.hpp"
#include "quality.hpp"
#include "session.hpp"
#include "types.hpp"
#include "validation.hpp"
#include "validation_result.hpp"
