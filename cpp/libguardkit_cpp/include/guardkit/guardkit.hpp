/**
 * @file guardkit.hpp
 * @brief Umbrella header including every guardkit API.
 */
#pragma once

#include "guardkit/admission.hpp"
#include "guardkit/error.hpp"
#include "guardkit/limits.hpp"
#include "guardkit/log.hpp"
#include "guardkit/resource_stack.hpp"
#include "guardkit/result.hpp"
#include "guardkit/scope.hpp"
#include "guardkit/sink.hpp"
