#pragma once

#include "glaze/core/opts.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace repolens::core {

// External payloads carry many fields we never read.
inline constexpr auto JsonOpts = glz::opts{.error_on_unknown_keys = false};

using Headers = std::unordered_map<std::string, std::string>;

enum class HttpStatus : uint16_t {
  // 2xx Success
  Ok = 200,
  Created = 201,
  NoContent = 204,

  // 4xx Client Errors
  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  UnprocessableEntity = 422,
  TooManyRequests = 429,

  // 5xx Server Errors
  InternalServerError = 500,
  BadGateway = 502,
  ServiceUnavailable = 503,
};

constexpr bool isSuccess(int Status) { return Status >= 200 && Status < 300; }

} // namespace repolens::core
