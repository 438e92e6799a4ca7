#pragma once
#include "bcp_exorcist/byte_stream.hpp"
#include "bcp_exorcist/options.hpp"
#include "bcp_exorcist/run_json.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace bx {

class MetricsRegistry;

enum class ExorcizeStatus { Ok, ConfigError, IoError, TransformFailed };

const char* status_name(ExorcizeStatus s) noexcept;

// Same shape as exorcize_stream(); lets callers substitute the transform.
using TransformFn = std::function<bool(ByteSource&, ByteSink&,
                                       std::uint64_t, std::size_t,
                                       const ExorcismOptions&,
                                       MetricsRegistry*, std::string*)>;

// Rewrites req.path in place:
//   1. <path> -> <path>.bak
//   2. stream <path>.bak into a fresh <path>
//   3. success: keep both; failure: <path> -> <path>.broken, <path>.bak -> <path>
// When the rename in step 1 fails nothing on disk has changed.
// `report` (optional) is filled on every path, including failures.
ExorcizeStatus exorcize_file(const ExorcizeRequest& req,
                             ExorcismReport* report = nullptr,
                             std::string* err_out = nullptr,
                             const TransformFn& transform = {});

}
