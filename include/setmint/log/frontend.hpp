#pragma once

#include <cstdint>

#include <quill/Frontend.h>
#include <quill/Logger.h>

namespace setmint::log {

/**
 * Sale runs are short and every receipt summary matters, so producers block
 * on a full queue instead of dropping messages.
 */
struct frontend_options
{
  static constexpr quill::QueueType queue_type                    = quill::QueueType::UnboundedBlocking;
  static constexpr std::size_t initial_queue_capacity             = 128u * 1'024u;
  static constexpr std::uint32_t blocking_queue_retry_interval_ns = 1'000;
  static constexpr std::size_t unbounded_queue_max_capacity       = 64u * 1'024u * 1'024u;
  static constexpr quill::HugePagesPolicy huge_pages_policy       = quill::HugePagesPolicy::Never;
};

using frontend = quill::FrontendImpl< frontend_options >;
using logger   = quill::LoggerImpl< frontend_options >;

} // namespace setmint::log
