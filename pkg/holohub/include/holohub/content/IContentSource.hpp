// Repository: HoloHub-fleet
// Component: Content Source Interface
// Purpose: The content-download call. Implemented by the gRPC client in
//          production and by in-memory fakes in tests.
// Copyright (c) 2025 HoloHub

#ifndef HOLOHUB_CONTENT_ICONTENT_SOURCE_HPP_
#define HOLOHUB_CONTENT_ICONTENT_SOURCE_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "holohub/content/ContentTypes.hpp"
#include "holohub/model/PlaylistTypes.hpp"

namespace holohub::content {

// Receives each chunk in stream order. Return false to abort the stream.
using ChunkSink = std::function<bool(const uint8_t* data, size_t len)>;

class IContentSource {
 public:
  virtual ~IContentSource() = default;

  // Streams the object named by descriptor into sink.
  // Returns kNone only when the remote reported a complete stream.
  // An aborted sink must yield a non-kNone result.
  virtual ContentError Fetch(const model::ContentDescriptor& descriptor,
                             const ChunkSink& sink,
                             std::chrono::milliseconds deadline) = 0;
};

}  // namespace holohub::content

#endif  // HOLOHUB_CONTENT_ICONTENT_SOURCE_HPP_
