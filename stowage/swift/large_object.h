// Copyright (C) 2023 THL A29 Limited, a Tencent company. All rights reserved.
//
// Licensed under the BSD 3-Clause License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of the
// License at
//
// https://opensource.org/licenses/BSD-3-Clause
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#ifndef STOWAGE_SWIFT_LARGE_OBJECT_H_
#define STOWAGE_SWIFT_LARGE_OBJECT_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stowage/base/expected.h"
#include "stowage/base/status.h"
#include "stowage/io/reader.h"
#include "stowage/swift/container.h"
#include "stowage/swift/object.h"
#include "stowage/swift/request.h"

namespace stowage::swift {

enum class LargeObjectStrategy {
  // Static large object: the manifest explicitly lists its segments.
  Static,

  // Dynamic large object: segments are all objects in the segment container
  // whose names start with the segment prefix, in lexicographical order.
  Dynamic
};

struct SegmentingOptions {
  // Container where segments are stored, in the same account. Required.
  std::string segment_container;

  // Prefix of segment names. Required for `Dynamic`. For `Static`, defaults
  // to `<object name>/`.
  std::string segment_prefix;

  LargeObjectStrategy strategy = LargeObjectStrategy::Static;
};

struct TruncateOptions {
  // Delete the segments being dropped from the large object.
  bool delete_segments = true;
};

// A segment of a large object.
struct SegmentInfo {
  // The segment. Its container must outlive the large object.
  Object object;
  std::uint64_t size_bytes = 0;
  // Hex-encoded MD5 of the segment. May be empty, in which case it's not
  // checked by the service.
  std::string etag;
  // Static large objects only. Part of the segment to use, as in HTTP `Range`
  // header without `bytes=` (e.g. `0-1023`). Empty for the whole segment.
  std::string range;
};

// A segmented object, composed of segments stored as separate objects.
//
// The segment list is kept in memory. Changes to it only take effect on the
// service once `WriteManifest()` is called. The object this view was created
// from must outlive it.
class LargeObject {
 public:
  // Starts with no segments.
  LargeObject(Object* object, LargeObjectStrategy strategy,
              std::string segment_container, std::string segment_prefix);

  LargeObjectStrategy strategy() const noexcept { return strategy_; }
  Object* object() const noexcept { return object_; }
  const std::string& SegmentContainer() const noexcept {
    return segment_container_;
  }
  const std::string& SegmentPrefix() const noexcept { return segment_prefix_; }
  const std::vector<SegmentInfo>& Segments() const noexcept {
    return segments_;
  }

  // Appends an existing object as the last segment. The segment must live in
  // the same account (`SwiftStatus::AccountMismatch` otherwise). Segments of
  // dynamic large objects must also live in the segment container under the
  // segment prefix, and may not use `range` (`SwiftStatus::SegmentInvalid`).
  Status AddSegment(SegmentInfo segment);

  // Uploads `contents` as new segments of at most `segment_size` bytes each,
  // and appends them.
  Status Append(Reader* contents, std::uint64_t segment_size,
                const RequestOptions* options = nullptr);

  // Removes all segments.
  Status Truncate(const TruncateOptions* options = nullptr);

  // Writes the manifest, which makes the object reflect the segment list.
  Status WriteManifest(const RequestOptions* options = nullptr);

 private:
  friend class Object;

  Container* GetSegmentContainer(const std::string& name);
  std::string NextSegmentName() const;

 private:
  Object* object_;
  LargeObjectStrategy strategy_;
  std::string segment_container_;
  std::string segment_prefix_;
  std::vector<SegmentInfo> segments_;

  // Referenced by handles of segments we've found or created ourselves.
  // Pointers are stable across moves.
  std::vector<std::unique_ptr<Container>> containers_;
};

}  // namespace stowage::swift

#endif  // STOWAGE_SWIFT_LARGE_OBJECT_H_
