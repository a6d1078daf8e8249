/**
 * @file publisher.hpp
 * @brief Boundary to a publishing platform
 *
 * @details The pipeline never uploads anything itself. A publisher receives
 *          finished artifacts together with the metadata the platform needs.
 *          The same metadata can be written as a JSON sidecar next to each
 *          short, for uploads done later or by another tool.
 */

#ifndef AUTO_SHORTS_PUBLISHER_HPP
#define AUTO_SHORTS_PUBLISHER_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace auto_shorts {

/**
 * @struct PublishRequest
 * @brief Platform metadata for one upload.
 */
struct PublishRequest {
  std::string title;
  std::vector<std::string> hashtags; //< Without the leading '#'
  std::string schedule_time;         //< ISO 8601, empty = publish now
};

/**
 * @struct PublishResult
 */
struct PublishResult {
  bool ok = false;
  std::string remote_id; //< Platform identifier when ok
  std::string message;   //< Failure reason when !ok
};

/**
 * @class ArtifactPublisher
 * @brief Uploads one artifact. No retries are attempted by callers.
 */
class ArtifactPublisher {
public:
  virtual ~ArtifactPublisher() = default;

  virtual PublishResult publish(const ShortArtifact &artifact,
                                const PublishRequest &request) = 0;
};

/**
 * @brief Default request for an artifact: "<title> #<index>" plus hashtags.
 */
PublishRequest make_publish_request(const std::string &source_title,
                                    const ShortArtifact &artifact,
                                    const std::vector<std::string> &hashtags,
                                    const std::string &schedule_time = "");

/**
 * @brief Render hashtags as "#a #b #c" (leading '#' added where missing).
 */
std::string format_hashtags(const std::vector<std::string> &hashtags);

// **---- Metadata Sidecar ----**

/// Upper bound on tags per short
constexpr size_t MAX_METADATA_TAGS = 15;

/**
 * @struct ShortMetadata
 * @brief Everything a platform upload of one short needs.
 */
struct ShortMetadata {
  PublishRequest request;
  std::string description;
  std::vector<std::string> tags; //< Lower case, unique, without '#'
  int total = 0;                 //< Shorts selected in the run
};

/**
 * @brief Title, description and tags for an artifact.
 * @note Tags start with "shorts", then the hashtags in order; tags of two
 *       characters or less are dropped.
 */
ShortMetadata make_short_metadata(const std::string &source_title,
                                  const ShortArtifact &artifact, int total,
                                  const std::vector<std::string> &hashtags);

/**
 * @brief Pretty-printed JSON document for the sidecar.
 */
std::string metadata_json(const ShortMetadata &meta,
                          const ShortArtifact &artifact);

/**
 * @brief Write metadata_json() to `path`.
 * @throws std::system_error if the file cannot be written
 */
void write_metadata_file(const ShortMetadata &meta,
                         const ShortArtifact &artifact,
                         const std::string &path);

} // namespace auto_shorts

#endif // AUTO_SHORTS_PUBLISHER_HPP
