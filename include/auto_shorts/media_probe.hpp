/**
 * @file media_probe.hpp
 * @brief Read-only inspection of media files
 *
 * @details Used at pipeline start to describe the source, and by the
 *          export encoder to verify every file it writes.
 */

#ifndef AUTO_SHORTS_MEDIA_PROBE_HPP
#define AUTO_SHORTS_MEDIA_PROBE_HPP

#include <string>

#include "types.hpp"

namespace auto_shorts {

/**
 * @brief Probe a media file.
 *
 * @note Frame rate falls back from avg_frame_rate to r_frame_rate to 25 fps.
 *       Duration falls back from the container to the longest stream.
 *
 * @param path Path to the file
 * @return Description of the file with has_audio set explicitly
 * @throws ProbeError if the file is unreadable, has no video stream, or has
 *         zero/unknown duration
 */
SourceVideo probe_media(const std::string &path);

} // namespace auto_shorts

#endif // AUTO_SHORTS_MEDIA_PROBE_HPP
