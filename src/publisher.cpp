/**
 * @file publisher.cpp
 * @brief Publishing request helpers
 */

#include "auto_shorts/publisher.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "auto_shorts/system.hpp"

namespace auto_shorts {

std::string format_hashtags(const std::vector<std::string> &hashtags) {
  std::string out;
  for (const auto &tag : hashtags) {
    if (tag.empty() || tag == "#")
      continue;
    if (!out.empty())
      out += ' ';
    if (tag[0] != '#')
      out += '#';
    out += tag;
  }
  return out;
}

PublishRequest make_publish_request(const std::string &source_title,
                                    const ShortArtifact &artifact,
                                    const std::vector<std::string> &hashtags,
                                    const std::string &schedule_time) {
  PublishRequest request;
  request.title = fmt::format("{} #{}", source_title, artifact.index);
  request.hashtags = hashtags;
  request.schedule_time = schedule_time;
  return request;
}

// **---- Metadata Sidecar ----**

ShortMetadata make_short_metadata(const std::string &source_title,
                                  const ShortArtifact &artifact, int total,
                                  const std::vector<std::string> &hashtags) {
  ShortMetadata meta;
  meta.request = make_publish_request(source_title, artifact, hashtags);
  meta.total = total;

  meta.description = fmt::format(
      "{}\n\nPart {}/{} of {} ({} - {}).", meta.request.title, artifact.index,
      total, source_title, format_time(artifact.segment.start),
      format_time(artifact.segment.end));
  std::string tag_line = format_hashtags(hashtags);
  if (!tag_line.empty())
    meta.description += "\n\n" + tag_line;

  std::vector<std::string> candidates = {"shorts"};
  candidates.insert(candidates.end(), hashtags.begin(), hashtags.end());
  for (std::string tag : candidates) {
    tag.erase(0, tag.find_first_not_of('#'));
    std::transform(tag.begin(), tag.end(), tag.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (tag.size() <= 2 ||
        std::find(meta.tags.begin(), meta.tags.end(), tag) != meta.tags.end())
      continue;
    meta.tags.push_back(tag);
    if (meta.tags.size() == MAX_METADATA_TAGS)
      break;
  }
  return meta;
}

std::string metadata_json(const ShortMetadata &meta,
                          const ShortArtifact &artifact) {
  namespace fs = std::filesystem;
  using json = nlohmann::json;

  json doc;
  doc["title"] = meta.request.title;
  doc["description"] = meta.description;
  doc["tags"] = meta.tags;
  doc["hashtags"] = format_hashtags(meta.request.hashtags);
  doc["schedule_time"] = meta.request.schedule_time.empty()
                             ? json(nullptr)
                             : json(meta.request.schedule_time);
  doc["part"] = {{"number", artifact.index},
                 {"total", meta.total},
                 {"segment_start", artifact.segment.start},
                 {"segment_end", artifact.segment.end},
                 {"segment_score", artifact.segment.score}};
  doc["video"] = fs::path(artifact.path).filename().string();
  doc["thumbnail"] =
      artifact.thumbnail_path.empty()
          ? json(nullptr)
          : json(fs::path(artifact.thumbnail_path).filename().string());
  doc["size_bytes"] = artifact.size_bytes;
  doc["has_audio"] = artifact.has_audio;

  /// Titles come from file names, which need not be valid UTF-8
  return doc.dump(2, ' ', false, json::error_handler_t::replace);
}

void write_metadata_file(const ShortMetadata &meta,
                         const ShortArtifact &artifact,
                         const std::string &path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw std::system_error(errno, std::generic_category(),
                            fmt::format("cannot create {}", path));
  out << metadata_json(meta, artifact) << '\n';
  out.flush();
  if (!out)
    throw std::system_error(EIO, std::generic_category(),
                            fmt::format("cannot write {}", path));
}

} // namespace auto_shorts
