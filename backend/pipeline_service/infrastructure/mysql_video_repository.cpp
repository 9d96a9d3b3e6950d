#include "mysql_video_repository.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <string_view>
#include <nlohmann/json.hpp>

namespace pipeline_service {

namespace {

using Row = std::vector<std::optional<std::string>>;

constexpr std::string_view kSchema[] = {
  "CREATE TABLE IF NOT EXISTS videos ("
  "  id CHAR(36) NOT NULL PRIMARY KEY,"
  "  owner_id BIGINT NOT NULL,"
  "  title VARCHAR(255) NOT NULL,"
  "  description TEXT,"
  "  category VARCHAR(64),"
  "  tags TEXT,"
  "  visibility VARCHAR(16) NOT NULL,"
  "  source_path VARCHAR(1024) NOT NULL,"
  "  status VARCHAR(32) NOT NULL,"
  "  failure_reason TEXT,"
  "  created_at_ms BIGINT NOT NULL,"
  "  updated_at_ms BIGINT NOT NULL,"
  "  INDEX idx_videos_status (status)"
  ") ENGINE=InnoDB",

  "CREATE TABLE IF NOT EXISTS source_probes ("
  "  video_id CHAR(36) NOT NULL PRIMARY KEY,"
  "  duration DOUBLE NOT NULL,"
  "  width INT NOT NULL,"
  "  height INT NOT NULL,"
  "  codec VARCHAR(64) NOT NULL,"
  "  frame_rate DOUBLE NOT NULL,"
  "  container VARCHAR(128) NOT NULL,"
  "  has_audio TINYINT NOT NULL,"
  "  file_size BIGINT NOT NULL,"
  "  FOREIGN KEY (video_id) REFERENCES videos(id) ON DELETE CASCADE"
  ") ENGINE=InnoDB",

  "CREATE TABLE IF NOT EXISTS renditions ("
  "  video_id CHAR(36) NOT NULL,"
  "  quality VARCHAR(16) NOT NULL,"
  "  width INT NOT NULL,"
  "  height INT NOT NULL,"
  "  bitrate BIGINT NOT NULL,"
  "  fps INT NOT NULL,"
  "  codec VARCHAR(64) NOT NULL,"
  "  profile VARCHAR(32),"
  "  status VARCHAR(32) NOT NULL,"
  "  total_duration DOUBLE NOT NULL,"
  "  segment_count INT NOT NULL,"
  "  segment_duration DOUBLE NOT NULL,"
  "  total_size BIGINT NOT NULL,"
  "  attempts INT NOT NULL,"
  "  failure_reason TEXT,"
  "  PRIMARY KEY (video_id, quality),"
  "  FOREIGN KEY (video_id) REFERENCES videos(id) ON DELETE CASCADE"
  ") ENGINE=InnoDB",

  "CREATE TABLE IF NOT EXISTS segments ("
  "  video_id CHAR(36) NOT NULL,"
  "  quality VARCHAR(16) NOT NULL,"
  "  idx INT NOT NULL,"
  "  payload LONGBLOB NOT NULL,"
  "  byte_length BIGINT NOT NULL,"
  "  duration DOUBLE NOT NULL,"
  "  start_time DOUBLE NOT NULL,"
  "  checksum CHAR(64) NOT NULL,"
  "  PRIMARY KEY (video_id, quality, idx),"
  "  FOREIGN KEY (video_id, quality) REFERENCES renditions(video_id, quality) ON DELETE CASCADE"
  ") ENGINE=InnoDB",

  "CREATE TABLE IF NOT EXISTS thumbnails ("
  "  video_id CHAR(36) NOT NULL PRIMARY KEY,"
  "  small MEDIUMBLOB,"
  "  medium MEDIUMBLOB,"
  "  large MEDIUMBLOB,"
  "  mime_type VARCHAR(32) NOT NULL,"
  "  FOREIGN KEY (video_id) REFERENCES videos(id) ON DELETE CASCADE"
  ") ENGINE=InnoDB",
};

constexpr std::string_view kVideoColumns =
  "id, owner_id, title, description, category, tags, visibility, source_path, status,"
  " failure_reason, created_at_ms, updated_at_ms";

constexpr std::string_view kRenditionColumns =
  "video_id, quality, width, height, bitrate, fps, codec, profile, status, total_duration,"
  " segment_count, segment_duration, total_size, attempts, failure_reason";

int64_t toMillis(Clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point fromMillis(int64_t ms) {
  return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

const std::string& col(const Row& row, size_t i) {
  static const std::string empty;
  return row[i] ? *row[i] : empty;
}

int64_t colInt(const Row& row, size_t i) {
  return row[i] ? std::stoll(*row[i]) : 0;
}

double colDouble(const Row& row, size_t i) {
  return row[i] ? std::stod(*row[i]) : 0.0;
}

Bytes colBytes(const Row& row, size_t i) {
  if (!row[i]) return {};
  return Bytes(row[i]->begin(), row[i]->end());
}

// One pooled connection for the duration of a repository call.
class Session {
public:
  explicit Session(common::MySQLConnectionPool& pool) : guard_(pool) {}

  Result<void> ready() const {
    if (!guard_.valid()) {
      return std::unexpected(storageError("no database connection: " + guard_.error()));
    }
    return {};
  }

  std::string quote(std::string_view text) {
    std::string out(text.size() * 2 + 1, '\0');
    auto len = mysql_real_escape_string(guard_.get(), out.data(), text.data(),
                                        static_cast<unsigned long>(text.size()));
    out.resize(len);
    return "'" + out + "'";
  }

  std::string quote(const Bytes& blob) {
    return quote(std::string_view(reinterpret_cast<const char*>(blob.data()), blob.size()));
  }

  Result<void> execute(const std::string& sql) {
    if (mysql_real_query(guard_.get(), sql.data(), static_cast<unsigned long>(sql.size()))) {
      return std::unexpected(storageError(mysql_error(guard_.get())));
    }
    return {};
  }

  uint64_t affectedRows() { return mysql_affected_rows(guard_.get()); }

  Result<std::vector<Row>> query(const std::string& sql) {
    if (auto ret = execute(sql); !ret) {
      return std::unexpected(ret.error());
    }
    MYSQL_RES* result = mysql_store_result(guard_.get());
    if (!result) {
      return std::unexpected(storageError(std::string("No result set: ") + mysql_error(guard_.get())));
    }

    std::vector<Row> rows;
    const unsigned int fields = mysql_num_fields(result);
    MYSQL_ROW raw;
    while ((raw = mysql_fetch_row(result))) {
      unsigned long* lengths = mysql_fetch_lengths(result);
      Row row(fields);
      for (unsigned int i = 0; i < fields; ++i) {
        if (raw[i]) row[i] = std::string(raw[i], lengths[i]);
      }
      rows.push_back(std::move(row));
    }
    mysql_free_result(result);
    return rows;
  }

  // Runs `body` between START TRANSACTION and COMMIT, rolling back on error.
  template <typename Body>
  Result<void> transaction(Body&& body) {
    if (auto ret = execute("START TRANSACTION"); !ret) {
      return ret;
    }
    if (auto ret = body(); !ret) {
      if (auto rolled = execute("ROLLBACK"); !rolled) {
        return std::unexpected(storageError(ret.error().message + "; rollback failed: " + rolled.error().message));
      }
      return ret;
    }
    return execute("COMMIT");
  }

private:
  common::MySQLConnectionGuard guard_;
};

std::string statusList(std::span<const VideoStatus> statuses) {
  std::string list;
  for (auto status : statuses) {
    if (!list.empty()) list += ",";
    list += std::format("'{}'", toString(status));
  }
  return list;
}

Video videoFromRow(const Row& row) {
  Video video;
  video.id = col(row, 0);
  video.owner_id = colInt(row, 1);
  video.info.title = col(row, 2);
  video.info.description = col(row, 3);
  video.info.category = col(row, 4);
  if (!col(row, 5).empty()) {
    auto tags = nlohmann::json::parse(col(row, 5), nullptr, false);
    if (tags.is_array()) {
      for (const auto& tag : tags) {
        if (tag.is_string()) video.info.tags.push_back(tag.get<std::string>());
      }
    }
  }
  video.info.visibility = parseVisibility(col(row, 6)).value_or(Visibility::Public);
  video.source_path = col(row, 7);
  video.status = parseVideoStatus(col(row, 8)).value_or(VideoStatus::Failed);
  video.failure_reason = col(row, 9);
  video.created_at = fromMillis(colInt(row, 10));
  video.updated_at = fromMillis(colInt(row, 11));
  return video;
}

Rendition renditionFromRow(const Row& row) {
  Rendition rendition;
  rendition.video_id = col(row, 0);
  rendition.level.label = col(row, 1);
  rendition.level.width = static_cast<int>(colInt(row, 2));
  rendition.level.height = static_cast<int>(colInt(row, 3));
  rendition.level.bitrate = static_cast<long>(colInt(row, 4));
  rendition.level.fps = static_cast<int>(colInt(row, 5));
  rendition.level.codec = col(row, 6);
  rendition.level.profile = col(row, 7);
  rendition.status = parseRenditionStatus(col(row, 8)).value_or(RenditionStatus::Failed);
  rendition.total_duration = colDouble(row, 9);
  rendition.segment_count = static_cast<int>(colInt(row, 10));
  rendition.segment_duration = colDouble(row, 11);
  rendition.total_size = static_cast<std::uint64_t>(colInt(row, 12));
  rendition.attempts = static_cast<int>(colInt(row, 13));
  rendition.failure_reason = col(row, 14);
  return rendition;
}

} // namespace

MysqlVideoRepository::MysqlVideoRepository(std::shared_ptr<common::MySQLConnectionPool> pool)
  : pool_(std::move(pool)) {}

Result<void> MysqlVideoRepository::ensureSchema() {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return ret;
  for (auto statement : kSchema) {
    if (auto ret = db.execute(std::string(statement)); !ret) {
      return ret;
    }
  }
  return {};
}

Result<Video> MysqlVideoRepository::createVideo(const Video& video) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto query = std::format(
    "INSERT INTO videos ({}) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
    kVideoColumns,
    db.quote(video.id),
    video.owner_id,
    db.quote(video.info.title),
    db.quote(video.info.description),
    db.quote(video.info.category),
    db.quote(nlohmann::json(video.info.tags).dump()),
    db.quote(toString(video.info.visibility)),
    db.quote(video.source_path),
    db.quote(toString(video.status)),
    db.quote(video.failure_reason),
    toMillis(video.created_at),
    toMillis(video.updated_at));

  if (auto ret = db.execute(query); !ret) {
    return std::unexpected(ret.error());
  }
  return video;
}

Result<Video> MysqlVideoRepository::findVideo(const std::string& id) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format("SELECT {} FROM videos WHERE id = {}", kVideoColumns, db.quote(id)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("video {} not found", id)));
  }
  return videoFromRow(rows->front());
}

Result<std::vector<Video>> MysqlVideoRepository::findVideosByStatus(std::span<const VideoStatus> statuses) {
  if (statuses.empty()) {
    return std::vector<Video>{};
  }
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format("SELECT {} FROM videos WHERE status IN ({}) ORDER BY created_at_ms",
                                   kVideoColumns, statusList(statuses)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  std::vector<Video> videos;
  for (const auto& row : *rows) {
    videos.push_back(videoFromRow(row));
  }
  return videos;
}

Result<bool> MysqlVideoRepository::compareAndSetStatus(const std::string& id,
                                                       std::span<const VideoStatus> expected,
                                                       VideoStatus next,
                                                       const std::string& failure_reason) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto update = std::format(
    "UPDATE videos SET status = {}, failure_reason = {}, updated_at_ms = {} "
    "WHERE id = {} AND status IN ({})",
    db.quote(toString(next)), db.quote(failure_reason), toMillis(Clock::now()),
    db.quote(id), statusList(expected));
  if (auto ret = db.execute(update); !ret) {
    return std::unexpected(ret.error());
  }
  if (db.affectedRows() == 1) {
    return true;
  }

  auto rows = db.query(std::format("SELECT 1 FROM videos WHERE id = {}", db.quote(id)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("video {} not found", id)));
  }
  return false;
}

Result<bool> MysqlVideoRepository::removeVideo(const std::string& id) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  if (auto ret = db.execute(std::format("DELETE FROM videos WHERE id = {}", db.quote(id))); !ret) {
    return std::unexpected(ret.error());
  }
  return db.affectedRows() > 0;
}

Result<void> MysqlVideoRepository::saveProbe(const std::string& video_id, const SourceProbe& probe) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return ret;

  return db.execute(std::format(
    "INSERT INTO source_probes (video_id, duration, width, height, codec, frame_rate, container,"
    " has_audio, file_size) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {})"
    " ON DUPLICATE KEY UPDATE duration = VALUES(duration), width = VALUES(width),"
    " height = VALUES(height), codec = VALUES(codec), frame_rate = VALUES(frame_rate),"
    " container = VALUES(container), has_audio = VALUES(has_audio), file_size = VALUES(file_size)",
    db.quote(video_id), probe.duration, probe.width, probe.height, db.quote(probe.codec),
    probe.frame_rate, db.quote(probe.container), probe.has_audio ? 1 : 0, probe.file_size));
}

Result<SourceProbe> MysqlVideoRepository::findProbe(const std::string& video_id) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format(
    "SELECT duration, width, height, codec, frame_rate, container, has_audio, file_size"
    " FROM source_probes WHERE video_id = {}", db.quote(video_id)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("no probe for video {}", video_id)));
  }
  const auto& row = rows->front();
  SourceProbe probe;
  probe.duration = colDouble(row, 0);
  probe.width = static_cast<int>(colInt(row, 1));
  probe.height = static_cast<int>(colInt(row, 2));
  probe.codec = col(row, 3);
  probe.frame_rate = colDouble(row, 4);
  probe.container = col(row, 5);
  probe.has_audio = colInt(row, 6) != 0;
  probe.file_size = static_cast<std::uintmax_t>(colInt(row, 7));
  return probe;
}

Result<void> MysqlVideoRepository::replaceRenditions(const std::string& video_id,
                                                     const std::vector<Rendition>& renditions) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return ret;

  auto exists = db.query(std::format("SELECT 1 FROM videos WHERE id = {}", db.quote(video_id)));
  if (!exists) {
    return std::unexpected(exists.error());
  }
  if (exists->empty()) {
    return std::unexpected(notFound(std::format("video {} not found", video_id)));
  }

  return db.transaction([&]() -> Result<void> {
    if (auto ret = db.execute(std::format("DELETE FROM renditions WHERE video_id = {}", db.quote(video_id))); !ret) {
      return ret;
    }
    for (const auto& r : renditions) {
      auto insert = std::format(
        "INSERT INTO renditions ({}) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {}, {})",
        kRenditionColumns,
        db.quote(video_id), db.quote(r.quality()), r.level.width, r.level.height, r.level.bitrate,
        r.level.fps, db.quote(r.level.codec), db.quote(r.level.profile), db.quote(toString(r.status)),
        r.total_duration, r.segment_count, r.segment_duration, r.total_size, r.attempts,
        db.quote(r.failure_reason));
      if (auto ret = db.execute(insert); !ret) {
        return ret;
      }
    }
    return {};
  });
}

Result<void> MysqlVideoRepository::updateRendition(const Rendition& r) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return ret;

  auto update = std::format(
    "UPDATE renditions SET status = {}, total_duration = {}, segment_count = {},"
    " segment_duration = {}, total_size = {}, attempts = {}, failure_reason = {}"
    " WHERE video_id = {} AND quality = {}",
    db.quote(toString(r.status)), r.total_duration, r.segment_count, r.segment_duration,
    r.total_size, r.attempts, db.quote(r.failure_reason), db.quote(r.video_id), db.quote(r.quality()));
  if (auto ret = db.execute(update); !ret) {
    return ret;
  }

  auto rows = db.query(std::format("SELECT 1 FROM renditions WHERE video_id = {} AND quality = {}",
                                   db.quote(r.video_id), db.quote(r.quality())));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("rendition {}/{} not found", r.video_id, r.quality())));
  }
  return {};
}

Result<Rendition> MysqlVideoRepository::findRendition(const std::string& video_id, const std::string& quality) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format("SELECT {} FROM renditions WHERE video_id = {} AND quality = {}",
                                   kRenditionColumns, db.quote(video_id), db.quote(quality)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("rendition {}/{} not found", video_id, quality)));
  }
  return renditionFromRow(rows->front());
}

Result<std::vector<Rendition>> MysqlVideoRepository::findRenditions(const std::string& video_id) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format("SELECT {} FROM renditions WHERE video_id = {} ORDER BY height",
                                   kRenditionColumns, db.quote(video_id)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  std::vector<Rendition> renditions;
  for (const auto& row : *rows) {
    renditions.push_back(renditionFromRow(row));
  }
  return renditions;
}

Result<void> MysqlVideoRepository::insertSegment(const Segment& s) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return ret;

  return db.execute(std::format(
    "INSERT INTO segments (video_id, quality, idx, payload, byte_length, duration, start_time, checksum)"
    " VALUES ({}, {}, {}, {}, {}, {}, {}, {})",
    db.quote(s.video_id), db.quote(s.quality), s.index, db.quote(s.payload), s.byte_length,
    s.duration, s.start_time, db.quote(s.checksum)));
}

Result<int> MysqlVideoRepository::countSegments(const std::string& video_id, const std::string& quality) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format("SELECT COUNT(*) FROM segments WHERE video_id = {} AND quality = {}",
                                   db.quote(video_id), db.quote(quality)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  return rows->empty() ? 0 : static_cast<int>(colInt(rows->front(), 0));
}

Result<Segment> MysqlVideoRepository::findSegment(const std::string& video_id, const std::string& quality,
                                                  int index) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format(
    "SELECT payload, byte_length, duration, start_time, checksum FROM segments"
    " WHERE video_id = {} AND quality = {} AND idx = {}", db.quote(video_id), db.quote(quality), index));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("segment {} of {}/{} not found", index, video_id, quality)));
  }
  const auto& row = rows->front();
  Segment segment;
  segment.video_id = video_id;
  segment.quality = quality;
  segment.index = index;
  segment.payload = colBytes(row, 0);
  segment.byte_length = static_cast<std::uint64_t>(colInt(row, 1));
  segment.duration = colDouble(row, 2);
  segment.start_time = colDouble(row, 3);
  segment.checksum = col(row, 4);
  return segment;
}

Result<std::string> MysqlVideoRepository::findSegmentChecksum(const std::string& video_id,
                                                              const std::string& quality, int index) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format(
    "SELECT checksum FROM segments WHERE video_id = {} AND quality = {} AND idx = {}",
    db.quote(video_id), db.quote(quality), index));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("segment {} of {}/{} not found", index, video_id, quality)));
  }
  return col(rows->front(), 0);
}

Result<void> MysqlVideoRepository::deleteSegments(const std::string& video_id, const std::string& quality) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return ret;

  return db.execute(std::format("DELETE FROM segments WHERE video_id = {} AND quality = {}",
                                db.quote(video_id), db.quote(quality)));
}

Result<void> MysqlVideoRepository::saveThumbnails(const std::string& video_id, const ThumbnailSet& t) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return ret;

  return db.execute(std::format(
    "INSERT INTO thumbnails (video_id, small, medium, large, mime_type) VALUES ({}, {}, {}, {}, {})"
    " ON DUPLICATE KEY UPDATE small = VALUES(small), medium = VALUES(medium),"
    " large = VALUES(large), mime_type = VALUES(mime_type)",
    db.quote(video_id), db.quote(t.small), db.quote(t.medium), db.quote(t.large), db.quote(t.mime_type)));
}

Result<ThumbnailSet> MysqlVideoRepository::findThumbnails(const std::string& video_id) {
  Session db(*pool_);
  if (auto ret = db.ready(); !ret) return std::unexpected(ret.error());

  auto rows = db.query(std::format("SELECT small, medium, large, mime_type FROM thumbnails WHERE video_id = {}",
                                   db.quote(video_id)));
  if (!rows) {
    return std::unexpected(rows.error());
  }
  if (rows->empty()) {
    return std::unexpected(notFound(std::format("no thumbnails for video {}", video_id)));
  }
  const auto& row = rows->front();
  ThumbnailSet set;
  set.small = colBytes(row, 0);
  set.medium = colBytes(row, 1);
  set.large = colBytes(row, 2);
  set.mime_type = col(row, 3);
  return set;
}

}
