#pragma once
#include "domain/video_repository.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include <memory>

namespace pipeline_service {

/*
  videos 1--1 source_probes
  videos 1--1 thumbnails
  videos 1--n renditions 1--n segments
  every child row is removed by ON DELETE CASCADE with its parent
*/
class MysqlVideoRepository : public VideoRepository {
public:
  explicit MysqlVideoRepository(std::shared_ptr<common::MySQLConnectionPool> pool);

  // CREATE TABLE IF NOT EXISTS for every table above.
  Result<void> ensureSchema();

  Result<Video> createVideo(const Video& video) override;
  Result<Video> findVideo(const std::string& id) override;
  Result<std::vector<Video>> findVideosByStatus(std::span<const VideoStatus> statuses) override;
  Result<bool> compareAndSetStatus(const std::string& id, std::span<const VideoStatus> expected,
                                   VideoStatus next, const std::string& failure_reason) override;
  Result<bool> removeVideo(const std::string& id) override;

  Result<void> saveProbe(const std::string& video_id, const SourceProbe& probe) override;
  Result<SourceProbe> findProbe(const std::string& video_id) override;

  Result<void> replaceRenditions(const std::string& video_id,
                                 const std::vector<Rendition>& renditions) override;
  Result<void> updateRendition(const Rendition& rendition) override;
  Result<Rendition> findRendition(const std::string& video_id, const std::string& quality) override;
  Result<std::vector<Rendition>> findRenditions(const std::string& video_id) override;

  Result<void> insertSegment(const Segment& segment) override;
  Result<int> countSegments(const std::string& video_id, const std::string& quality) override;
  Result<Segment> findSegment(const std::string& video_id, const std::string& quality, int index) override;
  Result<std::string> findSegmentChecksum(const std::string& video_id, const std::string& quality, int index) override;
  Result<void> deleteSegments(const std::string& video_id, const std::string& quality) override;

  Result<void> saveThumbnails(const std::string& video_id, const ThumbnailSet& thumbnails) override;
  Result<ThumbnailSet> findThumbnails(const std::string& video_id) override;

private:
  std::shared_ptr<common::MySQLConnectionPool> pool_;
};

}
