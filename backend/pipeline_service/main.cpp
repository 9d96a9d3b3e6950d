#include "application/binary_store.hpp"
#include "application/job_orchestrator.hpp"
#include "application/manifest_builder.hpp"
#include "application/pipeline_service.hpp"
#include "application/quality_ladder.hpp"
#include "application/segment_server.hpp"
#include "application/segmenter.hpp"
#include "infrastructure/ffmpeg_media_prober.hpp"
#include "infrastructure/ffmpeg_segment_reader.hpp"
#include "infrastructure/ffmpeg_thumbnailer.hpp"
#include "infrastructure/ffmpeg_transcoder.hpp"
#include "infrastructure/hls_server.hpp"
#include "infrastructure/memory_video_repository.hpp"
#include "infrastructure/mysql_video_repository.hpp"
#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "common/connection_pool/mysql_connection_pool.hpp"
#include "common/restful/http_server.hpp"
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>
#include <boost/asio.hpp>

namespace {

std::shared_ptr<pipeline_service::VideoRepository> makeRepository(const config::Config& cfg) {
  const auto& storage = cfg.getPipeline().storage;
  if (storage == "memory") {
    std::cout << "[main] using in-memory storage, nothing survives a restart" << std::endl;
    return std::make_shared<pipeline_service::MemoryVideoRepository>();
  }
  if (storage != "mysql") {
    throw std::runtime_error("Unknown storage backend: " + storage);
  }

  auto pool = std::make_shared<common::MySQLConnectionPool>(cfg.getDatabase(), cfg.getDBCntPool());
  auto repository = std::make_shared<pipeline_service::MysqlVideoRepository>(pool);
  if (auto ret = repository->ensureSchema(); !ret) {
    throw std::runtime_error("Failed to create schema: " + ret.error().describe());
  }
  std::cout << "[main] connected to mysql " << cfg.getDatabase().host << "/" << cfg.getDatabase().db_name << std::endl;
  return repository;
}

} // namespace

int main(int argc, char** argv) {
  try {
    auto& cfg = config::Config::getInstance();
    if (argc > 1) {
      cfg.load(argv[1]);
    }
    const auto& pipeline_config = cfg.getPipeline();
    std::filesystem::create_directories(pipeline_config.temp_dir);

    auto repository = makeRepository(cfg);
    auto store = std::make_shared<pipeline_service::BinaryStore>(repository);

    pipeline_service::PipelineComponents components;
    components.repository = repository;
    components.store = store;
    components.prober = std::make_shared<pipeline_service::FfmpegMediaProber>();
    components.transcoder = std::make_shared<pipeline_service::FfmpegTranscoder>(
      cfg.getFFmpeg(), pipeline_config.temp_dir, pipeline_config.chunk_seconds,
      pipeline_config.transcode_timeout);
    components.segmenter = std::make_shared<pipeline_service::Segmenter>(
      std::make_shared<pipeline_service::FfmpegEncodedStreamReader>(), pipeline_config.chunk_seconds);
    components.thumbnailer = std::make_shared<pipeline_service::FfmpegThumbnailer>();
    components.planner = std::make_shared<const pipeline_service::QualityLadderPlanner>(cfg.getLadder());

    auto orchestrator = std::make_shared<pipeline_service::JobOrchestrator>(components, pipeline_config);
    auto pipeline = std::make_shared<pipeline_service::PipelineService>(
      repository, store, orchestrator,
      std::make_shared<pipeline_service::ManifestBuilder>(store),
      std::make_shared<pipeline_service::SegmentServer>(store),
      pipeline_config.max_upload_bytes);

    if (auto recovered = pipeline->recoverInterrupted(); !recovered) {
      std::cerr << "[main] recovery failed: " << recovered.error().describe() << std::endl;
    } else if (*recovered > 0) {
      std::cout << "[main] resubmitted " << *recovered << " interrupted video(s)" << std::endl;
    }

    const auto& streaming_config = cfg.getStreaming();
    std::shared_ptr<pipeline_service::StreamingService> streaming_service =
      std::make_shared<pipeline_service::HlsServer>(
        streaming_config.host,
        static_cast<unsigned short>(streaming_config.port),
        pipeline);

    // Start REST API server
    const auto& rest_config = cfg.getRest();
    boost::asio::io_context ioc{1};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(rest_config.host),
      static_cast<unsigned short>(rest_config.port)
    };
    auto api_handler = std::make_shared<pipeline_service::RestApiHandler>(pipeline);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};
    std::cout << "[main] HTTP Server listening on " << rest_config.host << ":" << rest_config.port << std::endl;

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "[main] signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      streaming_service->stopServer();
      ioc.stop();
    });

    // Start HLS server in background thread
    std::thread hls_thread([streaming_service]() {
      streaming_service->startServer();
    });

    http_server.run();
    ioc.run();

    streaming_service->stopServer();
    hls_thread.join();

    // Runs still in flight are stopped by the orchestrator's destructor and
    // picked up again by recoverInterrupted() on the next start.
    std::cout << "[main] " << orchestrator->activeRuns() << " run(s) interrupted" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
