#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "controller.hpp"
#include "http_api.hpp"
#include "inference.hpp"
#include "util.hpp"

int main(int argc, char** argv) {
  CLI::App cli_app{"FrameTap-RT: video playback with decoupled frame sampling and inference"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string source;
  cli_app.add_option("--source", source, "Video file to play on startup");

  int camera = -1;
  cli_app.add_option("--camera", camera, "Camera device index to open on startup");

  std::string image;
  cli_app.add_option("--image", image, "Process a single image and exit")
      ->check(CLI::ExistingFile);

  std::string output = "processed.png";
  cli_app.add_option("--output", output, "Output path for --image");

  int port = 0;
  cli_app.add_option("--port", port, "HTTP port (overrides config)")->check(CLI::Range(1, 65535));

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "FrameTap-RT v1.0.0" << std::endl;
    std::cout << "Decoupled playback and sampling with OpenCV DNN inference" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  std::shared_ptr<Inferencer> inferencer;
  try {
    app = load_config(cfg_path);
    apply_log_level(app.log_level);
    inferencer = create_inferencer(app.inference);
  } catch (const ConfigError& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const InferenceError& e) {
    spdlog::error("Failed to create inference model: {}", e.what());
    return 1;
  }
  spdlog::info("FrameTap-RT starting (config: {})", cfg_path);

  if (!source.empty()) app.source.uri = source;
  if (camera >= 0) app.source.camera_index = camera;
  if (port > 0) app.server.port = port;

  PipelineController ctl(app.playback, app.sampler);
  if (inferencer) ctl.set_inferencer(inferencer);

  if (!image.empty()) {
    if (!ctl.process_image(image)) return 1;
    if (!ctl.save_screenshot(output)) return 1;
    auto s = ctl.stats();
    spdlog::info("Image done: {} detections, {:.1f} ms", s.detection_count, s.last_inference_ms);
    return 0;
  }

  if (app.source.camera_index >= 0) {
    if (!ctl.open_camera(app.source.camera_index)) return 1;
  } else if (!app.source.uri.empty()) {
    if (!ctl.open_video(app.source.uri)) return 1;
  }

  httplib::Server svr;
  register_routes(svr, ctl, app.delay_ms);

  spdlog::info("HTTP server listening on {}:{}", app.server.host, app.server.port);
  if (!svr.listen(app.server.host.c_str(), app.server.port)) {
    spdlog::error("Failed to bind {}:{}", app.server.host, app.server.port);
    ctl.stop_all();
    return 1;
  }

  ctl.stop_all();
  spdlog::info("Shutdown complete.");
  return 0;
}
