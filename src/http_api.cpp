#include "http_api.hpp"

#include <string>

#include "display.hpp"

using nlohmann::json;

namespace {

// Parses a JSON request body; an empty body is an empty object.
bool parse_body(const httplib::Request& req, httplib::Response& res, json& out) {
  if (req.body.empty()) {
    out = json::object();
    return true;
  }
  out = json::parse(req.body, nullptr, false);
  if (out.is_discarded() || !out.is_object()) {
    res.status = 400;
    res.set_content("{\"error\":\"invalid json body\"}", "application/json");
    return false;
  }
  return true;
}

void reply(httplib::Response& res, bool ok) {
  json j{{"ok", ok}};
  if (!ok) res.status = 409;
  res.set_content(j.dump(2), "application/json");
}

json stats_json(const StatSnapshot& s) {
  return json{{"frames_observed", s.frames_observed},
              {"total_frames_processed", s.total_frames_processed},
              {"total_detections", s.total_detections},
              {"detection_count", s.detection_count},
              {"avg_inference_ms", s.avg_inference_ms},
              {"last_inference_ms", s.last_inference_ms},
              {"inf_p50", s.inf_p50},
              {"inf_p95", s.inf_p95},
              {"inf_p99", s.inf_p99},
              {"fps", s.fps},
              {"avg_confidence", s.avg_confidence},
              {"class_name", s.class_name},
              {"class_confidence", s.class_confidence}};
}

void send_jpeg(httplib::Response& res, const cv::Mat& rgb) {
  if (rgb.empty()) {
    res.status = 404;
    res.set_content("{\"error\":\"no frame\"}", "application/json");
    return;
  }
  auto bytes = encode_jpeg(rgb);
  if (bytes.empty()) {
    res.status = 500;
    res.set_content("{\"error\":\"encode failed\"}", "application/json");
    return;
  }
  res.set_content(std::string(bytes.begin(), bytes.end()), "image/jpeg");
}

}  // namespace

std::optional<int> sampling_interval_from_body(const json& body, int default_delay_ms) {
  if (body.contains("interval")) {
    if (!body["interval"].is_number_integer()) return std::nullopt;
    return body["interval"].get<int>();
  }
  if (body.contains("delay_ms")) {
    if (!body["delay_ms"].is_number_integer()) return std::nullopt;
    return PipelineController::interval_from_delay(body["delay_ms"].get<int>());
  }
  return PipelineController::interval_from_delay(default_delay_ms);
}

void register_routes(httplib::Server& svr, PipelineController& ctl, int default_delay_ms) {
  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/playback/state", [&](const httplib::Request&, httplib::Response& res) {
    auto p = ctl.progress();
    json j{{"state", to_string(ctl.state())},
           {"current_index", p.current_index},
           {"total_frames", p.total_frames},
           {"current_time_sec", p.current_time_sec},
           {"sampling", ctl.processing()}};
    res.set_content(j.dump(2), "application/json");
  });

  svr.Post("/playback/play", [&](const httplib::Request& req, httplib::Response& res) {
    json body;
    if (!parse_body(req, res, body)) return;
    if (body.contains("camera") && body["camera"].is_number_integer()) {
      reply(res, ctl.open_camera(body["camera"].get<int>()));
    } else if (body.contains("uri") && body["uri"].is_string()) {
      reply(res, ctl.open_video(body["uri"].get<std::string>()));
    } else {
      res.status = 400;
      res.set_content("{\"error\":\"expected 'uri' or 'camera'\"}", "application/json");
    }
  });

  svr.Post("/playback/pause", [&](const httplib::Request&, httplib::Response& res) {
    ctl.pause();
    reply(res, true);
  });

  svr.Post("/playback/resume", [&](const httplib::Request&, httplib::Response& res) {
    ctl.resume();
    reply(res, true);
  });

  svr.Post("/playback/stop", [&](const httplib::Request&, httplib::Response& res) {
    ctl.stop_all();
    reply(res, true);
  });

  svr.Post("/playback/seek", [&](const httplib::Request& req, httplib::Response& res) {
    json body;
    if (!parse_body(req, res, body)) return;
    if (body.contains("frame") && body["frame"].is_number_integer()) {
      reply(res, ctl.seek(body["frame"].get<int64_t>()));
    } else if (body.contains("permille") && body["permille"].is_number_integer()) {
      reply(res, ctl.seek_permille(body["permille"].get<int>()));
    } else {
      res.status = 400;
      res.set_content("{\"error\":\"expected 'frame' or 'permille'\"}", "application/json");
    }
  });

  svr.Post("/sampling/start", [&, default_delay_ms](const httplib::Request& req,
                                                    httplib::Response& res) {
    json body;
    if (!parse_body(req, res, body)) return;
    std::optional<int> interval = sampling_interval_from_body(body, default_delay_ms);
    if (!interval) {
      res.status = 400;
      res.set_content("{\"error\":\"'interval' and 'delay_ms' must be integers\"}",
                      "application/json");
      return;
    }
    reply(res, ctl.start_processing(*interval));
  });

  svr.Post("/sampling/stop", [&](const httplib::Request&, httplib::Response& res) {
    ctl.stop_processing();
    reply(res, true);
  });

  svr.Get("/sampling/stats", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(stats_json(ctl.stats()).dump(2), "application/json");
  });

  svr.Get("/frame/display.jpg", [&](const httplib::Request&, httplib::Response& res) {
    send_jpeg(res, ctl.latest_display_frame());
  });

  svr.Get("/frame/processed.jpg", [&](const httplib::Request&, httplib::Response& res) {
    send_jpeg(res, ctl.latest_processed_frame());
  });

  svr.Post("/screenshot", [&](const httplib::Request& req, httplib::Response& res) {
    json body;
    if (!parse_body(req, res, body)) return;
    if (body.contains("path") && !body["path"].is_string()) {
      res.status = 400;
      res.set_content("{\"error\":\"'path' must be a string\"}", "application/json");
      return;
    }
    reply(res, ctl.save_screenshot(body.value("path", std::string("screenshot.png"))));
  });

  svr.Get("/events", [&](const httplib::Request&, httplib::Response& res) {
    json arr = json::array();
    for (const auto& e : ctl.recent_messages()) {
      arr.push_back({{"kind", e.kind == LogEntry::Kind::Error ? "error" : "status"},
                     {"message", e.message}});
    }
    res.set_content(arr.dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(ctl.prometheus_text(), "text/plain; version=0.0.4");
  });
}

