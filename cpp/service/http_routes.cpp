// src/http_routes.cpp
#include "http_routes.h"
#include "index_html.h"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "docpdf/errors.h"
#include "docpdf/filename.h"
#include "docpdf/log.h"

using json = nlohmann::json;

static void reply_json(httplib::Response& res, int status, const json& j) {
  res.status = status;
  res.set_content(j.dump(), "application/json; charset=utf-8");
}

static void reply_error(httplib::Response& res, int status, const std::string& msg) {
  reply_json(res, status, {{"error", msg}});
}

// Declared length above the ceiling. Unparseable lengths are left to httplib.
static bool declared_length_exceeds(const httplib::Request& req, uint64_t max_bytes) {
  if (!req.has_header("Content-Length")) return false;
  const std::string v = req.get_header_value("Content-Length");
  try {
    size_t pos = 0;
    const unsigned long long n = std::stoull(v, &pos);
    return pos == v.size() && n > max_bytes;
  } catch (const std::exception&) {
    return false;
  }
}

int admission_status(const httplib::Request& req, const docpdf::Config& cfg) {
  if (declared_length_exceeds(req, cfg.max_body_bytes)) return 413;
  if (req.path == "/health" || !cfg.api_key) return 0;
  if (!req.has_header(API_KEY_HEADER) || req.get_header_value(API_KEY_HEADER) != *cfg.api_key) return 401;
  return 0;
}

void install_routes(httplib::Server& app,
                    const docpdf::Config& cfg,
                    const docpdf::ConversionPipeline& pipeline) {
  app.set_pre_routing_handler([&cfg](const httplib::Request& req, httplib::Response& res) {
    const int status = admission_status(req, cfg);
    if (status == 0) return httplib::Server::HandlerResponse::Unhandled;

    if (status == 413) {
      docpdf::log_warn("payload_too_large", {{"path", req.path}, {"length", req.get_header_value("Content-Length")}});
      reply_error(res, 413, "Payload too large");
    } else {
      docpdf::log_warn("unauthorized", {{"path", req.path}, {"remote", req.remote_addr}});
      reply_error(res, 401, "Unauthorized");
    }
    // body is never read, so the connection cannot be reused
    res.set_header("Connection", "close");
    return httplib::Server::HandlerResponse::Handled;
  });

  // GET and HEAD
  app.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    reply_json(res, 200, {{"status", "ok"}});
  });

  app.Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.set_content(INDEX_HTML, "text/html; charset=utf-8");
  });

  // POST /convert  multipart: file=@document.docx
  // streamed straight to the workspace via ContentReader
  app.Post("/convert", [&pipeline, &cfg](const httplib::Request& req, httplib::Response& res,
                                   const httplib::ContentReader& content_reader) {
    try {
      if (!req.is_multipart_form_data()) {
        res.set_header("Connection", "close");
        reply_error(res, 400, "expected multipart/form-data");
        return;
      }

      // bodies without a declared length (chunked) are capped here; older
      // httplib releases do not apply the payload limit to them
      const uint64_t max_bytes = cfg.max_body_bytes;
      docpdf::MultipartReader reader = [&content_reader, max_bytes](const docpdf::PartHeaderHandler& on_header,
                                                                     const docpdf::PartDataHandler& on_data) {
        uint64_t seen = 0;
        return content_reader(
          [&on_header](const httplib::MultipartFormData& part) {
            return on_header(docpdf::PartHeader{part.name, part.filename, part.content_type});
          },
          [&on_data, &seen, max_bytes](const char* data, size_t len) {
            seen += (uint64_t)len;
            if (seen > max_bytes) {
              docpdf::log_warn("body_ceiling_exceeded", {{"max_bytes", std::to_string(max_bytes)}});
              return false;
            }
            return on_data(data, len);
          });
      };

      docpdf::ConversionResult r = pipeline.run(reader);
      if (!r.ok()) {
        reply_error(res, docpdf::http_status(r.error), docpdf::client_message(r.error));
        return;
      }

      res.status = 200;
      res.set_header("Content-Disposition", docpdf::content_disposition_attachment(r.pdf.filename));
      res.set_content(std::move(r.pdf.bytes), "application/pdf");
    } catch (const std::exception& e) {
      docpdf::log_error("convert_handler_failed", {{"err", e.what()}});
      reply_error(res, 500, "Internal Error");
    }
  });

  app.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    docpdf::log_info("request", {
      {"method", req.method},
      {"path", req.path},
      {"status", std::to_string(res.status)},
      {"remote", req.remote_addr},
    });
  });
}
