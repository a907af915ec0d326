// src/http_routes.h
#pragma once

#include "httplib.h"

#include "docpdf/config.h"
#include "docpdf/pipeline.h"

// Header carrying the shared secret.
constexpr const char* API_KEY_HEADER = "X-Api-Key";

// 0 to let the request through, otherwise 413 (declared body over the
// ceiling) or 401 (API key configured and not presented verbatim).
int admission_status(const httplib::Request& req, const docpdf::Config& cfg);

// Body ceiling + API key run in the pre-routing stage, i.e. before any
// handler (and so before any workspace) exists. /health skips the key check.
void install_routes(httplib::Server& app,
                    const docpdf::Config& cfg,
                    const docpdf::ConversionPipeline& pipeline);
