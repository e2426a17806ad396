#pragma once
#include <string>
#include "http_server.hpp"
#include "pipeline.hpp"

void register_routes(HttpServer& srv, CamPipeline& cam);

// Percent value from a form field, clamped to 0..100; missing or malformed values read as 0.
int form_percent(const std::unordered_map<std::string,std::string>& form, const std::string& name);
