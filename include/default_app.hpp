#pragma once

#include "app.hpp"

// Minimal application served by the apphost binary:
//   GET|HEAD /        plain-text banner
//   GET|HEAD /health  {"status":"ok"}
//   POST /echo        echoes the body and its Content-Type
Application make_default_app();
