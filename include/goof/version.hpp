#pragma once

#define GOOF_VERSION_MAJOR 0
#define GOOF_VERSION_MINOR 1
#define GOOF_VERSION_PATCH 0
#define GOOF_VERSION_STRING "0.1.0"
