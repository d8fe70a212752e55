#pragma once

#define CLAIRE_VERSION_MAJOR 0
#define CLAIRE_VERSION_MINOR 3
#define CLAIRE_VERSION_PATCH 0
#define CLAIRE_VERSION_STRING "0.3.0"
