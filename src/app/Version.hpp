#pragma once

#define BTK_VERSION_MAJOR 0
#define BTK_VERSION_MINOR 3
#define BTK_VERSION_PATCH 0
#define BTK_VERSION_STRING "0.3.0"
