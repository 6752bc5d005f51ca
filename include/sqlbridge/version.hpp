#pragma once

#define SQLBRIDGE_VERSION_MAJOR 0
#define SQLBRIDGE_VERSION_MINOR 1
#define SQLBRIDGE_VERSION_PATCH 0
#define SQLBRIDGE_VERSION "0.1.0"
