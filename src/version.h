#pragma once

#define VERSION_STRING "0.3.0"
