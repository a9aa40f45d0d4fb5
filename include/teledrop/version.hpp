#pragma once

#ifndef TELEDROP_VERSION
#define TELEDROP_VERSION "0.1.0"
#endif
